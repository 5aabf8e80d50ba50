#include "asset_catalog.h"
#include "content_hash.h"
#include "logger.h"
#include "upload_errors.h"

namespace chunkflow {

InMemoryAssetCatalog::InMemoryAssetCatalog(std::shared_ptr<Clock> clock)
    : m_clock(clock ? std::move(clock) : SystemClock::shared()) {}

bool InMemoryAssetCatalog::exists(const std::string& workspace_id,
                                  const std::string& container_id,
                                  const std::string& filename) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& a : m_assets) {
        if (a.workspace_id == workspace_id && a.container_id == container_id &&
            a.filename == filename) {
            return true;
        }
    }
    return false;
}

AssetRecord InMemoryAssetCatalog::create(AssetRecord asset) {
    if (asset.id.empty()) asset.id = generate_uuid();
    if (asset.created_at == SystemTime{}) asset.created_at = m_clock->now();

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& a : m_assets) {
        if (a.workspace_id == asset.workspace_id && a.container_id == asset.container_id &&
            a.filename == asset.filename) {
            throw ValidationError("Asset '" + asset.filename + "' already exists in container " +
                                  asset.container_id);
        }
    }
    m_assets.push_back(asset);
    LOG_DEBUG("AssetCatalog: created " + asset.id + " for " + asset.filename);
    return asset;
}

std::optional<AssetRecord> InMemoryAssetCatalog::find_by_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& a : m_assets) {
        if (a.upload_session_id == session_id) return a;
    }
    return std::nullopt;
}

std::vector<AssetRecord> InMemoryAssetCatalog::list(const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (workspace_id.empty()) return m_assets;
    std::vector<AssetRecord> result;
    for (const auto& a : m_assets) {
        if (a.workspace_id == workspace_id) result.push_back(a);
    }
    return result;
}

size_t InMemoryAssetCatalog::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_assets.size();
}

} // namespace chunkflow
