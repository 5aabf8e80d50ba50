#ifndef CHUNKFLOW_ASSET_CATALOG_H
#define CHUNKFLOW_ASSET_CATALOG_H

#include "clock.h"
#include "upload_types.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Destination of finalized uploads. The real catalog (database, media library)
// lives outside the pipeline.
class AssetCatalog {
public:
    virtual ~AssetCatalog() = default;

    virtual bool exists(const std::string& workspace_id,
                        const std::string& container_id,
                        const std::string& filename) const = 0;

    // Assigns id and created_at when empty.
    // @throws ValidationError on a (workspace, container, filename) collision
    virtual AssetRecord create(AssetRecord asset) = 0;
};

class InMemoryAssetCatalog : public AssetCatalog {
public:
    explicit InMemoryAssetCatalog(std::shared_ptr<Clock> clock = SystemClock::shared());

    bool exists(const std::string& workspace_id,
                const std::string& container_id,
                const std::string& filename) const override;
    AssetRecord create(AssetRecord asset) override;

    std::optional<AssetRecord> find_by_session(const std::string& session_id) const;
    std::vector<AssetRecord> list(const std::string& workspace_id = "") const;
    size_t size() const;

private:
    std::shared_ptr<Clock> m_clock;
    mutable std::mutex m_mutex;
    std::vector<AssetRecord> m_assets;
};

} // namespace chunkflow

#endif // CHUNKFLOW_ASSET_CATALOG_H
