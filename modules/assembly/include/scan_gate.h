#ifndef CHUNKFLOW_SCAN_GATE_H
#define CHUNKFLOW_SCAN_GATE_H

#include "asset_catalog.h"
#include "assembler.h"
#include "rate_limiter.h"
#include "scanner_backend.h"
#include "session_repository.h"
#include "worker_pool.h"

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace chunkflow {

enum class UnavailablePolicy {
    SKIP,         // Log, record "unavailable" and finalize anyway
    FAIL_CLOSED   // Fail the session
};

const char* unavailable_policy_to_string(UnavailablePolicy p);
std::optional<UnavailablePolicy> unavailable_policy_from_string(const std::string& s);

/**
 * Scans assembled files on a dedicated pool and finalizes the session:
 *   clean    -> finalizing -> asset created -> completed
 *   infected -> virus_detected (file deleted, signature recorded)
 *   no verdict -> failed, regardless of unavailable_policy
 */
class ScanGate {
public:
    struct Options {
        bool enabled = true;
        UnavailablePolicy unavailable_policy = UnavailablePolicy::SKIP;
        size_t workers = 1;
        size_t queue_capacity = 64;

        static Options fromConfig();
    };

    ScanGate(SessionRepository& repo, AssetCatalog& catalog,
             std::shared_ptr<ScannerBackend> scanner, Options options,
             RateLimiter* rate_limiter = nullptr);
    ~ScanGate();

    ScanGate(const ScanGate&) = delete;
    ScanGate& operator=(const ScanGate&) = delete;

    // Queue the scan of a session in virus_scanning; the future yields its final status.
    std::future<UploadStatus> submit(const std::string& session_id);

    // Synchronous scan + finalize.
    // @throws InvalidTransition if the session is not in virus_scanning
    UploadStatus process(const std::string& session_id);

    void shutdown();

private:
    UploadStatus finalize(const UploadSession& session, const nlohmann::json& scan_record);
    UploadStatus fail_session(const std::string& session_id, const std::string& reason);

    SessionRepository& m_repo;
    AssetCatalog& m_catalog;
    std::shared_ptr<ScannerBackend> m_scanner;
    Options m_options;
    RateLimiter* m_rate_limiter;
    WorkerPool m_pool;
};

} // namespace chunkflow

#endif // CHUNKFLOW_SCAN_GATE_H
