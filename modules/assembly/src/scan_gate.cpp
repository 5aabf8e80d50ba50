#include "scan_gate.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>

namespace chunkflow {

const char* unavailable_policy_to_string(UnavailablePolicy p) {
    switch (p) {
        case UnavailablePolicy::SKIP:        return "skip";
        case UnavailablePolicy::FAIL_CLOSED: return "fail_closed";
    }
    return "skip";
}

std::optional<UnavailablePolicy> unavailable_policy_from_string(const std::string& s) {
    if (s == "skip") return UnavailablePolicy::SKIP;
    if (s == "fail_closed") return UnavailablePolicy::FAIL_CLOSED;
    return std::nullopt;
}

ScanGate::Options ScanGate::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.enabled = cfg.isScannerEnabled();
    const std::string policy = cfg.getScannerUnavailablePolicy();
    auto parsed = unavailable_policy_from_string(policy);
    if (!parsed) {
        LOG_WARN("SCAN: unknown unavailable_policy '" + policy + "', using skip");
    }
    o.unavailable_policy = parsed.value_or(UnavailablePolicy::SKIP);
    o.workers = static_cast<size_t>(std::max(1, cfg.getScanWorkers()));
    return o;
}

ScanGate::ScanGate(SessionRepository& repo, AssetCatalog& catalog,
                   std::shared_ptr<ScannerBackend> scanner, Options options,
                   RateLimiter* rate_limiter)
    : m_repo(repo),
      m_catalog(catalog),
      m_scanner(std::move(scanner)),
      m_options(options),
      m_rate_limiter(rate_limiter),
      m_pool("scan", options.workers, options.queue_capacity) {}

ScanGate::~ScanGate() {
    shutdown();
}

void ScanGate::shutdown() {
    if (m_pool.is_running()) {
        m_pool.shutdown(true);
    }
}

std::future<UploadStatus> ScanGate::submit(const std::string& session_id) {
    auto promise = std::make_shared<std::promise<UploadStatus>>();
    std::future<UploadStatus> result = promise->get_future();

    // Keyed by session so a double submit never scans concurrently
    m_pool.submit(session_id, [this, session_id, promise]() {
        try {
            promise->set_value(process(session_id));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    return result;
}

UploadStatus ScanGate::fail_session(const std::string& session_id, const std::string& reason) {
    LOG_ERROR("SCAN: session " + session_id + " failed: " + reason);
    m_repo.apply_event(session_id, UploadEvent::FAIL, [&reason](UploadSession& s) {
        s.metadata["failure_reason"] = reason;
    });
    return UploadStatus::FAILED;
}

UploadStatus ScanGate::process(const std::string& session_id) {
    auto found = m_repo.find_session(session_id);
    if (!found) {
        throw ValidationError("Upload session not found: " + session_id);
    }
    if (found->status != UploadStatus::VIRUS_SCANNING) {
        throw InvalidTransition(std::string("Session ") + session_id + " is not awaiting a scan (status: " +
                                upload_status_to_string(found->status) + ")");
    }
    const UploadSession session = *found;
    const std::string scanned_at = to_iso8601(m_repo.now());

    if (!m_options.enabled || !m_scanner) {
        LOG_INFO("SCAN: scanning disabled, skipping session " + session_id);
        nlohmann::json record = {{"status", "skipped"}, {"scanned_at", scanned_at}};
        m_repo.apply_event(session_id, UploadEvent::SCAN_SKIPPED, [&record](UploadSession& s) {
            s.metadata["virus_scan"] = record;
        });
        return finalize(session, record);
    }

    ScanVerdict verdict;
    try {
        if (!m_scanner->available()) {
            throw ScannerUnavailableError(m_scanner->name() + " is not available");
        }
        LOG_INFO("SCAN: scanning " + session.assembled_file_path + " with " + m_scanner->name());
        verdict = m_scanner->scan(session.assembled_file_path);
    } catch (const ScanFailedError& e) {
        // A file the scanner choked on is never let through, whatever the policy
        Telemetry::getInstance().inc_counter("upload.scan_failures");
        nlohmann::json record = {
            {"status", "error"},
            {"scanner", m_scanner->name()},
            {"error", e.what()},
            {"scanned_at", scanned_at}
        };
        m_repo.update_session(session_id, [&record](UploadSession& s) { s.metadata["virus_scan"] = record; });
        const UploadStatus status = fail_session(session_id, std::string("Virus scan failed: ") + e.what());
        release_session_slot(m_repo, m_rate_limiter, session_id);
        return status;
    } catch (const ScannerUnavailableError& e) {
        Telemetry::getInstance().inc_counter("upload.scan_unavailable");
        if (m_options.unavailable_policy == UnavailablePolicy::FAIL_CLOSED) {
            const UploadStatus status = fail_session(session_id, std::string("Virus scan unavailable: ") + e.what());
            release_session_slot(m_repo, m_rate_limiter, session_id);
            return status;
        }

        LOG_WARN(std::string("SCAN: scanner unavailable, skipping scan of session ") + session_id + ": " + e.what());
        nlohmann::json record = {
            {"status", "unavailable"},
            {"scanner", m_scanner->name()},
            {"error", e.what()},
            {"scanned_at", scanned_at}
        };
        m_repo.apply_event(session_id, UploadEvent::SCAN_SKIPPED, [&record](UploadSession& s) {
            s.metadata["virus_scan"] = record;
        });
        return finalize(session, record);
    }

    Telemetry::getInstance().observe_hist_ms("upload.scan_ms", static_cast<int64_t>(verdict.duration_seconds * 1000.0));

    nlohmann::json record = {
        {"status", verdict.clean ? "clean" : "infected"},
        {"scanner", verdict.scanner},
        {"scan_duration", verdict.duration_seconds},
        {"file_size", verdict.file_size},
        {"scanned_at", scanned_at}
    };

    if (!verdict.clean) {
        record["virus_name"] = verdict.signature;
        LOG_WARN("SCAN: virus detected in session " + session_id + ": " + verdict.signature);
        Telemetry::getInstance().inc_counter("upload.virus_detected");

        std::error_code ec;
        std::filesystem::remove(session.assembled_file_path, ec);
        if (ec) {
            LOG_ERROR("SCAN: could not delete infected file " + session.assembled_file_path + ": " + ec.message());
        }
        m_repo.apply_event(session_id, UploadEvent::SCAN_INFECTED, [&record, &ec](UploadSession& s) {
            s.metadata["virus_scan"] = record;
            s.metadata["failure_reason"] = "Virus detected: " + record["virus_name"].get<std::string>();
            if (!ec) s.assembled_file_path.clear();
        });
        release_session_slot(m_repo, m_rate_limiter, session_id);
        return UploadStatus::VIRUS_DETECTED;
    }

    LOG_INFO("SCAN: session " + session_id + " clean");
    m_repo.apply_event(session_id, UploadEvent::SCAN_CLEAN, [&record](UploadSession& s) {
        s.metadata["virus_scan"] = record;
    });
    return finalize(session, record);
}

UploadStatus ScanGate::finalize(const UploadSession& session, const nlohmann::json& scan_record) {
    // A finalize interrupted by a pause has already created the asset
    std::string asset_id;
    if (auto latest = m_repo.find_session(session.id)) {
        asset_id = latest->metadata.value("asset_id", "");
    }

    if (asset_id.empty()) {
        AssetRecord asset;
        asset.workspace_id = session.workspace_id;
        asset.container_id = session.container_id;
        asset.user_id = session.user_id;
        asset.filename = session.filename;
        asset.file_path = session.assembled_file_path;
        asset.upload_session_id = session.id;
        asset.content_type = Assembler::determine_content_type(session.filename);

        std::error_code ec;
        const auto size = std::filesystem::file_size(session.assembled_file_path, ec);
        asset.file_size = ec ? session.total_size : static_cast<int64_t>(size);

        try {
            asset_id = m_catalog.create(asset).id;
        } catch (const UploadError& e) {
            const UploadStatus status = fail_session(session.id, std::string("Finalization failed: ") + e.what());
            release_session_slot(m_repo, m_rate_limiter, session.id);
            return status;
        }
        m_repo.update_session(session.id, [&asset_id](UploadSession& s) {
            s.metadata["asset_id"] = asset_id;
        });
    }

    m_repo.apply_event(session.id, UploadEvent::FINALIZED, [&scan_record](UploadSession& s) {
        s.metadata["virus_scan_status"] = scan_record.value("status", "");
        s.metadata.erase("failure_reason");
    });
    release_session_slot(m_repo, m_rate_limiter, session.id);

    Telemetry::getInstance().inc_counter("upload.sessions_completed");
    LOG_INFO("SCAN: session " + session.id + " completed as asset " + asset_id);
    return UploadStatus::COMPLETED;
}

} // namespace chunkflow
