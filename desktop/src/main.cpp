#include "chunkflow.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <signal.h>

using namespace chunkflow;
namespace fs = std::filesystem;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] PATH...\n\n"
              << "Uploads local files (or whole folders) through the chunked upload pipeline.\n\n"
              << "Options:\n"
              << "  --config FILE      Path to configuration file (default: config.json)\n"
              << "  --log-level LVL    Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --workspace ID     Workspace id (default: local)\n"
              << "  --user ID          User id (default: $USER or cli)\n"
              << "  --ip ADDR          Client address used for rate limiting (default: 127.0.0.1)\n"
              << "  --container ID     Destination container id\n"
              << "  --name NAME        Batch name (default: first path's name)\n"
              << "  --strategy S       fifo|smallest_first|largest_first|interleaved\n"
              << "  --no-scan          Skip the virus scan stage\n"
              << "  --cleanup          Run the cleanup sweep and exit\n"
              << "  --status BATCH     Print the status of a stored batch and exit\n"
              << "  --resume BATCH     Continue a stored batch, retrying its failed files\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

static LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(c));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::ERROR;
}

static bool load_config_with_fallbacks(const std::string& config_path, const char* argv0) {
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");

    std::error_code ec;
    const fs::path exe_dir = fs::absolute(argv0, ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }

    for (const auto& c : candidates) {
        if (fs::exists(c, ec) && ConfigManager::getInstance().loadConfig(c)) {
            return true;
        }
    }
    return false;
}

// Local stand-in for the external quota/permission preflight
static PreflightVerdict preflight(const std::vector<DraggableFile>& files, std::vector<std::string>& skipped) {
    PreflightVerdict verdict;
    int64_t total = 0;
    for (const auto& f : files) {
        if (f.type == "folder") continue;
        if (f.size > MAX_FILE_SIZE) {
            verdict.allowed = false;
            verdict.warnings.push_back(f.name + " exceeds the 5 GiB limit");
        }
        if (!is_filename_safe(f.name)) {
            verdict.allowed = false;
            verdict.warnings.push_back("unsafe filename: " + f.name);
        }
        total += f.size;
    }
    if (!skipped.empty()) {
        verdict.warnings.push_back(std::to_string(skipped.size()) + " empty or unreadable files skipped");
    }
    if (total > 10 * GIB) {
        verdict.warnings.push_back("large drop: " + std::to_string(total / MIB) + " MiB");
    }
    return verdict;
}

static void collect_files(const fs::path& root, std::vector<DraggableFile>& files,
                          std::vector<std::string>& skipped) {
    std::error_code ec;
    auto add_file = [&files, &skipped](const fs::path& p) {
        std::error_code size_ec;
        const auto size = fs::file_size(p, size_ec);
        if (size_ec || size == 0) {
            skipped.push_back(p.string());
            return;
        }
        DraggableFile f;
        f.name = p.filename().string();
        f.path = fs::absolute(p).string();
        f.size = static_cast<int64_t>(size);
        files.push_back(f);
    };

    if (fs::is_directory(root, ec)) {
        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec)) {
                DraggableFile d;
                d.name = it->path().filename().string();
                d.path = fs::absolute(it->path()).string();
                d.type = "folder";
                files.push_back(d);
            } else if (it->is_regular_file(type_ec)) {
                add_file(it->path());
            }
        }
    } else if (fs::is_regular_file(root, ec)) {
        add_file(root);
    } else {
        skipped.push_back(root.string());
    }
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    std::string config_path = "config.json";
    std::string log_level_arg;
    std::string workspace_id = "local";
    const char* env_user = std::getenv("USER");
    std::string user_id = env_user ? env_user : "cli";
    std::string ip_address = "127.0.0.1";
    std::string container_id;
    std::string batch_name;
    std::string strategy_arg;
    std::string status_batch;
    std::string resume_batch;
    bool no_scan = false;
    bool cleanup_only = false;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto need_value = [&](std::string& out) -> bool {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            std::cerr << "Error: " << arg << " requires an argument" << std::endl;
            return false;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (!need_value(config_path)) return 1;
        } else if (arg == "--log-level") {
            if (!need_value(log_level_arg)) return 1;
        } else if (arg == "--workspace") {
            if (!need_value(workspace_id)) return 1;
        } else if (arg == "--user") {
            if (!need_value(user_id)) return 1;
        } else if (arg == "--ip") {
            if (!need_value(ip_address)) return 1;
        } else if (arg == "--container") {
            if (!need_value(container_id)) return 1;
        } else if (arg == "--name") {
            if (!need_value(batch_name)) return 1;
        } else if (arg == "--strategy") {
            if (!need_value(strategy_arg)) return 1;
        } else if (arg == "--status") {
            if (!need_value(status_batch)) return 1;
        } else if (arg == "--resume") {
            if (!need_value(resume_batch)) return 1;
        } else if (arg == "--no-scan") {
            no_scan = true;
        } else if (arg == "--cleanup") {
            cleanup_only = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty() && !cleanup_only && status_batch.empty() && resume_batch.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto& cfg = ConfigManager::getInstance();
    if (!load_config_with_fallbacks(config_path, argv[0])) {
        std::cerr << "Warning: no configuration file found, using built-in defaults" << std::endl;
    }

    set_log_level(log_level_arg.empty() ? log_level_from_string(cfg.getLogLevel())
                                        : parse_log_level(log_level_arg));
    if (!cfg.getLogFilePath().empty()) setLogFile(cfg.getLogFilePath());
    if (cfg.isAsyncLogging()) enable_async_logging();
    setSessionId("cli");

    Telemetry::Config tcfg;
    tcfg.enabled = cfg.isTelemetryEnabled();
    tcfg.flush_interval_ms = cfg.getTelemetryFlushIntervalMs();
    tcfg.file_path = cfg.getTelemetryFilePath();
    Telemetry::getInstance().initialize("chunkflow_cli", tcfg);

    std::optional<PriorityStrategy> strategy;
    if (!strategy_arg.empty()) {
        strategy = priority_strategy_from_string(strategy_arg);
        if (!strategy) {
            std::cerr << "Error: unknown strategy '" << strategy_arg << "'" << std::endl;
            return 1;
        }
    }

    int exit_code = 0;
    try {
        SessionRepository repo;
        if (cfg.isSessionPersistenceEnabled()) {
            SessionRepository::Options ro;
            ro.path = cfg.getSessionDbPath();
            if (!repo.open(ro)) {
                std::cerr << "Warning: session database " << ro.path << " could not be opened" << std::endl;
            }
        }

        FileChunkStore store(cfg.getChunkStorageDir());
        InMemoryCounterStore counters;
        RateLimiter limiter(counters, RateLimits::fromConfig());

        if (!status_batch.empty()) {
            UploadQueueService service(repo, &limiter);
            std::cout << service.get_queue_status(status_batch).dump(2) << std::endl;
            return 0;
        }

        if (cleanup_only) {
            UploadCleanup cleanup(repo, store, UploadCleanup::Options::fromConfig(), &limiter);
            std::cout << cleanup.run().to_json().dump(2) << std::endl;
            return 0;
        }

        DeduplicationIndex::Options dopts;
        dopts.lenient = cfg.isDedupLenient();
        DeduplicationIndex dedup(repo, store, dopts);
        auto bandwidth = BandwidthGovernor::fromConfig();
        WorkerPool transfer_pool("transfer", static_cast<size_t>(std::max(1, cfg.getTransferPoolWorkers())),
                                 static_cast<size_t>(std::max(1, cfg.getTransferQueueCapacity())));
        ParallelTransferEngine engine(repo, store, dedup, &limiter, bandwidth.get(), transfer_pool,
                                      ParallelTransferEngine::Options::fromConfig());

        InMemoryAssetCatalog catalog;
        Assembler assembler(repo, store, catalog, Assembler::Options::fromConfig());
        ScanGate::Options scan_opts = ScanGate::Options::fromConfig();
        if (no_scan) scan_opts.enabled = false;
        ScanGate scan_gate(repo, catalog, std::make_shared<ClamAvScanner>(ClamAvScanner::Options::fromConfig()),
                           scan_opts, &limiter);

        UploadQueueService service(repo, &limiter);
        std::string batch_id = resume_batch;

        if (batch_id.empty()) {
            std::vector<DraggableFile> files;
            std::vector<std::string> skipped;
            for (const auto& p : paths) collect_files(p, files, skipped);
            for (const auto& s : skipped) {
                std::cerr << "Skipping " << s << " (empty, unreadable or missing)" << std::endl;
            }

            Draggable draggable;
            draggable.name = batch_name.empty() ? fs::path(paths.front()).filename().string() : batch_name;
            if (draggable.name.empty()) draggable.name = paths.front();
            draggable.original_path = fs::absolute(paths.front()).string();
            draggable.container_id = container_id;
            draggable.files = files;
            draggable.metadata["upload_source"] = "cli";
            bool any_dir = false;
            bool any_file = false;
            for (const auto& p : paths) {
                std::error_code ec;
                (fs::is_directory(p, ec) ? any_dir : any_file) = true;
            }
            draggable.type = any_dir && any_file ? "mixed" : (any_dir ? "folder" : "file");

            const QueueItem batch = service.create_queue_batch(workspace_id, user_id, ip_address, draggable,
                                                               preflight(files, skipped));
            service.start_queue_processing(batch.batch_id);
            batch_id = batch.batch_id;
            std::cout << "Created batch " << batch_id << " (" << batch.total_files << " files)" << std::endl;
        } else if (!repo.find_batch(batch_id)) {
            std::cerr << "Error: unknown batch " << batch_id << std::endl;
            return 1;
        }

        LocalFileChunkSource source;
        SystemResourceMonitor monitor;
        QueueOrchestrator orchestrator(batch_id, repo, engine, assembler, scan_gate, source,
                                       QueueOrchestrator::Options::fromConfig(), &monitor, &limiter);
        if (!resume_batch.empty()) {
            const RetryResult retried = orchestrator.retry_failed_uploads();
            for (const auto& m : retried.messages) std::cerr << m << std::endl;
            const ResumeResult resumed = orchestrator.resume_queue();
            std::cout << "Resuming batch " << batch_id << ": " << resumed.resumed_sessions << " pending, "
                      << retried.retried_count << " retried" << std::endl;
        }
        orchestrator.progress_tracker().set_listener([](const nlohmann::json& update) {
            LOG_DEBUG("MAIN: progress " + update.dump());
        });

        const QueueProcessResult result = orchestrator.process_with_priority_order(
            strategy.value_or(orchestrator.options().strategy),
            [](const ProgressSnapshot& p, const UploadSession& s) {
                std::cout << "[" << p.completed_files + p.failed_files << "/" << p.total_files << "] "
                          << s.filename << ": " << upload_status_to_string(s.status)
                          << " (" << p.overall_progress_percentage << "%)" << std::endl;
            });

        std::cout << result.to_json().dump(2) << std::endl;
        exit_code = result.success ? 0 : 2;

        scan_gate.shutdown();
        transfer_pool.shutdown(true);
        repo.save();
        Telemetry::getInstance().flush("exit");
    } catch (const RateLimitExceeded& e) {
        std::cerr << "Rate limited: " << e.what() << " (retry after " << e.retry_after() << "s)" << std::endl;
        exit_code = 3;
    } catch (const UploadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    disable_async_logging();
    return exit_code;
}
