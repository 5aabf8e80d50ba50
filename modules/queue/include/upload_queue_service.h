#ifndef CHUNKFLOW_UPLOAD_QUEUE_SERVICE_H
#define CHUNKFLOW_UPLOAD_QUEUE_SERVICE_H

#include "rate_limiter.h"
#include "session_repository.h"
#include "upload_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace chunkflow {

constexpr size_t MAX_FOLDER_STRUCTURE_ENTRIES = 50;

// One entry of a dropped folder or file selection
struct DraggableFile {
    std::string name;
    std::string path;          // Path relative to the drop root, or absolute
    int64_t size = 0;
    std::string type;          // "folder" for directory placeholders, else a file type or empty
};

struct Draggable {
    std::string name;
    std::string type;          // folder / file / mixed
    std::string original_path;
    std::string container_id;
    std::vector<DraggableFile> files;
    nlohmann::json metadata = nlohmann::json::object();
};

// Answer of an external preflight (quota, permissions) for a whole drop
struct PreflightVerdict {
    bool allowed = true;
    std::vector<std::string> warnings;
};

struct WorkspaceQueueStats {
    int total_queues = 0;
    int active_queues = 0;
    int completed_queues = 0;
    int failed_queues = 0;
    int cancelled_queues = 0;
    int64_t total_files_in_queues = 0;
    int64_t completed_files_in_queues = 0;
    int64_t failed_files_in_queues = 0;

    nlohmann::json to_json() const;
};

/**
 * Batch-level entry point: turns a dropped folder or file selection into a
 * QueueItem with one pending UploadSession per file, and exposes the batch
 * lifecycle (start, cancel, retry, status) to callers.
 */
class UploadQueueService {
public:
    explicit UploadQueueService(SessionRepository& repo, RateLimiter* rate_limiter = nullptr);

    /**
     * Create a pending batch and its sessions.
     * Every session is admitted by the rate limiter before anything is stored;
     * a rejection releases the slots taken so far and creates nothing.
     * @throws ValidationError, RateLimitExceeded
     */
    QueueItem create_queue_batch(const std::string& workspace_id,
                                 const std::string& user_id,
                                 const std::string& ip_address,
                                 const Draggable& draggable);
    // Refuses the drop when the verdict disallows it; warnings are kept in batch metadata.
    QueueItem create_queue_batch(const std::string& workspace_id,
                                 const std::string& user_id,
                                 const std::string& ip_address,
                                 const Draggable& draggable,
                                 const PreflightVerdict& verdict);

    // @throws ValidationError if the batch is unknown or not pending
    QueueItem start_queue_processing(const std::string& batch_id);
    QueueItem cancel_queue(const std::string& batch_id);
    // Failed sessions under the retry limit go back to pending; so does the batch
    QueueItem retry_failed_queue(const std::string& batch_id);

    nlohmann::json get_queue_status(const std::string& batch_id) const;
    std::vector<QueueItem> list_active_queues(const std::string& workspace_id) const;
    WorkspaceQueueStats workspace_stats(const std::string& workspace_id) const;

    static std::string determine_file_type(const std::string& filename);
    static int calculate_chunks_count(int64_t file_size);
    // Unique parent directories, sorted, at most MAX_FOLDER_STRUCTURE_ENTRIES
    static std::vector<std::string> extract_folder_structure(const std::vector<DraggableFile>& files);

private:
    QueueItem require_batch(const std::string& batch_id) const;
    static void validate_draggable(const Draggable& draggable);

    SessionRepository& m_repo;
    RateLimiter* m_rate_limiter;
};

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_QUEUE_SERVICE_H
