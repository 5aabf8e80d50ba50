#ifndef CHUNKFLOW_ASSEMBLER_H
#define CHUNKFLOW_ASSEMBLER_H

#include "asset_catalog.h"
#include "chunk_store.h"
#include "session_repository.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace chunkflow {

struct AssemblyResult {
    std::string session_id;
    std::string assembled_file_path;
    std::string content_type;
    int64_t bytes_written = 0;
    int chunks_assembled = 0;
    int chunks_cleaned = 0;
    double duration_seconds = 0.0;
};

struct AssemblyStatus {
    bool ready = false;
    std::vector<int> missing_chunks;
    int completed_chunks = 0;
    int total_chunks = 0;
    UploadStatus session_status = UploadStatus::PENDING;

    nlohmann::json to_json() const;
};

/**
 * Concatenates the completed chunks of a session, in chunk_number order, into
 * <assembly_dir>/assembled_<session>_<rand><ext>.
 *
 * Every precondition is checked before any byte is written. Any failure moves
 * the session to failed (reason in metadata.failure_reason) and raises
 * AssemblyError; no partial output is left behind. A session that is no
 * longer assembling (paused, cancelled) raises InvalidTransition untouched.
 */
class Assembler {
public:
    struct Options {
        std::string assembly_dir = "storage/assembly";
        int64_t size_tolerance_bytes = 100;
        bool cleanup_chunks = true;

        static Options fromConfig();
    };

    Assembler(SessionRepository& repo, ChunkStore& store, const AssetCatalog& catalog, Options options);

    // On success the session is in virus_scanning with assembled_file_path set.
    // @throws AssemblyError, InvalidTransition
    AssemblyResult assemble(const std::string& session_id);

    AssemblyStatus assembly_status(const std::string& session_id) const;

    // MIME type from the filename extension (application/octet-stream fallback)
    static std::string determine_content_type(const std::string& filename);

private:
    [[noreturn]] void fail(const std::string& session_id, const std::string& reason);
    std::string output_path_for(const UploadSession& session) const;
    int release_chunks(const std::string& session_id, const std::vector<ChunkRecord>& chunks);

    SessionRepository& m_repo;
    ChunkStore& m_store;
    const AssetCatalog& m_catalog;
    Options m_options;
};

} // namespace chunkflow

#endif // CHUNKFLOW_ASSEMBLER_H
