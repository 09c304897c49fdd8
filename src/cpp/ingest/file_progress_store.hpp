#pragma once
// =============================================================================
// JSON-lines progress log.
//
//   {"run_key": "...", "created_at": "..."}          <- header
//   {"chunk_id": "0-1048576", "status": "done", ...}  <- one line per transition
//
// The last line per chunk wins. A torn final line (crash mid-write) is
// ignored. reset() compacts the log through a temp file + rename.
// =============================================================================

#include <fstream>
#include <string>
#include "progress_store.hpp"

namespace mdingest {

class FileProgressStore : public ProgressStore {
public:
    explicit FileProgressStore(std::string path) : path_(std::move(path)) {}

    bool load(const std::string& run_key, std::vector<ChunkProgress>& out) override;
    bool reset(const std::string& run_key, const std::vector<ChunkProgress>& entries) override;
    bool save(const ChunkProgress& entry) override;

    [[nodiscard]] const char* name() const override { return "file"; }
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;     // Append handle, opened by reset()
};

} // namespace mdingest
