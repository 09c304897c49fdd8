#pragma once
// =============================================================================
// FileChunker -- splits a question bank into byte ranges aligned to question
// boundaries.
//
// Phase 1 cuts [0, file_size) into ranges of the target size. Phase 2 moves
// every internal cut forward to the start of the first separator line
// (numbered-list start, horizontal rule, or the first of two or more blank
// lines) beginning within max_boundary_search_bytes of the cut. When the
// window holds no separator the rough cut is kept (moved past UTF-8
// continuation bytes) and a warning is recorded.
// =============================================================================

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "records.hpp"

namespace mdingest {

// A boundary that could not be aligned to a separator
struct ChunkingWarning {
    uint64_t rough_cut = 0;
    uint64_t boundary = 0;
};

inline void to_json(nlohmann::json& j, const ChunkingWarning& w) {
    j = nlohmann::json{{"rough_cut", w.rough_cut}, {"boundary", w.boundary}};
}

class FileChunker {
public:
    static constexpr uint64_t DEFAULT_SEARCH_WINDOW = 10000;

    explicit FileChunker(uint64_t max_boundary_search_bytes = DEFAULT_SEARCH_WINDOW)
        : window_(max_boundary_search_bytes) {}

    // Throws IoError if the file cannot be opened or sized,
    // std::invalid_argument if target_chunk_size_bytes is 0.
    std::vector<ByteRange> create_chunks(const std::string& file_path,
                                         uint64_t target_chunk_size_bytes);

    // Warnings of the last create_chunks() call
    [[nodiscard]] const std::vector<ChunkingWarning>& warnings() const { return warnings_; }

private:
    // Bytes read past the window so a line starting inside it can be classified
    static constexpr uint64_t LOOKAHEAD = 4096;

    uint64_t window_;
    std::vector<ChunkingWarning> warnings_;

    // Returns the aligned boundary for a rough cut; found=false on a miss
    uint64_t find_boundary(std::ifstream& in, uint64_t file_size,
                           uint64_t rough_cut, bool& found);
};

} // namespace mdingest
