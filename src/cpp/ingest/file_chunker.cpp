#include "file_chunker.hpp"
#include "errors.hpp"
#include "separators.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace mdingest {
namespace fs = std::filesystem;

std::vector<ByteRange> FileChunker::create_chunks(const std::string& file_path,
                                                  uint64_t target_chunk_size_bytes) {
    if (target_chunk_size_bytes == 0)
        throw std::invalid_argument("target chunk size must be greater than 0");

    warnings_.clear();

    std::error_code ec;
    const uint64_t file_size = fs::file_size(file_path, ec);
    if (ec) throw IoError("cannot size " + file_path + ": " + ec.message());

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) throw IoError("cannot open " + file_path);

    std::vector<ByteRange> chunks;
    if (file_size == 0) {
        LOG_INF("[chunker] %s is empty, nothing to chunk", file_path.c_str());
        return chunks;
    }

    uint64_t prev = 0;
    for (uint64_t cut = target_chunk_size_bytes; cut < file_size;) {
        bool found = false;
        uint64_t boundary = find_boundary(in, file_size, cut, found);
        if (!found) {
            warnings_.push_back({cut, boundary});
            LOG_WRN("[chunker] No separator within %llu bytes of offset %llu, "
                    "cutting at %llu",
                static_cast<unsigned long long>(window_),
                static_cast<unsigned long long>(cut),
                static_cast<unsigned long long>(boundary));
        }

        if (boundary <= prev || boundary >= file_size) {
            LOG_DBG("[chunker] Dropping boundary %llu (previous %llu, size %llu)",
                static_cast<unsigned long long>(boundary),
                static_cast<unsigned long long>(prev),
                static_cast<unsigned long long>(file_size));
        } else {
            chunks.push_back({prev, boundary});
            prev = boundary;
        }

        if (file_size - cut <= target_chunk_size_bytes) break;
        cut += target_chunk_size_bytes;
    }
    chunks.push_back({prev, file_size});

    LOG_INF("[chunker] %s: %llu bytes -> %zu chunks (target %llu, %zu unaligned)",
        file_path.c_str(), static_cast<unsigned long long>(file_size), chunks.size(),
        static_cast<unsigned long long>(target_chunk_size_bytes), warnings_.size());
    return chunks;
}

uint64_t FileChunker::find_boundary(std::ifstream& in, uint64_t file_size,
                                    uint64_t rough_cut, bool& found) {
    found = false;

    // One byte before the cut tells whether the cut itself starts a line
    const uint64_t read_from = rough_cut > 0 ? rough_cut - 1 : 0;
    const uint64_t read_to = std::min(file_size, rough_cut + window_ + LOOKAHEAD);
    std::string buf(static_cast<size_t>(read_to - read_from), '\0');

    in.clear();
    in.seekg(static_cast<std::streamoff>(read_from));
    in.read(&buf[0], static_cast<std::streamsize>(buf.size()));
    if (static_cast<uint64_t>(in.gcount()) != buf.size()) {
        throw IoError("short read at offset " + std::to_string(read_from) +
                      " while searching for a chunk boundary");
    }

    const uint64_t window_end = rough_cut + window_;
    size_t pos = static_cast<size_t>(rough_cut - read_from);
    if (rough_cut > 0 && buf[pos - 1] != '\n') {
        size_t nl = buf.find('\n', pos);
        pos = (nl == std::string::npos) ? buf.size() : nl + 1;
    }

    size_t blank_run = std::string::npos;
    while (pos < buf.size()) {
        const uint64_t line_start = read_from + pos;
        size_t nl = buf.find('\n', pos);
        size_t line_end = (nl == std::string::npos) ? buf.size() : nl + 1;
        // A line running past the read buffer can only be recognized by its prefix
        bool truncated = nl == std::string::npos && read_to < file_size;

        LineKind kind = classify_line(std::string_view(buf).substr(pos, line_end - pos));
        if (truncated && kind != LineKind::NUMBERED) kind = LineKind::TEXT;

        if (kind == LineKind::BLANK) {
            if (blank_run != std::string::npos) {
                found = true;
                return read_from + blank_run;
            }
            if (line_start >= window_end) break;
            blank_run = pos;
        } else {
            blank_run = std::string::npos;
            if (line_start >= window_end) break;
            if (kind == LineKind::NUMBERED || kind == LineKind::RULE) {
                found = true;
                return line_start;
            }
        }
        pos = line_end;
    }

    // Miss: keep the rough cut, but never split a UTF-8 sequence
    uint64_t boundary = rough_cut;
    while (boundary < read_to && boundary - rough_cut < 3) {
        auto byte = static_cast<unsigned char>(buf[static_cast<size_t>(boundary - read_from)]);
        if ((byte & 0xC0) != 0x80) break;
        ++boundary;
    }
    return boundary;
}

} // namespace mdingest
