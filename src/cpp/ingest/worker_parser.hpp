#pragma once
// Worker-side unit of work: read one chunk's byte range, parse it.
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "question_parser.hpp"
#include "records.hpp"

namespace mdingest {

// Byte-range access to the source file. Implementations must be callable
// from several workers at once.
class RangeReader {
public:
    virtual ~RangeReader() = default;

    // Exactly range.size() bytes starting at range.start; throws IoError
    virtual std::string read(const std::string& path, const ByteRange& range) const = 0;
};

// Opens its own read-only handle per call
class FileRangeReader : public RangeReader {
public:
    std::string read(const std::string& path, const ByteRange& range) const override;
};

// Result of all attempts on one chunk
struct ChunkOutcome {
    ByteRange range;
    bool ok = false;
    std::vector<RawQuestionRecord> records;
    int attempts = 0;
    std::string error;          // Last failure when !ok
    int64_t read_ns = 0;
    int64_t parse_ns = 0;
};

class WorkerParser {
public:
    static constexpr int MAX_BACKOFF_MS = 5000;

    WorkerParser(const RangeReader& reader, const QuestionParser& parser,
                 int retry_limit, int retry_backoff_ms)
        : reader_(reader), parser_(parser),
          retry_limit_(retry_limit), retry_backoff_ms_(retry_backoff_ms) {}

    // One attempt; throws IoError / ParseError
    std::vector<RawQuestionRecord> parse_chunk(const std::string& path,
                                               const ByteRange& range) const;

    // Up to retry_limit + 1 attempts with exponential backoff between them.
    // on_attempt(n) runs before attempt n (1-based). Never throws.
    ChunkOutcome run(const std::string& path, const ByteRange& range,
                     const std::function<void(int)>& on_attempt = {}) const;

    // Delay before retry number `retry` (1-based): base * 2^(retry-1), capped
    static int backoff_ms(int base_ms, int retry);

private:
    const RangeReader& reader_;
    const QuestionParser& parser_;
    int retry_limit_;
    int retry_backoff_ms_;
};

} // namespace mdingest
