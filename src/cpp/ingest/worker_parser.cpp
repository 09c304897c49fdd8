#include "worker_parser.hpp"
#include "errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <thread>

namespace mdingest {

std::string FileRangeReader::read(const std::string& path, const ByteRange& range) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw IoError("cannot open " + path);

    std::string buf(static_cast<size_t>(range.size()), '\0');
    in.seekg(static_cast<std::streamoff>(range.start));
    if (!in) throw IoError("cannot seek to " + std::to_string(range.start) + " in " + path);

    in.read(&buf[0], static_cast<std::streamsize>(buf.size()));
    if (static_cast<uint64_t>(in.gcount()) != range.size()) {
        throw IoError("short read of chunk " + range.id() + ": got " +
                      std::to_string(in.gcount()) + " bytes");
    }
    return buf;
}

std::vector<RawQuestionRecord> WorkerParser::parse_chunk(const std::string& path,
                                                         const ByteRange& range) const {
    std::string text = reader_.read(path, range);
    return parser_.parse(text);
}

int WorkerParser::backoff_ms(int base_ms, int retry) {
    if (base_ms <= 0 || retry <= 0) return 0;
    int64_t delay = base_ms;
    for (int i = 1; i < retry && delay < MAX_BACKOFF_MS; ++i) delay *= 2;
    return static_cast<int>(delay < MAX_BACKOFF_MS ? delay : MAX_BACKOFF_MS);
}

ChunkOutcome WorkerParser::run(const std::string& path, const ByteRange& range,
                               const std::function<void(int)>& on_attempt) const {
    ChunkOutcome out;
    out.range = range;
    const int max_attempts = retry_limit_ + 1;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            int delay = backoff_ms(retry_backoff_ms_, attempt - 1);
            LOG_WRN("[worker] Chunk %s attempt %d/%d in %d ms (last error: %s)",
                range.id().c_str(), attempt, max_attempts, delay, out.error.c_str());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        if (on_attempt) on_attempt(attempt);
        out.attempts = attempt;

        try {
            std::string text;
            {
                ScopedTimer st(out.read_ns);
                text = reader_.read(path, range);
            }
            {
                ScopedTimer st(out.parse_ns);
                out.records = parser_.parse(text);
            }
            out.ok = true;
            out.error.clear();
            return out;
        } catch (const IngestError& e) {
            out.error = e.what();
        } catch (const std::exception& e) {
            out.error = std::string("unexpected: ") + e.what();
        }
    }

    LOG_ERR("[worker] Chunk %s failed after %d attempts: %s",
        range.id().c_str(), out.attempts, out.error.c_str());
    return out;
}

} // namespace mdingest
