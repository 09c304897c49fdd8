#pragma once
// Wall-clock timing for runs, batches and throughput reporting
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace mdingest {

// ISO-8601 UTC timestamp, second resolution
inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

class Timer {
public:
    void start() noexcept {
        start_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    void stop() noexcept {
        end_ = std::chrono::steady_clock::now();
        running_ = false;
    }

    // While running, measures up to now (used for live progress lines)
    [[nodiscard]] int64_t elapsed_ns() const noexcept {
        auto end = running_ ? std::chrono::steady_clock::now() : end_;
        return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
    }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return elapsed_ns() / 1000000;
    }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return static_cast<double>(elapsed_ns()) / 1e9;
    }

    // Bytes per second over the measured interval, 0 when nothing elapsed
    [[nodiscard]] double rate(double amount) const noexcept {
        double sec = elapsed_sec();
        return sec > 0.0 ? amount / sec : 0.0;
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
    bool running_ = false;
};

// RAII scoped timer -- accumulates elapsed time into a counter on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(int64_t& accum_ns) noexcept
        : accum_ns_(accum_ns), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() noexcept {
        auto end = std::chrono::steady_clock::now();
        accum_ns_ += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    int64_t& accum_ns_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace mdingest
