#pragma once
// Wall-clock timing for upload phases and per-key write latency
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace kvload {

class Timer {
public:
    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    void stop() noexcept { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return std::chrono::duration<double>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

// RAII scoped timer -- adds the elapsed microseconds to a counter on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(int64_t& out_us) noexcept
        : out_us_(out_us), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() noexcept {
        auto end = std::chrono::steady_clock::now();
        out_us_ += std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    int64_t& out_us_;
    std::chrono::steady_clock::time_point start_;
};

// Unix epoch seconds as a decimal string (essentials "last_updated")
inline std::string unix_seconds_str() {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(secs);
}

// ISO-8601 UTC timestamp for reports
inline std::string utc_timestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
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

} // namespace kvload
