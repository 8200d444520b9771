#pragma once
// Stopwatch for connect-attempt and statement latency logging
#include <chrono>
#include <cstdint>

namespace phxgw {

class Timer {
public:
    Timer() noexcept : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace phxgw
