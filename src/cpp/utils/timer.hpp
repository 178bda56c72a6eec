#pragma once
// Statement timer -- steady_clock, used for DEBUG-level query latency lines
#include <chrono>
#include <cstdint>

namespace cachex {

class Timer {
public:
    Timer() noexcept { start(); }

    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const noexcept {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
};

} // namespace cachex
