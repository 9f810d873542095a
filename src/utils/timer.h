#pragma once

/// @file timer.h
/// @brief RAII wall-clock timer that reports through spdlog.

#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace qpscd {

/// Measures wall-clock time from construction (steady_clock).
/// Logs "<label>: <ms> ms" at the chosen level on destruction, unless
/// stop() already reported it.
class CpuTimer {
public:
    explicit CpuTimer(std::string label,
                      spdlog::level::level_enum level = spdlog::level::info)
        : label_(std::move(label)),
          level_(level),
          start_(std::chrono::steady_clock::now()) {}

    ~CpuTimer() {
        if (!stopped_) stop();
    }

    CpuTimer(const CpuTimer&) = delete;
    CpuTimer& operator=(const CpuTimer&) = delete;

    /// Elapsed milliseconds, timer keeps running.
    double elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - start_).count();
    }

    /// Log and return the elapsed time; the destructor then stays silent.
    double stop() {
        double ms = elapsed_ms();
        spdlog::log(level_, "{}: {:.3f} ms", label_, ms);
        stopped_ = true;
        return ms;
    }

private:
    std::string label_;
    spdlog::level::level_enum level_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

}  // namespace qpscd
