#pragma once

#include "transfer_types.hpp"

#include <chrono>
#include <deque>
#include <optional>
#include <utility>

namespace lanbeam {

// rolling-window speed/ETA, rate-limited progress snapshots
class ProgressMeter {
public:
    using Clock = std::chrono::steady_clock;

    ProgressMeter(const uint64_t &total_bytes, const std::chrono::milliseconds &window, const std::chrono::milliseconds &interval);

    void add(const size_t &bytes, const Clock::time_point &now = Clock::now());

    // true at most once per interval
    bool due(const Clock::time_point &now = Clock::now());

    double speed(const Clock::time_point &now = Clock::now()) const;
    std::optional<double> eta(const Clock::time_point &now = Clock::now()) const;
    uint64_t bytesDone() const;
    uint64_t totalBytes() const;
    double elapsedSeconds(const Clock::time_point &now = Clock::now()) const;

private:
    uint64_t total_bytes;
    uint64_t bytes_done = 0;
    std::chrono::milliseconds window;
    std::chrono::milliseconds interval;
    Clock::time_point started;
    Clock::time_point last_report;
    std::deque<std::pair<Clock::time_point, size_t>> samples;
};

} // namespace lanbeam
