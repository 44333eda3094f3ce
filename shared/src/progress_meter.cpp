#include "lanbeam/progress_meter.hpp"

#include <algorithm>

namespace lanbeam {

ProgressMeter::ProgressMeter(const uint64_t &total_bytes, const std::chrono::milliseconds &window, const std::chrono::milliseconds &interval)
    : total_bytes(total_bytes), window(window), interval(interval), started(Clock::now()), last_report(Clock::now()) {}

void ProgressMeter::add(const size_t &bytes, const Clock::time_point &now) {
    this->bytes_done += bytes;
    this->samples.emplace_back(now, bytes);

    // drop samples that left the window
    while (!this->samples.empty() && now - this->samples.front().first > this->window) {
        this->samples.pop_front();
    }
}

bool ProgressMeter::due(const Clock::time_point &now) {
    if (now - this->last_report < this->interval) {
        return false;
    }
    this->last_report = now;
    return true;
}

double ProgressMeter::speed(const Clock::time_point &now) const {
    uint64_t bytes = 0;
    Clock::time_point oldest = now;
    for (const auto &sample : this->samples) {
        if (now - sample.first > this->window) {
            continue;
        }
        bytes += sample.second;
        oldest = std::min(oldest, sample.first);
    }
    if (bytes == 0) {
        return 0.0;
    }
    double span = std::chrono::duration<double>(now - oldest).count();
    return static_cast<double>(bytes) / std::max(span, 0.1);
}

std::optional<double> ProgressMeter::eta(const Clock::time_point &now) const {
    double current = this->speed(now);
    if (current <= 1e-6) {
        return std::nullopt;
    }
    uint64_t remaining = this->total_bytes > this->bytes_done ? this->total_bytes - this->bytes_done : 0;
    return static_cast<double>(remaining) / current;
}

uint64_t ProgressMeter::bytesDone() const {
    return this->bytes_done;
}

uint64_t ProgressMeter::totalBytes() const {
    return this->total_bytes;
}

double ProgressMeter::elapsedSeconds(const Clock::time_point &now) const {
    return std::chrono::duration<double>(now - this->started).count();
}

} // namespace lanbeam
