#pragma once

#include <atomic>
#include <chrono>

namespace lanbeam {

// pause/cancel token polled by sessions between chunks
class TransferControl {
public:
    void pause();
    void resume();
    void cancel();
    void clearCancel();

    bool isPaused() const;
    bool isCancelled() const;

    // blocks while paused, false if cancelled meanwhile
    bool waitWhilePaused(const std::chrono::milliseconds &poll_interval) const;

private:
    std::atomic<bool> paused{false};
    std::atomic<bool> cancelled{false};
};

} // namespace lanbeam
