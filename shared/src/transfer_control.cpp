#include "lanbeam/transfer_control.hpp"

#include <thread>

namespace lanbeam {

void TransferControl::pause() {
    this->paused.store(true);
}

void TransferControl::resume() {
    this->paused.store(false);
}

void TransferControl::cancel() {
    this->cancelled.store(true);
}

void TransferControl::clearCancel() {
    this->cancelled.store(false);
}

bool TransferControl::isPaused() const {
    return this->paused.load();
}

bool TransferControl::isCancelled() const {
    return this->cancelled.load();
}

bool TransferControl::waitWhilePaused(const std::chrono::milliseconds &poll_interval) const {
    while (this->paused.load()) {
        if (this->cancelled.load()) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
    return !this->cancelled.load();
}

} // namespace lanbeam
