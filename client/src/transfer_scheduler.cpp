#include "transfer_scheduler.hpp"

#include "lanbeam/log.hpp"

#include <thread>

namespace lanbeam {

TransferScheduler::TransferScheduler(const EngineConfig &config,
                                     std::shared_ptr<DuplicateStore> duplicates,
                                     std::shared_ptr<HistoryLog> history,
                                     TransferObserver observer,
                                     std::shared_ptr<TransferControl> control)
    : config(config), duplicates(std::move(duplicates)), history(std::move(history)),
      observer(std::move(observer)), control(std::move(control)) {
    validate_config(this->config);
    if (!this->duplicates) {
        throw std::runtime_error("invalid_config: scheduler needs a duplicate store");
    }
    if (!this->control) {
        this->control = std::make_shared<TransferControl>();
    }
}

TransferScheduler::~TransferScheduler() {
    this->cancelAll();
    std::unique_lock<std::mutex> lock(this->mutex);
    this->idle_cv.wait(lock, [this] { return this->active == 0; });
}

const std::string TransferScheduler::submit(const std::string &peer_address, const std::vector<std::string> &paths) {
    if (paths.empty()) {
        throw std::runtime_error("no_files: SEND needs at least one path");
    }
    if (peer_address.empty()) {
        throw std::runtime_error("invalid_address: No peer given");
    }

    std::string job_id;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        job_id = "job-" + std::to_string(this->next_id++);
        auto session = std::make_shared<SenderSession>(job_id, peer_address, paths, this->config,
                                                       *this->duplicates, *this->control, this->observer);
        this->jobs.push_back(session);
        this->queue.push_back(session);
    }
    log_info("Queued " + job_id + " to " + peer_address);
    if (this->observer.on_state) {
        this->observer.on_state(job_id, JobState::Queued);
    }

    std::lock_guard<std::mutex> lock(this->mutex);
    this->dispatch();
    return job_id;
}

void TransferScheduler::setConcurrency(const size_t &max_concurrent) {
    validate_concurrency(max_concurrent);
    std::lock_guard<std::mutex> lock(this->mutex);
    this->config.max_concurrent_transfers = max_concurrent;
    this->dispatch();
}

// applies to jobs submitted from now on
void TransferScheduler::setChunkSize(const size_t &chunk_size) {
    validate_chunk_size(chunk_size);
    std::lock_guard<std::mutex> lock(this->mutex);
    this->config.chunk_size = chunk_size;
}

size_t TransferScheduler::getConcurrency() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->config.max_concurrent_transfers;
}

size_t TransferScheduler::getChunkSize() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->config.chunk_size;
}

void TransferScheduler::pause() {
    this->control->pause();
    log_info("Transfers paused");
}

void TransferScheduler::resume() {
    this->control->resume();
    log_info("Transfers resumed");
}

void TransferScheduler::cancelAll() {
    std::deque<std::shared_ptr<SenderSession>> drained;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->active == 0 && this->queue.empty()) {
            return;
        }
        this->control->cancel();
        drained.swap(this->queue);
        // drained jobs count as active until their history is written
        this->active += drained.size();
    }
    log_info("Cancelling all transfers (" + std::to_string(drained.size()) + " queued)");

    for (const auto &session : drained) {
        this->finish(session->abandon());
    }

    std::lock_guard<std::mutex> lock(this->mutex);
    this->active -= drained.size();
    if (this->active == 0) {
        this->control->clearCancel();
        this->dispatch();
    }
    this->idle_cv.notify_all();
}

bool TransferScheduler::isPaused() const {
    return this->control->isPaused();
}

std::optional<JobState> TransferScheduler::getState(const std::string &job_id) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    for (const auto &session : this->jobs) {
        if (session->getId() == job_id) {
            return session->getState();
        }
    }
    return std::nullopt;
}

std::vector<JobSnapshot> TransferScheduler::getJobs() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<JobSnapshot> snapshots;
    snapshots.reserve(this->jobs.size());
    for (const auto &session : this->jobs) {
        JobSnapshot snapshot;
        snapshot.id = session->getId();
        snapshot.peer = session->getPeer();
        snapshot.state = session->getState();
        snapshot.bytes_done = session->bytesSent();
        snapshot.total_bytes = session->totalBytes();
        snapshot.file_count = session->fileCount();
        snapshots.push_back(snapshot);
    }
    return snapshots;
}

size_t TransferScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->active;
}

size_t TransferScheduler::queuedCount() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->queue.size();
}

bool TransferScheduler::waitIdle(const std::chrono::milliseconds &timeout) {
    std::unique_lock<std::mutex> lock(this->mutex);
    return this->idle_cv.wait_for(lock, timeout, [this] { return this->active == 0 && this->queue.empty(); });
}

std::vector<DuplicateAdvisory> TransferScheduler::checkDuplicates(const std::string &peer_address, const std::vector<std::string> &paths) const {
    std::vector<DuplicateAdvisory> advisories;
    for (const auto &source : describe_files(paths)) {
        std::vector<DuplicateRecord> records = prior_sends(*this->duplicates, source, peer_address);
        if (!records.empty()) {
            advisories.push_back(DuplicateAdvisory{source.descriptor.relative_name, records});
        }
    }
    return advisories;
}

void TransferScheduler::dispatch() {
    // nothing new starts until a cancel has drained
    if (this->control->isCancelled()) {
        return;
    }
    while (this->active < this->config.max_concurrent_transfers && !this->queue.empty()) {
        std::shared_ptr<SenderSession> session = this->queue.front();
        this->queue.pop_front();
        this->active++;
        std::thread([this, session]() { this->runJob(session); }).detach();
    }
}

void TransferScheduler::runJob(std::shared_ptr<SenderSession> session) {
    HistoryRecord record = session->run();
    log_info("Job " + session->getId() + ": " + to_string(record.status) + ", verified " + record.verifiedText());
    this->finish(record);

    std::lock_guard<std::mutex> lock(this->mutex);
    this->active--;
    if (this->active == 0 && this->control->isCancelled()) {
        this->control->clearCancel();
    }
    this->dispatch();
    this->idle_cv.notify_all();
}

void TransferScheduler::finish(const HistoryRecord &record) {
    if (this->history) {
        this->history->append(record);
    }
    if (this->observer.on_complete) {
        this->observer.on_complete(record);
    }
}

} // namespace lanbeam
