#pragma once

#include "sender_session.hpp"

#include "lanbeam/config.hpp"
#include "lanbeam/duplicate_store.hpp"
#include "lanbeam/history_log.hpp"
#include "lanbeam/transfer_control.hpp"
#include "lanbeam/transfer_types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lanbeam {

struct JobSnapshot {
    std::string id;
    std::string peer;
    JobState state = JobState::Queued;
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;
    size_t file_count = 0;
};

struct DuplicateAdvisory {
    std::string file_name;
    std::vector<DuplicateRecord> records;
};

// FIFO outbound queue running at most N SenderSessions at once
class TransferScheduler {
public:
    TransferScheduler(const EngineConfig &config,
                      std::shared_ptr<DuplicateStore> duplicates,
                      std::shared_ptr<HistoryLog> history,
                      TransferObserver observer = {},
                      std::shared_ptr<TransferControl> control = std::make_shared<TransferControl>());
    // cancels everything and waits for running jobs
    ~TransferScheduler();

    const std::string submit(const std::string &peer_address, const std::vector<std::string> &paths);

    // throw invalid_config, nothing changes then
    void setConcurrency(const size_t &max_concurrent);
    void setChunkSize(const size_t &chunk_size);
    size_t getConcurrency() const;
    size_t getChunkSize() const;

    void pause();
    void resume();
    void cancelAll();
    bool isPaused() const;

    std::optional<JobState> getState(const std::string &job_id) const;
    std::vector<JobSnapshot> getJobs() const;
    size_t activeCount() const;
    size_t queuedCount() const;

    // false on timeout
    bool waitIdle(const std::chrono::milliseconds &timeout);

    // files among paths already sent to peer, with their prior records
    std::vector<DuplicateAdvisory> checkDuplicates(const std::string &peer_address, const std::vector<std::string> &paths) const;

private:
    EngineConfig config;
    std::shared_ptr<DuplicateStore> duplicates;
    std::shared_ptr<HistoryLog> history;
    const TransferObserver observer;
    std::shared_ptr<TransferControl> control;

    mutable std::mutex mutex;
    std::condition_variable idle_cv;
    std::deque<std::shared_ptr<SenderSession>> queue;
    std::vector<std::shared_ptr<SenderSession>> jobs;
    size_t active = 0;
    size_t next_id = 1;

    // caller holds the lock
    void dispatch();
    void runJob(std::shared_ptr<SenderSession> session);
    void finish(const HistoryRecord &record);
};

} // namespace lanbeam
