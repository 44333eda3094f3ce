#pragma once

#include "lanbeam/config.hpp"
#include "lanbeam/duplicate_store.hpp"
#include "lanbeam/history_log.hpp"
#include "lanbeam/transfer_control.hpp"
#include "lanbeam/transfer_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace lanbeam {

// accepts inbound transfers, one ReceiveSession thread per connection
class ReceiverServer {
public:
    ReceiverServer(const EngineConfig &config,
                   std::shared_ptr<DuplicateStore> duplicates,
                   std::shared_ptr<HistoryLog> history,
                   TransferObserver observer = {},
                   std::shared_ptr<TransferControl> control = std::make_shared<TransferControl>());
    ~ReceiverServer();

    // false if the transfer port can't be bound
    bool start();
    // running sessions finish as Interrupted
    void stop();

    bool isRunning() const;
    bool isStopping() const;
    uint16_t getPort() const;
    size_t activeSessions() const;

    void pause();
    void resume();
    void cancelAll();

    // used by sessions
    const EngineConfig &getConfig() const;
    DuplicateStore &getDuplicates() const;
    const TransferObserver &getObserver() const;
    TransferControl &getControl() const;
    void recordHistory(const HistoryRecord &record);

    // a download name is written by one session at a time
    bool claimTarget(const std::string &target);
    bool claimTarget(const std::string &target, const std::chrono::milliseconds &wait);
    void releaseTarget(const std::string &target);

private:
    const EngineConfig config;
    std::shared_ptr<DuplicateStore> duplicates;
    std::shared_ptr<HistoryLog> history;
    const TransferObserver observer;
    std::shared_ptr<TransferControl> control;

    int listen_fd = -1;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};
    std::thread acceptor;

    mutable std::mutex sessions_mutex;
    std::condition_variable sessions_cv;
    std::unordered_set<int> session_fds;
    std::unordered_set<std::string> claimed_targets;
    size_t next_session = 1;

    void acceptLoop();
    void spawnSession(const int &client_fd, const std::string &peer);
    void finishSession(const int &client_fd);
};

// holds a claimed download name until it goes out of scope
class TargetClaim {
public:
    TargetClaim(ReceiverServer &server, const std::string &target);
    ~TargetClaim();
    TargetClaim(const TargetClaim&) = delete;
    TargetClaim &operator=(const TargetClaim&) = delete;

    bool tryAcquire();
    // waits for another session to let go; false on timeout or when the server stops or cancels
    bool acquire(const std::chrono::milliseconds &wait);

private:
    ReceiverServer &server;
    const std::string target;
    bool held = false;
};

} // namespace lanbeam
