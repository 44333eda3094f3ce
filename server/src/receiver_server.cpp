#include "receiver_server.hpp"
#include "receive_session.hpp"

#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanbeam {

ReceiverServer::ReceiverServer(const EngineConfig &config,
                               std::shared_ptr<DuplicateStore> duplicates,
                               std::shared_ptr<HistoryLog> history,
                               TransferObserver observer,
                               std::shared_ptr<TransferControl> control)
    : config(config), duplicates(std::move(duplicates)), history(std::move(history)),
      observer(std::move(observer)), control(std::move(control)) {
    if (!this->duplicates) {
        throw std::runtime_error("invalid_config: receiver needs a duplicate store");
    }
    if (!this->control) {
        this->control = std::make_shared<TransferControl>();
    }
}

ReceiverServer::~ReceiverServer() {
    this->stop();
}

bool ReceiverServer::start() {
    if (this->running) {
        return true;
    }

    // downloads land here
    std::error_code ec;
    std::filesystem::create_directories(this->config.download_dir, ec);
    if (ec) {
        log_error("Cannot create download directory " + this->config.download_dir + ": " + ec.message());
        return false;
    }

    try {
        this->listen_fd = create_listen_socket(this->config.transfer_port);
    } catch (const std::exception &e) {
        log_error(std::string("Receiver failed to start: ") + e.what());
        return false;
    }
    this->bound_port = local_port(this->listen_fd);
    this->stopping = false;
    this->running = true;
    this->acceptor = std::thread(&ReceiverServer::acceptLoop, this);
    log_info("Receiver listening on TCP port " + std::to_string(this->bound_port) + ", saving to " + this->config.download_dir);
    return true;
}

void ReceiverServer::stop() {
    if (!this->running.exchange(false)) {
        return;
    }
    this->stopping = true;
    if (this->acceptor.joinable()) {
        this->acceptor.join();
    }
    if (this->listen_fd >= 0) {
        ::close(this->listen_fd);
        this->listen_fd = -1;
    }

    // unblock sessions stuck in recv, then wait for them to record history
    std::unique_lock<std::mutex> lock(this->sessions_mutex);
    for (int fd : this->session_fds) {
        ::shutdown(fd, SHUT_RDWR);
    }
    this->sessions_cv.notify_all();
    this->sessions_cv.wait(lock, [this] { return this->session_fds.empty(); });
    log_info("Receiver stopped");
}

bool ReceiverServer::isRunning() const {
    return this->running;
}

bool ReceiverServer::isStopping() const {
    return this->stopping;
}

uint16_t ReceiverServer::getPort() const {
    return this->bound_port;
}

size_t ReceiverServer::activeSessions() const {
    std::lock_guard<std::mutex> lock(this->sessions_mutex);
    return this->session_fds.size();
}

void ReceiverServer::pause() {
    this->control->pause();
}

void ReceiverServer::resume() {
    this->control->resume();
}

void ReceiverServer::cancelAll() {
    std::lock_guard<std::mutex> lock(this->sessions_mutex);
    if (this->session_fds.empty()) {
        return;
    }
    this->control->cancel();
    this->sessions_cv.notify_all();
}

const EngineConfig &ReceiverServer::getConfig() const {
    return this->config;
}

DuplicateStore &ReceiverServer::getDuplicates() const {
    return *this->duplicates;
}

const TransferObserver &ReceiverServer::getObserver() const {
    return this->observer;
}

TransferControl &ReceiverServer::getControl() const {
    return *this->control;
}

void ReceiverServer::recordHistory(const HistoryRecord &record) {
    if (this->history) {
        this->history->append(record);
    }
    if (this->observer.on_complete) {
        this->observer.on_complete(record);
    }
}

bool ReceiverServer::claimTarget(const std::string &target) {
    std::lock_guard<std::mutex> lock(this->sessions_mutex);
    return this->claimed_targets.insert(target).second;
}

bool ReceiverServer::claimTarget(const std::string &target, const std::chrono::milliseconds &wait) {
    std::unique_lock<std::mutex> lock(this->sessions_mutex);
    this->sessions_cv.wait_for(lock, wait, [&] {
        return this->stopping || this->control->isCancelled() || this->claimed_targets.count(target) == 0;
    });
    if (this->stopping || this->control->isCancelled()) {
        return false;
    }
    return this->claimed_targets.insert(target).second;
}

void ReceiverServer::releaseTarget(const std::string &target) {
    std::lock_guard<std::mutex> lock(this->sessions_mutex);
    this->claimed_targets.erase(target);
    this->sessions_cv.notify_all();
}

void ReceiverServer::acceptLoop() {
    while (this->running) {
        pollfd pfd{this->listen_fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            log_error(std::string("Receiver poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = ::accept(this->listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                log_warning(std::string("accept failed: ") + std::strerror(errno));
            }
            continue;
        }

        char ipbuf[INET_ADDRSTRLEN];
        const char *ipstr = ::inet_ntop(AF_INET, &client_addr.sin_addr, ipbuf, sizeof(ipbuf));
        std::string peer = ipstr ? ipstr : "unknown";

        {
            std::lock_guard<std::mutex> lock(this->sessions_mutex);
            if (this->session_fds.size() >= this->config.max_inbound_sessions) {
                log_warning("Refusing connection from " + peer + ": " + std::to_string(this->session_fds.size()) + " transfers already active");
                ::close(client_fd);
                continue;
            }
        }
        log_info("Incoming connection from " + peer + ":" + std::to_string(ntohs(client_addr.sin_port)));
        this->spawnSession(client_fd, peer);
    }
}

void ReceiverServer::spawnSession(const int &client_fd, const std::string &peer) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(this->sessions_mutex);
        this->session_fds.insert(client_fd);
        session_id = "in-" + std::to_string(this->next_session++);
    }

    std::thread([this, client_fd, peer, session_id]() {
        ReceiveSession session(client_fd, peer, session_id, *this);
        session.run();
        this->finishSession(client_fd);
    }).detach();
}

void ReceiverServer::finishSession(const int &client_fd) {
    std::lock_guard<std::mutex> lock(this->sessions_mutex);
    ::close(client_fd);
    this->session_fds.erase(client_fd);
    // a cancel only applies to the transfers that were running
    if (this->session_fds.empty() && this->control->isCancelled()) {
        this->control->clearCancel();
    }
    this->sessions_cv.notify_all();
}

TargetClaim::TargetClaim(ReceiverServer &server, const std::string &target)
    : server(server), target(target) {}

TargetClaim::~TargetClaim() {
    if (this->held) {
        this->server.releaseTarget(this->target);
    }
}

bool TargetClaim::tryAcquire() {
    if (!this->held) {
        this->held = this->server.claimTarget(this->target);
    }
    return this->held;
}

bool TargetClaim::acquire(const std::chrono::milliseconds &wait) {
    if (!this->held) {
        this->held = this->server.claimTarget(this->target, wait);
    }
    return this->held;
}

} // namespace lanbeam
