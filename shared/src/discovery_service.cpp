#include "lanbeam/discovery_service.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"

#include <nlohmann/json.hpp>
#include <sodium.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanbeam {

namespace {

const std::string ANNOUNCE_PREFIX = "LANBEAM_ANNOUNCE:";
const std::string RESPONSE_PREFIX = "LANBEAM_RESPONSE:";
constexpr size_t MAX_DATAGRAM = 4096;

const std::string random_instance_id() {
    if (sodium_init() < 0) {
        throw std::runtime_error("crypto_init_failed: libsodium initialization failed");
    }
    unsigned char raw[8];
    randombytes_buf(raw, sizeof(raw));
    char hex[sizeof(raw) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    return std::string(hex);
}

}

const std::string encode_discovery_message(const DiscoveryMessage &msg) {
    nlohmann::json body = {{"name", msg.name}, {"id", msg.instance_id}};
    const std::string &prefix = msg.kind == DiscoveryKind::Announce ? ANNOUNCE_PREFIX : RESPONSE_PREFIX;
    return prefix + body.dump();
}

std::optional<DiscoveryMessage> decode_discovery_message(const std::string &datagram) {
    DiscoveryMessage msg;
    std::string body;
    if (datagram.starts_with(ANNOUNCE_PREFIX)) {
        msg.kind = DiscoveryKind::Announce;
        body = datagram.substr(ANNOUNCE_PREFIX.size());
    } else if (datagram.starts_with(RESPONSE_PREFIX)) {
        msg.kind = DiscoveryKind::Response;
        body = datagram.substr(RESPONSE_PREFIX.size());
    } else {
        return std::nullopt;
    }

    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto name = doc.find("name");
    if (name == doc.end() || !name->is_string()) {
        return std::nullopt;
    }
    msg.name = name->get<std::string>();
    auto id = doc.find("id");
    if (id != doc.end() && id->is_string()) {
        msg.instance_id = id->get<std::string>();
    }
    return msg;
}

DiscoveryService::DiscoveryService(const EngineConfig &config)
    : config(config), instance_id(random_instance_id()) {}

DiscoveryService::~DiscoveryService() {
    this->stop();
}

bool DiscoveryService::start() {
    if (this->running) {
        return true;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        log_warning(std::string("Discovery socket unavailable: ") + std::strerror(errno));
        return false;
    }

    int on = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
    if (::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        log_warning(std::string("SO_BROADCAST refused: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(this->config.discovery_port);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_warning("Discovery port " + std::to_string(this->config.discovery_port) + " unavailable: " + std::strerror(errno));
        ::close(fd);
        return false;
    }

    // short receive timeout so the loop notices stop()
    set_socket_timeout(fd, std::chrono::milliseconds(200));

    this->sockfd = fd;
    this->bound_port = local_port(fd);
    this->running = true;
    this->worker = std::thread(&DiscoveryService::listenLoop, this);
    log_info("Discovery listening on UDP port " + std::to_string(this->bound_port));
    return true;
}

void DiscoveryService::stop() {
    bool was_running = this->running.exchange(false);
    if (this->prober.joinable()) {
        // stop() may run inside a discover() callback, on the prober itself
        if (this->prober.get_id() == std::this_thread::get_id()) {
            this->prober.detach();
        } else {
            this->prober.join();
        }
    }
    if (this->worker.joinable()) {
        this->worker.join();
    }
    if (this->sockfd >= 0) {
        ::close(this->sockfd);
        this->sockfd = -1;
    }
    if (was_running) {
        log_info("Discovery stopped");
    }
}

bool DiscoveryService::isListening() const {
    return this->running;
}

uint16_t DiscoveryService::getPort() const {
    return this->bound_port;
}

const std::string &DiscoveryService::getInstanceId() const {
    return this->instance_id;
}

std::vector<Peer> DiscoveryService::probe() {
    {
        std::lock_guard<std::mutex> lock(this->peers_mutex);
        this->peers.clear();
    }
    if (!this->running && !this->start()) {
        return {};
    }

    DiscoveryMessage announce{DiscoveryKind::Announce, this->config.device_name, this->instance_id};
    const std::string datagram = encode_discovery_message(announce);
    const std::vector<std::string> targets = this->probeTargets();
    const uint16_t target_port = this->config.discovery_port != 0 ? this->config.discovery_port : this->bound_port;

    auto deadline = std::chrono::steady_clock::now() + this->config.discovery_window;
    for (size_t burst = 0; burst < this->config.discovery_bursts && this->running; burst++) {
        for (const auto &target : targets) {
            // "address" or "address:port"
            HostPort dest{target, target_port};
            if (!parse_host_port(target, dest)) {
                log_warning("Invalid discovery target " + target);
                continue;
            }
            this->sendTo(datagram, dest.host, dest.port);
        }
        if (burst + 1 < this->config.discovery_bursts) {
            std::this_thread::sleep_for(this->config.discovery_burst_delay);
        }
    }

    // responses are collected by the listener thread
    while (this->running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // the round's result belongs to the caller, the table starts empty again
    std::vector<Peer> found = this->getPeers();
    {
        std::lock_guard<std::mutex> lock(this->peers_mutex);
        this->peers.clear();
    }
    return found;
}

bool DiscoveryService::discover(std::function<void(const std::vector<Peer>&)> on_complete) {
    bool expected = false;
    if (!this->discovering.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (this->prober.joinable()) {
        if (this->prober.get_id() == std::this_thread::get_id()) {
            this->prober.detach();
        } else {
            this->prober.join();
        }
    }
    // nothing touches this after on_complete, which may stop or destroy the service
    this->prober = std::thread([this, on_complete]() {
        std::vector<Peer> found;
        try {
            found = this->probe();
        } catch (const std::exception &e) {
            log_error(std::string("Discovery round failed: ") + e.what());
        }
        this->discovering = false;
        if (on_complete) {
            on_complete(found);
        }
    });
    return true;
}

bool DiscoveryService::isDiscovering() const {
    return this->discovering;
}

std::vector<Peer> DiscoveryService::getPeers() const {
    std::lock_guard<std::mutex> lock(this->peers_mutex);
    std::vector<Peer> result;
    result.reserve(this->peers.size());
    for (const auto &entry : this->peers) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<Peer> DiscoveryService::getPeer(const std::string &address) const {
    std::lock_guard<std::mutex> lock(this->peers_mutex);
    auto it = this->peers.find(address);
    if (it == this->peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DiscoveryService::setPeerCallback(std::function<void(const Peer&)> callback) {
    std::lock_guard<std::mutex> lock(this->peers_mutex);
    this->peer_callback = std::move(callback);
}

std::vector<std::string> DiscoveryService::interface_broadcast_addresses() {
    std::vector<std::string> result;
    ifaddrs *ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) == -1) {
        log_warning(std::string("getifaddrs failed: ") + std::strerror(errno));
        return result;
    }
    for (ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_BROADCAST)) {
            continue;
        }
        if (ifa->ifa_broadaddr == nullptr) {
            continue;
        }
        char buf[INET_ADDRSTRLEN];
        auto *baddr = reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr);
        if (::inet_ntop(AF_INET, &baddr->sin_addr, buf, sizeof(buf)) != nullptr) {
            std::string address(buf);
            if (std::find(result.begin(), result.end(), address) == result.end()) {
                result.push_back(address);
            }
        }
    }
    ::freeifaddrs(ifaddr);
    return result;
}

void DiscoveryService::listenLoop() {
    char buffer[MAX_DATAGRAM];
    while (this->running) {
        sockaddr_in sender{};
        socklen_t sender_len = sizeof(sender);
        ssize_t bytes = ::recvfrom(this->sockfd, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&sender), &sender_len);
        if (bytes < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNREFUSED) {
                continue;
            }
            if (this->running) {
                log_warning(std::string("Discovery receive failed: ") + std::strerror(errno));
            }
            break;
        }

        char ip[INET_ADDRSTRLEN];
        if (::inet_ntop(AF_INET, &sender.sin_addr, ip, sizeof(ip)) == nullptr) {
            continue;
        }
        this->handleDatagram(std::string(buffer, static_cast<size_t>(bytes)), ip, ntohs(sender.sin_port));
    }
}

void DiscoveryService::handleDatagram(const std::string &datagram, const std::string &address, const uint16_t &port) {
    auto msg = decode_discovery_message(datagram);
    if (!msg) {
        return;
    }
    // our own broadcasts loop back
    if (msg->instance_id == this->instance_id) {
        return;
    }

    this->recordPeer(address, msg->name);
    if (msg->kind == DiscoveryKind::Announce) {
        DiscoveryMessage reply{DiscoveryKind::Response, this->config.device_name, this->instance_id};
        this->sendTo(encode_discovery_message(reply), address, port);
    }
}

void DiscoveryService::recordPeer(const std::string &address, const std::string &name) {
    Peer peer{address, name, std::chrono::steady_clock::now()};
    std::function<void(const Peer&)> callback;
    bool is_new = false;
    {
        std::lock_guard<std::mutex> lock(this->peers_mutex);
        is_new = this->peers.find(address) == this->peers.end();
        this->peers[address] = peer;
        callback = this->peer_callback;
    }
    if (is_new) {
        log_info("Found peer " + name + " at " + address);
        if (callback) {
            callback(peer);
        }
    }
}

bool DiscoveryService::sendTo(const std::string &msg, const std::string &address, const uint16_t &port) const {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        log_warning("Invalid discovery target " + address);
        return false;
    }
    ssize_t sent = ::sendto(this->sockfd, msg.data(), msg.size(), 0, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        log_warning("Discovery send to " + address + " failed: " + std::strerror(errno));
        return false;
    }
    return true;
}

std::vector<std::string> DiscoveryService::probeTargets() const {
    if (!this->config.broadcast_addresses.empty()) {
        return this->config.broadcast_addresses;
    }
    std::vector<std::string> targets = interface_broadcast_addresses();
    targets.push_back("255.255.255.255");
    return targets;
}

} // namespace lanbeam
