#pragma once

#include "config.hpp"
#include "transfer_types.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam {

enum class DiscoveryKind { Announce, Response };

struct DiscoveryMessage {
    DiscoveryKind kind = DiscoveryKind::Announce;
    std::string name;
    std::string instance_id;
};

// "LANBEAM_ANNOUNCE:{json}" / "LANBEAM_RESPONSE:{json}"
const std::string encode_discovery_message(const DiscoveryMessage &msg);
std::optional<DiscoveryMessage> decode_discovery_message(const std::string &datagram);

class DiscoveryService {
public:
    explicit DiscoveryService(const EngineConfig &config);
    ~DiscoveryService();

    // binds the discovery port, false when unavailable (discovery then finds nobody)
    bool start();
    // safe to call from a discover() callback
    void stop();
    bool isListening() const;
    uint16_t getPort() const;
    const std::string &getInstanceId() const;

    // one blocking round: clear table, announce burst, collect for the window,
    // then hand the peers to the caller and discard them from the table
    std::vector<Peer> probe();

    // same round on a background thread, false if a round is already running
    bool discover(std::function<void(const std::vector<Peer>&)> on_complete);
    bool isDiscovering() const;

    std::vector<Peer> getPeers() const;
    std::optional<Peer> getPeer(const std::string &address) const;
    void setPeerCallback(std::function<void(const Peer&)> callback);

    static std::vector<std::string> interface_broadcast_addresses();

private:
    const EngineConfig config;
    const std::string instance_id;
    int sockfd = -1;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};
    std::atomic<bool> discovering{false};
    std::thread worker;
    std::thread prober;

    mutable std::mutex peers_mutex;
    std::map<std::string, Peer> peers;
    std::function<void(const Peer&)> peer_callback;

    void listenLoop();
    void handleDatagram(const std::string &datagram, const std::string &address, const uint16_t &port);
    void recordPeer(const std::string &address, const std::string &name);
    bool sendTo(const std::string &msg, const std::string &address, const uint16_t &port) const;
    std::vector<std::string> probeTargets() const;
};

} // namespace lanbeam
