#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanbeam {

constexpr uint16_t DEFAULT_DISCOVERY_PORT = 5000;
constexpr uint16_t DEFAULT_TRANSFER_PORT = 5001;
constexpr size_t DEFAULT_CHUNK_SIZE = 512 * 1024;
constexpr size_t MIN_CHUNK_SIZE = 1024;
constexpr size_t MAX_CHUNK_SIZE = 10 * 1024 * 1024;
constexpr size_t DEFAULT_MAX_CONCURRENT = 4;
constexpr size_t MAX_CONCURRENT_LIMIT = 10;

struct EngineConfig {
    std::string device_name = "LANBeam";
    uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;
    uint16_t transfer_port = DEFAULT_TRANSFER_PORT;
    std::string download_dir = "received";
    std::string duplicates_file = ".lanbeam_duplicates.json";
    std::string history_file = ".lanbeam_history.json";

    size_t max_concurrent_transfers = DEFAULT_MAX_CONCURRENT;
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds progress_interval{150};
    std::chrono::milliseconds speed_window{3000};
    std::chrono::milliseconds pause_poll_interval{100};

    std::chrono::milliseconds connect_timeout{8000};
    std::chrono::milliseconds io_timeout{30000};
    std::chrono::milliseconds overwrite_timeout{30000};

    std::chrono::milliseconds discovery_window{4000};
    size_t discovery_bursts = 3;
    std::chrono::milliseconds discovery_burst_delay{500};
    std::vector<std::string> broadcast_addresses; // empty -> interface broadcasts

    size_t max_inbound_sessions = 16;
    size_t max_metadata_bytes = 10 * 1024 * 1024;
};

// defaults rooted in the user's home directory
EngineConfig default_config();

// missing file -> defaults, missing keys keep the values of base
EngineConfig load_config(const std::string &path, const EngineConfig &base = default_config());
void save_config(const std::string &path, const EngineConfig &config);

// throws std::runtime_error("invalid_config: ...")
void validate_config(const EngineConfig &config);
void validate_chunk_size(const size_t &chunk_size);
void validate_concurrency(const size_t &max_concurrent);

} // namespace lanbeam
