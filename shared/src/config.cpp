#include "lanbeam/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace lanbeam {

namespace {

template <typename T>
void read_value(const nlohmann::json &doc, const char *name, T &out) {
    if (doc.contains(name)) {
        try {
            out = doc.at(name).get<T>();
        } catch (const nlohmann::json::exception &e) {
            throw std::runtime_error(std::string("invalid_config: Bad value for \"") + name + "\": " + e.what());
        }
    }
}

void read_millis(const nlohmann::json &doc, const char *name, std::chrono::milliseconds &out) {
    int64_t ms = out.count();
    read_value(doc, name, ms);
    out = std::chrono::milliseconds(ms);
}

}

EngineConfig default_config() {
    EngineConfig config;
    const char *home = std::getenv("HOME");
    const char *user = std::getenv("USER");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();

    config.device_name = std::string("LANBeam-") + (user ? user : "Unknown");
    config.download_dir = (base / "LANBeam Received").string();
    config.duplicates_file = (base / ".lanbeam_duplicates.json").string();
    config.history_file = (base / ".lanbeam_history.json").string();
    return config;
}

EngineConfig load_config(const std::string &path, const EngineConfig &base) {
    EngineConfig config = base;
    if (path.empty() || !std::filesystem::exists(path)) {
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("invalid_config: Could not open config file " + path);
    }
    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("invalid_config: Config file " + path + " is not a JSON object");
    }

    read_value(doc, "device_name", config.device_name);
    read_value(doc, "discovery_port", config.discovery_port);
    read_value(doc, "transfer_port", config.transfer_port);
    read_value(doc, "download_dir", config.download_dir);
    read_value(doc, "duplicates_file", config.duplicates_file);
    read_value(doc, "history_file", config.history_file);
    read_value(doc, "max_concurrent_transfers", config.max_concurrent_transfers);
    read_value(doc, "chunk_size", config.chunk_size);
    read_millis(doc, "progress_interval_ms", config.progress_interval);
    read_millis(doc, "speed_window_ms", config.speed_window);
    read_millis(doc, "connect_timeout_ms", config.connect_timeout);
    read_millis(doc, "io_timeout_ms", config.io_timeout);
    read_millis(doc, "overwrite_timeout_ms", config.overwrite_timeout);
    read_millis(doc, "discovery_window_ms", config.discovery_window);
    read_value(doc, "discovery_bursts", config.discovery_bursts);
    read_millis(doc, "discovery_burst_delay_ms", config.discovery_burst_delay);
    read_value(doc, "broadcast_addresses", config.broadcast_addresses);
    read_value(doc, "max_inbound_sessions", config.max_inbound_sessions);
    read_value(doc, "max_metadata_bytes", config.max_metadata_bytes);

    validate_config(config);
    return config;
}

void save_config(const std::string &path, const EngineConfig &config) {
    nlohmann::json doc = {
        {"device_name", config.device_name},
        {"discovery_port", config.discovery_port},
        {"transfer_port", config.transfer_port},
        {"download_dir", config.download_dir},
        {"duplicates_file", config.duplicates_file},
        {"history_file", config.history_file},
        {"max_concurrent_transfers", config.max_concurrent_transfers},
        {"chunk_size", config.chunk_size},
        {"progress_interval_ms", config.progress_interval.count()},
        {"speed_window_ms", config.speed_window.count()},
        {"connect_timeout_ms", config.connect_timeout.count()},
        {"io_timeout_ms", config.io_timeout.count()},
        {"overwrite_timeout_ms", config.overwrite_timeout.count()},
        {"discovery_window_ms", config.discovery_window.count()},
        {"discovery_bursts", config.discovery_bursts},
        {"discovery_burst_delay_ms", config.discovery_burst_delay.count()},
        {"broadcast_addresses", config.broadcast_addresses},
        {"max_inbound_sessions", config.max_inbound_sessions},
        {"max_metadata_bytes", config.max_metadata_bytes}
    };

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("invalid_config: Could not open config file for writing (path: " + path + ")");
    }
    file << doc.dump(4);
}

void validate_chunk_size(const size_t &chunk_size) {
    if (chunk_size < MIN_CHUNK_SIZE || chunk_size > MAX_CHUNK_SIZE) {
        throw std::runtime_error("invalid_config: Chunk size must be between 1 KiB and 10 MiB (got " + std::to_string(chunk_size) + ")");
    }
}

void validate_concurrency(const size_t &max_concurrent) {
    if (max_concurrent < 1 || max_concurrent > MAX_CONCURRENT_LIMIT) {
        throw std::runtime_error("invalid_config: Concurrent transfers must be between 1 and " +
                                 std::to_string(MAX_CONCURRENT_LIMIT) + " (got " + std::to_string(max_concurrent) + ")");
    }
}

void validate_config(const EngineConfig &config) {
    validate_chunk_size(config.chunk_size);
    validate_concurrency(config.max_concurrent_transfers);
    if (config.device_name.empty()) {
        throw std::runtime_error("invalid_config: Device name must not be empty");
    }
    if (config.download_dir.empty()) {
        throw std::runtime_error("invalid_config: Download directory must not be empty");
    }
    if (config.max_inbound_sessions == 0) {
        throw std::runtime_error("invalid_config: At least one inbound session must be allowed");
    }
    if (config.max_metadata_bytes == 0) {
        throw std::runtime_error("invalid_config: Metadata limit must be positive");
    }
    if (config.connect_timeout.count() <= 0 || config.io_timeout.count() <= 0) {
        throw std::runtime_error("invalid_config: Timeouts must be positive");
    }
    if (config.progress_interval.count() <= 0 || config.speed_window.count() <= 0) {
        throw std::runtime_error("invalid_config: Progress interval and speed window must be positive");
    }
}

} // namespace lanbeam
