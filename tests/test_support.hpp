#pragma once

#include "lanbeam/config.hpp"
#include "lanbeam/log.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <string>
#include <thread>

namespace lanbeam::test {

// scratch directory removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string &tag) {
        std::random_device rd;
        this->root = std::filesystem::temp_directory_path() /
                     ("lanbeam_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(this->root);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(this->root, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir &operator=(const TempDir&) = delete;

    std::string path(const std::string &name = "") const {
        return name.empty() ? this->root.string() : (this->root / name).string();
    }

private:
    std::filesystem::path root;
};

inline std::string random_bytes(const size_t &size, const uint32_t &seed) {
    std::mt19937 gen(seed);
    std::string data(size, '\0');
    for (auto &c : data) {
        c = static_cast<char>(gen() & 0xFF);
    }
    return data;
}

inline void write_file(const std::string &path, const std::string &contents) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool wait_until(const std::function<bool()> &condition,
                       const std::chrono::milliseconds &timeout = std::chrono::milliseconds(10000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

// loopback config: ephemeral ports, short timeouts, files under dir
inline EngineConfig local_config(const TempDir &dir, const std::string &device) {
    set_log_quiet(true);
    EngineConfig config;
    config.device_name = device;
    config.discovery_port = 0;
    config.transfer_port = 0;
    config.download_dir = dir.path(device + "_received");
    config.duplicates_file = dir.path(device + "_duplicates.json");
    config.history_file = dir.path(device + "_history.json");
    config.progress_interval = std::chrono::milliseconds(10);
    config.pause_poll_interval = std::chrono::milliseconds(10);
    config.connect_timeout = std::chrono::milliseconds(2000);
    config.io_timeout = std::chrono::milliseconds(5000);
    config.overwrite_timeout = std::chrono::milliseconds(2000);
    config.discovery_window = std::chrono::milliseconds(600);
    config.discovery_burst_delay = std::chrono::milliseconds(50);
    config.broadcast_addresses = {"127.0.0.1"};
    return config;
}

} // namespace lanbeam::test
