#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "lanbeam/config.hpp"
#include "lanbeam/discovery_service.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"
#include "receiver_server.hpp"

using namespace lanbeam;

namespace {

std::atomic<bool> shutdown_requested{false};
std::mutex prompt_mutex;

void on_signal(int) {
    shutdown_requested = true;
}

// interactive conflict prompt, uppercase answer applies to the remaining conflicts
OverwriteReply ask_on_console(const std::string &file_name) {
    std::lock_guard<std::mutex> lock(prompt_mutex);
    std::cout << file_name << " already exists. [o]verwrite, [s]kip, [c]ancel transfer (uppercase = apply to all)\n> " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer) || answer.empty()) {
        return OverwriteReply{OverwriteDecision::Skip, false};
    }
    bool all = std::isupper(static_cast<unsigned char>(answer[0])) != 0;
    switch (std::tolower(static_cast<unsigned char>(answer[0]))) {
        case 'o': return OverwriteReply{OverwriteDecision::Overwrite, all};
        case 'c': return OverwriteReply{OverwriteDecision::CancelAll, true};
        default: return OverwriteReply{OverwriteDecision::Skip, all};
    }
}

TransferObserver console_observer(const std::string &conflict) {
    TransferObserver observer;
    if (conflict == "overwrite") {
        observer.on_overwrite = [](const std::string &) { return OverwriteReply{OverwriteDecision::Overwrite, true}; };
    } else if (conflict == "ask") {
        observer.on_overwrite = ask_on_console;
    }
    // "skip" leaves on_overwrite empty, the receiver then skips
    observer.on_integrity = [](const std::string &name, bool ok) {
        if (!ok) {
            std::cout << "[warning] " << name << " failed its integrity check" << std::endl;
        }
    };
    observer.on_complete = [](const HistoryRecord &record) {
        std::cout << "Transfer from " << record.peer << ": " << to_string(record.status) << ", "
                  << record.verifiedText() << " files verified" << std::endl;
    };
    return observer;
}

}

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;

    std::string config_file;
    std::string root;
    std::string name;
    std::string conflict = "ask";
    std::string log_file;
    int port = -1;
    int discovery_port = -1;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return 1;
        }
        if (arg == "--port" || arg == "--discovery-port") {
            HostPort parsed;
            if (!parse_host_port(std::string("localhost:") + argv[++i], parsed)) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            (arg == "--port" ? port : discovery_port) = parsed.port;
        } else if (arg == "--root") {
            root = argv[++i];
        } else if (arg == "--name") {
            name = argv[++i];
        } else if (arg == "--conflict") {
            conflict = argv[++i];
        } else if (arg == "--config") {
            config_file = argv[++i];
        } else if (arg == "--log") {
            log_file = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return 1;
        }
    }

    if (root.empty()) {
        std::cerr << "Error: --root <path> argument is required" << std::endl;
        return 1;
    }
    if (conflict != "ask" && conflict != "skip" && conflict != "overwrite") {
        std::cerr << "Error: --conflict must be one of ask, skip, overwrite" << std::endl;
        return 1;
    }
    if (!log_file.empty()) {
        set_log_file(log_file);
    }

    EngineConfig config;
    try {
        config = load_config(config_file);
        config.download_dir = root;
        if (!name.empty()) config.device_name = name;
        if (port >= 0) config.transfer_port = static_cast<std::uint16_t>(port);
        if (discovery_port >= 0) config.discovery_port = static_cast<std::uint16_t>(discovery_port);
        validate_config(config);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "Starting LANBeam receiver as " << config.device_name
              << " on port " << config.transfer_port << std::endl;

    try {
        auto duplicates = std::make_shared<DuplicateStore>(config.duplicates_file);
        auto history = std::make_shared<HistoryLog>(config.history_file);
        ReceiverServer server(config, duplicates, history, console_observer(conflict));
        if (!server.start()) {
            return 2;
        }

        // answer announcements so senders can find us
        DiscoveryService discovery(config);
        if (!discovery.start()) {
            std::cout << "[warning] discovery unavailable, senders must use this host's address" << std::endl;
        }

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "Shutting down..." << std::endl;
        discovery.stop();
        server.stop();
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "Server exited." << std::endl;
    return 0;
}
