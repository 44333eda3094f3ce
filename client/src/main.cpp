#include "lanbeam/config.hpp"
#include "lanbeam/discovery_service.hpp"
#include "lanbeam/duplicate_store.hpp"
#include "lanbeam/hash_stream.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/history_log.hpp"
#include "lanbeam/log.hpp"
#include "transfer_scheduler.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace lanbeam;

namespace {

constexpr size_t STDIN_BUFF_SIZE = 4096;
constexpr size_t HISTORY_SHOWN = 20;

std::mutex print_mutex;
std::map<std::string, int> last_percent;
std::vector<Peer> listed_peers;

void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "HELP - Show this help message\n";
    std::cout << "DISCOVER - Look for receivers on the local network\n";
    std::cout << "PEERS - List peers found by the last DISCOVER\n";
    std::cout << "SEND <peer> <path>... - Send files or folders (peer = number from PEERS, name or host[:port])\n";
    std::cout << "CHECK <peer> <path>... - Show which files were already sent to the peer\n";
    std::cout << "JOBS - Show queued, running and finished transfers\n";
    std::cout << "PAUSE / RESUME - Pause or resume all transfers\n";
    std::cout << "CANCEL - Cancel running and queued transfers\n";
    std::cout << "CONCURRENCY <n> - Set parallel transfers (1-" << MAX_CONCURRENT_LIMIT << ")\n";
    std::cout << "CHUNK <kib> - Set chunk size in KiB\n";
    std::cout << "DUPLICATES <path> - Show earlier transfers of a file\n";
    std::cout << "CLEAR_DUPLICATES - Forget all recorded transfers\n";
    std::cout << "EXPORT_DUPLICATES <file> - Write the duplicate index to a file\n";
    std::cout << "HISTORY - Show recent transfers\n";
    std::cout << "CLEAR_HISTORY - Delete the transfer history\n";
    std::cout << "EXPORT_HISTORY <file> - Write the transfer history to a file\n";
    std::cout << "EXIT - Exit the client\n";
}

const std::string human_bytes(const double &bytes) {
    const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = bytes;
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return out.str();
}

// console observer, progress printed in 10% steps
TransferObserver console_observer() {
    TransferObserver observer;
    observer.on_progress = [](const ProgressInfo &info) {
        int percent = info.total_bytes == 0 ? 100 : static_cast<int>(info.bytes_done * 100 / info.total_bytes);
        std::lock_guard<std::mutex> lock(print_mutex);
        int &last = last_percent[info.job_id];
        if (percent < last + 10 && percent != 100) {
            return;
        }
        last = percent;
        std::cout << "[" << info.job_id << "] " << percent << "% " << human_bytes(static_cast<double>(info.bytes_done))
                  << "/" << human_bytes(static_cast<double>(info.total_bytes)) << " at " << human_bytes(info.speed_bps) << "/s";
        if (info.eta_seconds) {
            std::cout << ", ETA " << static_cast<long>(*info.eta_seconds) << "s";
        }
        std::cout << " (" << info.current_file << ")" << std::endl;
    };
    observer.on_duplicate = [](const std::string &name, const std::vector<DuplicateRecord> &records) {
        std::lock_guard<std::mutex> lock(print_mutex);
        std::cout << "[duplicate] " << name << " was sent to this peer " << records.size() << " time(s) before, last on "
                  << (records.empty() ? "?" : records.back().timestamp) << std::endl;
    };
    observer.on_state = [](const std::string &job_id, const JobState &state) {
        if (is_terminal(state)) {
            std::lock_guard<std::mutex> lock(print_mutex);
            last_percent.erase(job_id);
        }
    };
    observer.on_complete = [](const HistoryRecord &record) {
        std::lock_guard<std::mutex> lock(print_mutex);
        std::cout << "Transfer to " << record.peer << ": " << to_string(record.status) << " (" << record.verifiedText()
                  << " files, " << human_bytes(static_cast<double>(record.total_bytes)) << ", "
                  << std::fixed << std::setprecision(1) << record.duration_seconds << "s)" << std::endl;
    };
    return observer;
}

// "2" -> second entry of PEERS, a display name, or an address as typed
const std::string resolve_peer(const std::string &target) {
    char *end = nullptr;
    long index = std::strtol(target.c_str(), &end, 10);
    if (end != target.c_str() && *end == '\0' && index >= 1 && static_cast<size_t>(index) <= listed_peers.size()) {
        return listed_peers[static_cast<size_t>(index) - 1].address;
    }
    for (const auto &peer : listed_peers) {
        if (peer.display_name == target) {
            return peer.address;
        }
    }
    return target;
}

void print_peers() {
    if (listed_peers.empty()) {
        std::cout << "No peers found." << std::endl;
        return;
    }
    for (size_t i = 0; i < listed_peers.size(); i++) {
        std::cout << (i + 1) << ". " << listed_peers[i].display_name << " (" << listed_peers[i].address << ")\n";
    }
    std::cout << std::flush;
}

void print_jobs(const TransferScheduler &scheduler) {
    std::vector<JobSnapshot> jobs = scheduler.getJobs();
    if (jobs.empty()) {
        std::cout << "No transfers yet." << std::endl;
        return;
    }
    for (const auto &job : jobs) {
        std::cout << job.id << "  " << std::left << std::setw(16) << to_string(job.state) << job.peer << "  "
                  << human_bytes(static_cast<double>(job.bytes_done)) << "/" << human_bytes(static_cast<double>(job.total_bytes))
                  << "  " << job.file_count << " file(s)\n";
    }
    std::cout << std::right << "Running: " << scheduler.activeCount() << ", queued: " << scheduler.queuedCount()
              << (scheduler.isPaused() ? " (paused)" : "") << std::endl;
}

void print_history(const HistoryLog &history) {
    std::vector<HistoryRecord> records = history.getRecords();
    if (records.empty()) {
        std::cout << "No transfer history." << std::endl;
        return;
    }
    size_t first = records.size() > HISTORY_SHOWN ? records.size() - HISTORY_SHOWN : 0;
    for (size_t i = first; i < records.size(); i++) {
        const HistoryRecord &r = records[i];
        std::cout << r.time << "  " << std::left << std::setw(8) << to_string(r.direction) << std::setw(12) << to_string(r.status)
                  << r.peer << "  " << r.file_count << " file(s), " << human_bytes(static_cast<double>(r.total_bytes))
                  << ", verified " << r.verifiedText() << "\n";
    }
    std::cout << std::right << std::flush;
}

void print_duplicates(const DuplicateStore &duplicates, const std::string &path) {
    std::vector<DuplicateRecord> records = duplicates.lookup(path, sha256_file(path));
    if (records.empty()) {
        std::cout << base_name(path) << " has not been transferred before." << std::endl;
        return;
    }
    for (const auto &record : records) {
        std::cout << record.timestamp << "  " << record.peer_address << "  " << record.path << "\n";
    }
    std::cout << std::flush;
}

// returns false on EXIT
bool handle_command(const std::string &cmd, DiscoveryService &discovery, TransferScheduler &scheduler,
                    DuplicateStore &duplicates, HistoryLog &history) {
    std::vector<std::string> parts = split_cmd(cmd);
    if (parts.empty()) {
        return true;
    }

    if (is_cmd(cmd, "HELP")) {
        print_help();
    } else if (is_cmd(cmd, "EXIT")) {
        return false;
    } else if (is_cmd(cmd, "DISCOVER")) {
        std::cout << "Searching for peers..." << std::endl;
        listed_peers = discovery.probe();
        print_peers();
    } else if (is_cmd(cmd, "PEERS")) {
        print_peers();
    } else if (is_cmd(cmd, "SEND")) {
        if (parts.size() < 3) {
            throw std::runtime_error("invalid_command: SEND needs a peer and at least one path");
        }
        std::vector<std::string> paths(parts.begin() + 2, parts.end());
        std::string job_id = scheduler.submit(resolve_peer(parts[1]), paths);
        std::cout << "Queued " << job_id << std::endl;
    } else if (is_cmd(cmd, "CHECK")) {
        if (parts.size() < 3) {
            throw std::runtime_error("invalid_command: CHECK needs a peer and at least one path");
        }
        std::vector<std::string> paths(parts.begin() + 2, parts.end());
        std::vector<DuplicateAdvisory> advisories = scheduler.checkDuplicates(resolve_peer(parts[1]), paths);
        if (advisories.empty()) {
            std::cout << "None of these files were sent to that peer before." << std::endl;
        }
        for (const auto &advisory : advisories) {
            std::cout << advisory.file_name << ": sent " << advisory.records.size() << " time(s), last on "
                      << advisory.records.back().timestamp << "\n";
        }
        std::cout << std::flush;
    } else if (is_cmd(cmd, "JOBS")) {
        print_jobs(scheduler);
    } else if (is_cmd(cmd, "PAUSE")) {
        scheduler.pause();
    } else if (is_cmd(cmd, "RESUME")) {
        scheduler.resume();
    } else if (is_cmd(cmd, "CANCEL")) {
        scheduler.cancelAll();
    } else if (is_cmd(cmd, "CONCURRENCY")) {
        if (parts.size() < 2) {
            std::cout << "Concurrency: " << scheduler.getConcurrency() << std::endl;
        } else {
            scheduler.setConcurrency(std::stoul(parts[1]));
            std::cout << "Concurrency set to " << scheduler.getConcurrency() << std::endl;
        }
    } else if (is_cmd(cmd, "CHUNK")) {
        if (parts.size() < 2) {
            std::cout << "Chunk size: " << scheduler.getChunkSize() / 1024 << " KiB" << std::endl;
        } else {
            scheduler.setChunkSize(std::stoul(parts[1]) * 1024);
            std::cout << "Chunk size set to " << scheduler.getChunkSize() / 1024 << " KiB" << std::endl;
        }
    } else if (is_cmd(cmd, "DUPLICATES")) {
        if (parts.size() < 2) {
            std::cout << duplicates.keyCount() << " file(s), " << duplicates.recordCount() << " record(s) in " << duplicates.getPath() << std::endl;
        } else {
            print_duplicates(duplicates, parts[1]);
        }
    } else if (is_cmd(cmd, "CLEAR_DUPLICATES")) {
        duplicates.clear();
        std::cout << "Duplicate index cleared." << std::endl;
    } else if (is_cmd(cmd, "EXPORT_DUPLICATES")) {
        if (parts.size() < 2) {
            throw std::runtime_error("invalid_command: EXPORT_DUPLICATES needs a file name");
        }
        duplicates.exportTo(parts[1]);
        std::cout << "Exported to " << parts[1] << std::endl;
    } else if (is_cmd(cmd, "HISTORY")) {
        print_history(history);
    } else if (is_cmd(cmd, "CLEAR_HISTORY")) {
        history.clear();
        std::cout << "History cleared." << std::endl;
    } else if (is_cmd(cmd, "EXPORT_HISTORY")) {
        if (parts.size() < 2) {
            throw std::runtime_error("invalid_command: EXPORT_HISTORY needs a file name");
        }
        history.exportTo(parts[1]);
        std::cout << "Exported to " << parts[1] << std::endl;
    } else {
        std::cout << "Unknown command: " << cmd << " (try HELP)" << std::endl;
    }
    return true;
}

void main_loop(DiscoveryService &discovery, TransferScheduler &scheduler, DuplicateStore &duplicates, HistoryLog &history) {
    std::string input_buffer;
    char temp[STDIN_BUFF_SIZE];

    std::cout << "> " << std::flush;
    while (true) {
        ssize_t read_bytes = ::read(STDIN_FILENO, temp, sizeof(temp));
        if (read_bytes < 0) {
            throw std::runtime_error("read_stdin_failed: Failed to read from stdin");
        }
        if (read_bytes == 0) {
            return;
        }
        input_buffer.append(temp, static_cast<size_t>(read_bytes));

        // process complete lines
        size_t pos;
        while ((pos = input_buffer.find('\n')) != std::string::npos) {
            std::string cmd = input_buffer.substr(0, pos);
            input_buffer.erase(0, pos + 1);
            if (!cmd.empty() && cmd.back() == '\r') {
                cmd.pop_back();
            }

            try {
                if (!handle_command(cmd, discovery, scheduler, duplicates, history)) {
                    std::cout << "Exiting...\n";
                    return;
                }
            } catch (const std::exception &e) {
                std::cerr << "ERROR: " << e.what() << std::endl;
            }
            std::cout << "> " << std::flush;
        }
    }
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
    std::string name;
    std::string log_file;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            name = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config <file>] [--name <device>] [--log <file>]" << std::endl;
            return 1;
        }
    }

    if (!log_file.empty()) {
        set_log_file(log_file);
    }

    EngineConfig config;
    try {
        config = load_config(config_file);
        if (!name.empty()) {
            config.device_name = name;
        }
        validate_config(config);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "LANBeam client as " << config.device_name << std::endl;

    try {
        auto duplicates = std::make_shared<DuplicateStore>(config.duplicates_file);
        auto history = std::make_shared<HistoryLog>(config.history_file);
        TransferScheduler scheduler(config, duplicates, history, console_observer());

        DiscoveryService discovery(config);
        if (!discovery.start()) {
            std::cout << "[warning] discovery unavailable, peers must be addressed directly" << std::endl;
        }

        print_help();
        main_loop(discovery, scheduler, *duplicates, *history);

        if (scheduler.activeCount() > 0 || scheduler.queuedCount() > 0) {
            std::cout << "Cancelling unfinished transfers..." << std::endl;
        }
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
