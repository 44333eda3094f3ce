#include "lanbeam/log.hpp"
#include "lanbeam/helpers.hpp"

#include <fstream>
#include <iostream>
#include <mutex>

namespace lanbeam {

namespace {

std::mutex log_mutex;
std::ofstream log_stream;
bool quiet = false;

void write_line(const char *level, const std::string &msg, std::ostream &console) {
    const std::string line = "[" + format_local_time(std::chrono::system_clock::now(), "%H:%M:%S") + "] [" + level + "] " + msg;
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!quiet) {
        console << line << std::endl;
    }
    if (log_stream.is_open()) {
        log_stream << line << "\n" << std::flush;
    }
}

}

void log_info(const std::string &msg) {
    write_line("info", msg, std::cout);
}

void log_warning(const std::string &msg) {
    write_line("warning", msg, std::cerr);
}

void log_error(const std::string &msg) {
    write_line("error", msg, std::cerr);
}

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_stream.is_open()) {
        log_stream.close();
    }
    if (path.empty()) {
        return;
    }
    log_stream.open(path, std::ios::app);
    if (!log_stream) {
        std::cerr << "Failed to open log file " << path << std::endl;
    }
}

void set_log_quiet(const bool &q) {
    std::lock_guard<std::mutex> lock(log_mutex);
    quiet = q;
}

} // namespace lanbeam
