#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/socket.h>

namespace lanbeam {

struct HostPort {
    std::string host;
    uint16_t port{};
};

// command parsing
bool is_cmd(const std::string &msg, const std::string &cmd);
const std::vector<std::string> split_cmd(const std::string &cmd);

// "host:port" -> false if malformed, "host" alone keeps out.port untouched
bool parse_host_port(const std::string &input, HostPort &out);

// error code prefix of "code: detail" messages
const std::string error_code(const std::exception &e);

// socket primitives, throw std::runtime_error("<code>: ...")
void recv_exact(const int &fd, char *buffer, const size_t &length);
void send_all(const int &fd, const char *data, const size_t &length);
void set_socket_timeout(const int &fd, const std::chrono::milliseconds &timeout);
int connect_with_timeout(const HostPort &target, const std::chrono::milliseconds &timeout);
int create_listen_socket(const uint16_t &port, const int &backlog = 10);
uint16_t local_port(const int &fd);

// files
const std::string base_name(const std::string &path);
const std::string sanitize_file_name(const std::string &relative_name);

// time formatting
const std::string format_local_time(const std::chrono::system_clock::time_point &tp, const char *fmt);
const std::string now_iso8601();
const std::string now_history_time();

} // namespace lanbeam
