#include "lanbeam/helpers.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

namespace lanbeam {

bool is_cmd(const std::string &msg, const std::string &cmd) {
    return msg.starts_with(cmd) && (msg.size() == cmd.size() || msg[cmd.size()] == ' ');
}

const std::vector<std::string> split_cmd(const std::string &cmd) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < cmd.size()) {
        size_t pos = cmd.find(' ', start);
        if (pos == std::string::npos) {
            parts.push_back(cmd.substr(start));
            break;
        }
        if (pos > start) {
            parts.push_back(cmd.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return parts;
}

bool parse_host_port(const std::string &input, HostPort &out) {
    auto colon = input.rfind(':');
    if (colon == std::string::npos) {
        if (input.empty()) return false;
        out.host = input;
        return true;
    }
    std::string host = input.substr(0, colon);
    std::string port_str = input.substr(colon + 1);
    if (host.empty() || port_str.empty()) return false;
    char *end = nullptr;
    long p = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || p <= 0 || p > 65535) return false;
    out.host = std::move(host);
    out.port = static_cast<uint16_t>(p);
    return true;
}

const std::string error_code(const std::exception &e) {
    std::string msg = e.what();
    size_t pos = msg.find(':');
    if (pos == std::string::npos) {
        return "";
    }
    return msg.substr(0, pos);
}

void recv_exact(const int &fd, char *buffer, const size_t &length) {
    size_t received = 0;
    while (received < length) {
        ssize_t recvd = ::recv(fd, buffer + received, length - received, 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw std::runtime_error("timeout: No data received from remote node in time");
            }
            throw std::runtime_error("recv_failed: " + std::string(std::strerror(errno)));
        }
        if (recvd == 0) {
            throw std::runtime_error("connection_closed: Connection closed by remote node after " +
                                     std::to_string(received) + " of " + std::to_string(length) + " bytes");
        }
        received += static_cast<size_t>(recvd);
    }
}

void send_all(const int &fd, const char *data, const size_t &length) {
    size_t total_sent = 0;
    while (total_sent < length) {
        ssize_t sent = ::send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw std::runtime_error("timeout: Remote node stopped accepting data");
            }
            throw std::runtime_error("send_failed: " + std::string(std::strerror(errno)));
        }
        total_sent += static_cast<size_t>(sent);
    }
}

void set_socket_timeout(const int &fd, const std::chrono::milliseconds &timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

int connect_with_timeout(const HostPort &target, const std::chrono::milliseconds &timeout) {
    // resolve target
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(target.host.c_str(), std::to_string(target.port).c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        throw std::runtime_error("invalid_address: Cannot resolve " + target.host + " (" + ::gai_strerror(rc) + ")");
    }
    sockaddr_in addr{};
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    ::freeaddrinfo(res);

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("connect_failed: socket: " + std::string(std::strerror(errno)));
    }

    // non-blocking connect bounded by timeout
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("connect_failed: " + target.host + ":" + std::to_string(target.port) + ": " + std::strerror(err));
    }
    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);
        if (ready == 0) {
            ::close(fd);
            throw std::runtime_error("timeout: Connecting to " + target.host + ":" + std::to_string(target.port) + " timed out");
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (ready < 0 || so_error != 0) {
            ::close(fd);
            throw std::runtime_error("connect_failed: " + target.host + ":" + std::to_string(target.port) + ": " +
                                     std::strerror(so_error != 0 ? so_error : errno));
        }
    }
    ::fcntl(fd, F_SETFL, flags);
    return fd;
}

int create_listen_socket(const uint16_t &port, const int &backlog) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("listen_failed: socket: " + std::string(std::strerror(errno)));
    }

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("listen_failed: setsockopt: " + std::string(std::strerror(err)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("listen_failed: bind port " + std::to_string(port) + ": " + std::strerror(err));
    }

    if (::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("listen_failed: listen: " + std::string(std::strerror(err)));
    }
    return fd;
}

uint16_t local_port(const int &fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

const std::string base_name(const std::string &path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

const std::string sanitize_file_name(const std::string &relative_name) {
    std::string name = base_name(relative_name);
    if (name.empty() || name == "." || name == "..") {
        return "unnamed_file";
    }
    return name;
}

const std::string format_local_time(const std::chrono::system_clock::time_point &tp, const char *fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

const std::string now_iso8601() {
    return format_local_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
}

const std::string now_history_time() {
    return format_local_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
}

} // namespace lanbeam
