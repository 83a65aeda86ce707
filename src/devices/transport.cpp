#include "transport.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

static std::string strip_eol(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ── TcpTransport ───────────────────────────────────────────

TcpTransport::TcpTransport(const std::string& resource, const std::string& host, int port,
                           int connect_timeout_ms, int io_timeout_ms)
    : resource_(resource), io_timeout_ms_(io_timeout_ms) {
    sock_ = platform::connect_tcp(host, port, connect_timeout_ms);
    if (sock_ == MRILABS_INVALID_SOCKET) {
        throw TransportError(fmt::format("{}: connection to {}:{} failed", resource_, host, port));
    }
}

TcpTransport::~TcpTransport() {
    if (sock_ != MRILABS_INVALID_SOCKET) {
        platform::close_socket(sock_);
    }
}

void TcpTransport::write(const std::string& command) {
    if (sock_ == MRILABS_INVALID_SOCKET) {
        throw TransportError(fmt::format("{}: link dropped after a read timeout", resource_));
    }
    discard_input();
    if (!platform::send_all(sock_, command + "\n", io_timeout_ms_)) {
        throw TransportError(fmt::format("{}: send failed for '{}'", resource_, command));
    }
}

std::string TcpTransport::read() {
    if (sock_ == MRILABS_INVALID_SOCKET) {
        throw TransportError(fmt::format("{}: link dropped after a read timeout", resource_));
    }
    char buf[SCPI_READ_BUF_SIZE];
    for (;;) {
        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            std::string line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            return strip_eol(line);
        }
        if (!(platform::poll_socket(sock_, POLLIN, io_timeout_ms_) & (POLLIN | POLLHUP))) {
            // A late reply would answer the next query; close instead
            platform::close_socket(sock_);
            sock_ = MRILABS_INVALID_SOCKET;
            pending_.clear();
            throw TransportError(fmt::format("{}: read timed out after {}ms",
                                             resource_, io_timeout_ms_));
        }
        auto n = recv(sock_, buf, sizeof(buf), 0);
        if (n == 0) {
            throw TransportError(fmt::format("{}: connection closed by instrument", resource_));
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw TransportError(fmt::format("{}: recv failed: {}", resource_, std::strerror(errno)));
        }
        pending_.append(buf, static_cast<size_t>(n));
    }
}

void TcpTransport::discard_input() {
    pending_.clear();
    char buf[SCPI_READ_BUF_SIZE];
    while (platform::poll_socket(sock_, POLLIN, 0) & POLLIN) {
        auto n = recv(sock_, buf, sizeof(buf), 0);
        if (n <= 0) break;
    }
}

// ── UsbtmcTransport ────────────────────────────────────────

UsbtmcTransport::UsbtmcTransport(const std::string& resource, const std::string& device_path,
                                 int io_timeout_ms)
    : resource_(resource), device_path_(device_path), io_timeout_ms_(io_timeout_ms) {
    fd_ = open(device_path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        throw TransportError(fmt::format("{}: cannot open {}: {}",
                                         resource_, device_path_, std::strerror(errno)));
    }
}

UsbtmcTransport::~UsbtmcTransport() {
    if (fd_ >= 0) close(fd_);
}

void UsbtmcTransport::write(const std::string& command) {
    std::string line = command + "\n";
    size_t done = 0;
    while (done < line.size()) {
        auto n = ::write(fd_, line.data() + done, line.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(fmt::format("{}: write failed: {}", resource_, std::strerror(errno)));
        }
        done += static_cast<size_t>(n);
    }
}

std::string UsbtmcTransport::read() {
    struct pollfd pfd = {fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, io_timeout_ms_);
    if (ret <= 0) {
        throw TransportError(fmt::format("{}: read timed out after {}ms", resource_, io_timeout_ms_));
    }
    // The usbtmc driver delivers one complete response per read.
    char buf[SCPI_READ_BUF_SIZE];
    std::string out;
    for (;;) {
        auto n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(fmt::format("{}: read failed: {}", resource_, std::strerror(errno)));
        }
        out.append(buf, static_cast<size_t>(n));
        if (n < static_cast<ssize_t>(sizeof(buf)) || (!out.empty() && out.back() == '\n')) break;
    }
    return strip_eol(out);
}
