#include "socket_util.hpp"
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#  include <cerrno>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        return MRILABS_INVALID_SOCKET;
    }

    socket_t result = MRILABS_INVALID_SOCKET;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == MRILABS_INVALID_SOCKET) continue;
        set_nonblocking(sock);

        int rc = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
#ifdef _WIN32
        bool pending = (rc != 0 && WSAGetLastError() == WSAEWOULDBLOCK);
#else
        bool pending = (rc != 0 && errno == EINPROGRESS);
#endif
        if (rc == 0) {
            result = sock;
            break;
        }
        if (pending && (poll_socket(sock, POLLOUT, timeout_ms) & POLLOUT)) {
            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len);
            if (err == 0) {
                result = sock;
                break;
            }
        }
        close_socket(sock);
    }
    freeaddrinfo(res);
    return result;
}

bool send_all(socket_t sock, const std::string& data, int timeout_ms) {
    size_t sent = 0;
    while (sent < data.size()) {
        if (!(poll_socket(sock, POLLOUT, timeout_ms) & POLLOUT)) return false;
        auto n = send(sock, data.data() + sent, static_cast<int>(data.size() - sent), 0);
        if (n < 0) {
#ifndef _WIN32
            if (errno == EAGAIN || errno == EINTR) continue;
#endif
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
