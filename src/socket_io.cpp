// ============================================================================
// socket_io.cpp - implementation for socket_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file socket_io.cpp
 */

#include "socket_io.hpp"

#include <arpa/inet.h>     // inet_pton / inet_ntop
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <netdb.h>         // getaddrinfo for host resolution
#include <netinet/in.h>    // sockaddr_in
#include <poll.h>          // poll(2) with zero timeout for connect progress
#include <sys/socket.h>
#include <unistd.h>        // ::close

#include <cerrno>
#include <cstring>         // strerror

namespace beacon {

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------

static bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static std::string format_addr(const sockaddr_in& sa) {
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &sa.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(sa.sin_port));
}

// Resolve host to an IPv4 sockaddr. Numeric addresses never touch DNS.
static bool resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(port);
    if (host.empty()) { out.sin_addr.s_addr = htonl(INADDR_ANY); return true; }
    if (::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
}


// ---------------------------------------------------------------------------
// TCP
// ---------------------------------------------------------------------------

int open_listener(const std::string& bind_addr, uint16_t port) {
    sockaddr_in sa{};
    if (!resolve_ipv4(bind_addr, port, sa)) return -1;

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));   // quick rebind after restart

    if (!set_nonblocking(fd)
        || ::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0
        || ::listen(fd, 1) != 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;                   // keep the real cause for last_error_text()
        return -1;
    }
    return fd;
}

uint16_t local_port(int fd) {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) != 0) return 0;
    return ntohs(sa.sin_port);
}

int accept_peer(int listen_fd, std::string& remote_address) {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&sa), &len);
    if (fd < 0) return -1;               // EAGAIN: nobody knocking yet
    if (!set_nonblocking(fd)) { ::close(fd); return -1; }
    remote_address = format_addr(sa);
    return fd;
}

int begin_connect(const std::string& host, uint16_t port) {
    sockaddr_in sa{};
    if (host.empty() || !resolve_ipv4(host, port, sa)) { errno = EINVAL; return -1; }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    if (!set_nonblocking(fd)) { ::close(fd); return -1; }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0
        && errno != EINPROGRESS) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;                           // connected or in progress; poll_connect() decides
}

ConnectProgress poll_connect(int fd) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, 0);
    if (pr < 0) return ConnectProgress::Failed;
    if (pr == 0) return ConnectProgress::InProgress;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) return ConnectProgress::Failed;
    if (err != 0) { errno = err; return ConnectProgress::Failed; }
    return ConnectProgress::Connected;
}

IoResult write_some(int fd, const char* data, size_t len, size_t& written) {
    written = 0;
    if (fd < 0) return IoResult::Error;
    if (len == 0) return IoResult::Ok;
    ssize_t w = ::send(fd, data, len, MSG_NOSIGNAL);
    if (w >= 0) { written = static_cast<size_t>(w); return IoResult::Ok; }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return IoResult::WouldBlock;
    if (errno == EPIPE || errno == ECONNRESET) return IoResult::Closed;
    return IoResult::Error;
}

IoResult read_some(int fd, char* buf, size_t cap, size_t& got) {
    got = 0;
    if (fd < 0 || cap == 0) return IoResult::Error;
    ssize_t r = ::recv(fd, buf, cap, 0);
    if (r > 0)  { got = static_cast<size_t>(r); return IoResult::Ok; }
    if (r == 0) return IoResult::Closed;                                   // orderly shutdown
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return IoResult::WouldBlock;
    if (errno == ECONNRESET) return IoResult::Closed;
    return IoResult::Error;
}

std::string peer_address(int fd) {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&sa), &len) != 0) return {};
    return format_addr(sa);
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}


// ---------------------------------------------------------------------------
// UDP (beacon bridge)
// ---------------------------------------------------------------------------

int open_udp(uint16_t port, bool broadcast) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return -1;

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (broadcast) ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one));

    sockaddr_in sa{};
    sa.sin_family      = AF_INET;
    sa.sin_port        = htons(port);
    sa.sin_addr.s_addr = htonl(INADDR_ANY);

    if (!set_nonblocking(fd) || ::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;
}

bool send_datagram(int fd, const std::string& host, uint16_t port, const std::string& payload) {
    sockaddr_in sa{};
    if (fd < 0 || !resolve_ipv4(host, port, sa)) return false;
    ssize_t w = ::sendto(fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
    return w == static_cast<ssize_t>(payload.size());
}

IoResult recv_datagram(int fd, std::string& payload, std::string& from_ip) {
    char buf[2048];
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    ssize_t r = ::recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&sa), &len);
    if (r < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return IoResult::WouldBlock;
        return IoResult::Error;
    }
    payload.assign(buf, static_cast<size_t>(r));
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &sa.sin_addr, ip, sizeof(ip));
    from_ip = ip;
    return IoResult::Ok;
}

std::string last_error_text() {
    return std::strerror(errno);
}

} // namespace beacon
