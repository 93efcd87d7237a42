/**
 * @page beacon-socket-io Beacon Socket I/O API (Header)
 * @file socket_io.hpp
 * @brief Thin, non-blocking POSIX socket helpers for the transport and the LAN bridge.
 *
 * @details
 * PURPOSE
 * -------
 * Everything above this file wants to think in terms of "listen", "accept
 * one", "connect", "write what you can", "read what is there". This header
 * is that surface and nothing more: free functions over plain file
 * descriptors, every descriptor non-blocking, every call returning promptly.
 * Timing (timeouts, retries, backoff) lives in the callers, which are all
 * driven from one tick loop.
 *
 * ROLE IN BEACON
 * --------------
 * - ConnectionNegotiator: open_listener() / accept_peer() on the host side,
 *   begin_connect() / poll_connect() on the client side.
 * - MessageChannel: write_some() / read_some() on the one active socket.
 * - UdpBeaconBridge: open_udp() / send_datagram() / recv_datagram().
 *
 * DESIGN CHOICES
 * --------------
 * - IPv4 only. The radio group networks we ride on hand out IPv4 addresses.
 * - send() uses MSG_NOSIGNAL, so a peer vanishing mid-write is an Error
 *   return, not a SIGPIPE.
 * - A negative fd is "no socket". close_socket(-1) is a no-op.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Port 8888 is the well-known transport port. Port 0 asks the kernel for
 *   an ephemeral port (tests); query it with local_port().
 * - On failure, errno is left as the failing syscall set it;
 *   last_error_text() renders it for logs.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace beacon {

enum class IoResult : uint8_t { Ok = 0, WouldBlock = 1, Closed = 2, Error = 3 };
enum class ConnectProgress : uint8_t { InProgress = 0, Connected = 1, Failed = 2 };

/**
 * @brief Bind + listen on @p bind_addr:@p port (backlog 1), non-blocking, SO_REUSEADDR.
 * @param bind_addr  Dotted IPv4, or empty for INADDR_ANY.
 * @return Listening fd, or -1 on failure.
 */
int open_listener(const std::string& bind_addr, uint16_t port);

/// Port a bound socket actually got (useful after binding port 0). 0 on error.
uint16_t local_port(int fd);

/**
 * @brief Accept one pending connection, if any.
 * @param remote_address  Receives "ip:port" of the peer on success.
 * @return Non-blocking connected fd, or -1 when nothing is pending or on error.
 */
int accept_peer(int listen_fd, std::string& remote_address);

/**
 * @brief Start a non-blocking connect to @p host:@p port.
 * @return fd (connection may still be in progress) or -1 on immediate failure.
 */
int begin_connect(const std::string& host, uint16_t port);

/// Check a socket returned by begin_connect() without blocking.
ConnectProgress poll_connect(int fd);

/// Write as much of @p data as the kernel takes right now.
IoResult write_some(int fd, const char* data, size_t len, size_t& written);

/// Read whatever is available, up to @p cap bytes. Closed means orderly EOF.
IoResult read_some(int fd, char* buf, size_t cap, size_t& got);

/// "ip:port" of the connected peer, or empty.
std::string peer_address(int fd);

void close_socket(int fd);

/// UDP socket bound to @p port on all interfaces; broadcast enabled on request.
int open_udp(uint16_t port, bool broadcast);

bool send_datagram(int fd, const std::string& host, uint16_t port, const std::string& payload);

/// Receive one datagram. @p from_ip receives the sender's dotted address.
IoResult recv_datagram(int fd, std::string& payload, std::string& from_ip);

/// strerror(errno) of the most recent failure on this thread.
std::string last_error_text();

} // namespace beacon
