#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOGDI
#define NOGDI
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
typedef SOCKET socket_t;
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
typedef int socket_t;
#ifndef INVALID_SOCKET
#define INVALID_SOCKET (-1)
#endif
#endif

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rdesk::net {

class NetError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Winsock startup/cleanup; no-op elsewhere. One per process is enough but
// nesting is harmless.
class NetworkInit {
public:
  NetworkInit();
  ~NetworkInit();
  NetworkInit(const NetworkInit &) = delete;
  NetworkInit &operator=(const NetworkInit &) = delete;
};

inline bool is_valid(socket_t s) {
#ifdef _WIN32
  return s != INVALID_SOCKET;
#else
  return s >= 0;
#endif
}

void close_socket(socket_t s);
void shutdown_both(socket_t s);
void set_nodelay(socket_t s);
void set_send_timeout(socket_t s, int timeout_ms);
int last_error();

enum class WaitResult { Ready, Timeout, Error };
WaitResult wait_readable(socket_t s, int timeout_ms);

// Returns bytes read, 0 on orderly close, -1 on error.
long recv_some(socket_t s, std::uint8_t *buf, size_t len);
// Blocks until everything is written. Never raises SIGPIPE.
bool send_all(socket_t s, const std::uint8_t *data, size_t len);

// Bound, listening IPv4/IPv6 socket. Port 0 picks an ephemeral port.
socket_t listen_tcp(const std::string &address, int port, int backlog);
socket_t accept_client(socket_t listener, std::string *peer);
socket_t connect_tcp(const std::string &host, int port);

int local_port(socket_t s);
std::string peer_address(socket_t s);

} // namespace rdesk::net
