#include "rdesk/net.hpp"

#include <cstring>

#ifdef _WIN32
#pragma comment(lib, "ws2_32.lib")
#else
#include <cerrno>
#include <netdb.h>
#include <poll.h>
#include <sys/time.h>
#endif

namespace rdesk::net {

NetworkInit::NetworkInit() {
#ifdef _WIN32
  WSADATA wsa;
  if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0)
    throw NetError("WSAStartup failed");
#endif
}

NetworkInit::~NetworkInit() {
#ifdef _WIN32
  WSACleanup();
#endif
}

void close_socket(socket_t s) {
  if (!is_valid(s))
    return;
#ifdef _WIN32
  closesocket(s);
#else
  close(s);
#endif
}

void shutdown_both(socket_t s) {
  if (!is_valid(s))
    return;
#ifdef _WIN32
  shutdown(s, SD_BOTH);
#else
  shutdown(s, SHUT_RDWR);
#endif
}

void set_nodelay(socket_t s) {
  int one = 1;
  setsockopt(s, IPPROTO_TCP, TCP_NODELAY, (const char *)&one, sizeof(one));
}

void set_send_timeout(socket_t s, int timeout_ms) {
#ifdef _WIN32
  DWORD t = (DWORD)timeout_ms;
  setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, (const char *)&t, sizeof(t));
#else
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}

int last_error() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

WaitResult wait_readable(socket_t s, int timeout_ms) {
#ifdef _WIN32
  WSAPOLLFD p{};
  p.fd = s;
  p.events = POLLRDNORM;
  int r = WSAPoll(&p, 1, timeout_ms);
#else
  pollfd p{};
  p.fd = s;
  p.events = POLLIN;
  int r;
  do {
    r = poll(&p, 1, timeout_ms);
  } while (r < 0 && errno == EINTR);
#endif
  if (r < 0)
    return WaitResult::Error;
  if (r == 0)
    return WaitResult::Timeout;
  return WaitResult::Ready;
}

long recv_some(socket_t s, std::uint8_t *buf, size_t len) {
#ifdef _WIN32
  int r = recv(s, (char *)buf, (int)len, 0);
  return r < 0 ? -1 : r;
#else
  ssize_t r;
  do {
    r = recv(s, buf, len, 0);
  } while (r < 0 && errno == EINTR);
  return r < 0 ? -1 : (long)r;
#endif
}

bool send_all(socket_t s, const std::uint8_t *data, size_t len) {
  while (len > 0) {
#ifdef _WIN32
    int r = send(s, (const char *)data, (int)len, 0);
#else
    ssize_t r = send(s, data, len, MSG_NOSIGNAL);
    if (r < 0 && errno == EINTR)
      continue;
#endif
    if (r <= 0)
      return false;
    data += r;
    len -= (size_t)r;
  }
  return true;
}

namespace {

std::string format_address(const sockaddr *sa) {
  char host[INET6_ADDRSTRLEN] = {0};
  if (sa->sa_family == AF_INET) {
    auto *in = (const sockaddr_in *)sa;
    inet_ntop(AF_INET, (void *)&in->sin_addr, host, sizeof(host));
  } else if (sa->sa_family == AF_INET6) {
    auto *in6 = (const sockaddr_in6 *)sa;
    inet_ntop(AF_INET6, (void *)&in6->sin6_addr, host, sizeof(host));
  } else {
    return "unknown";
  }
  return host;
}

addrinfo *resolve(const std::string &host, int port, bool passive) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  if (passive)
    hints.ai_flags = AI_PASSIVE;
  addrinfo *res = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(),
                       &hints, &res);
  if (rc != 0 || !res)
    throw NetError("cannot resolve " + host + ":" + service + ": " +
                   gai_strerror(rc));
  return res;
}

} // namespace

socket_t listen_tcp(const std::string &address, int port, int backlog) {
  addrinfo *res = resolve(address, port, true);
  socket_t s = INVALID_SOCKET;
  std::string err;
  for (addrinfo *ai = res; ai; ai = ai->ai_next) {
    s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (!is_valid(s))
      continue;
    int one = 1;
    setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char *)&one, sizeof(one));
    if (bind(s, ai->ai_addr, (int)ai->ai_addrlen) == 0 &&
        listen(s, backlog) == 0)
      break;
    err = "bind/listen failed: " + std::to_string(last_error());
    close_socket(s);
    s = INVALID_SOCKET;
  }
  freeaddrinfo(res);
  if (!is_valid(s))
    throw NetError("cannot listen on " + address + ":" +
                   std::to_string(port) + (err.empty() ? "" : " (" + err + ")"));
  return s;
}

socket_t accept_client(socket_t listener, std::string *peer) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  socket_t c = accept(listener, (sockaddr *)&ss, &len);
  if (is_valid(c) && peer)
    *peer = format_address((const sockaddr *)&ss);
  return c;
}

socket_t connect_tcp(const std::string &host, int port) {
  addrinfo *res = resolve(host, port, false);
  socket_t s = INVALID_SOCKET;
  for (addrinfo *ai = res; ai; ai = ai->ai_next) {
    s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (!is_valid(s))
      continue;
    if (connect(s, ai->ai_addr, (int)ai->ai_addrlen) == 0)
      break;
    close_socket(s);
    s = INVALID_SOCKET;
  }
  freeaddrinfo(res);
  if (!is_valid(s))
    throw NetError("cannot connect to " + host + ":" + std::to_string(port));
  set_nodelay(s);
  return s;
}

int local_port(socket_t s) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (getsockname(s, (sockaddr *)&ss, &len) != 0)
    return -1;
  if (ss.ss_family == AF_INET)
    return ntohs(((sockaddr_in *)&ss)->sin_port);
  if (ss.ss_family == AF_INET6)
    return ntohs(((sockaddr_in6 *)&ss)->sin6_port);
  return -1;
}

std::string peer_address(socket_t s) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (getpeername(s, (sockaddr *)&ss, &len) != 0)
    return "unknown";
  return format_address((const sockaddr *)&ss);
}

} // namespace rdesk::net
