// net/probe.cpp - TCP reachability probe implementation
#include "probe.hpp"
#include "../utils.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace stablemount {

TcpProber::TcpProber(int port, int timeout_ms, int retry_extra_ms)
    : port_(port), timeout_ms_(timeout_ms), retry_extra_ms_(retry_extra_ms) {}

bool TcpProber::reachable(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  if (try_connect(host, timeout_ms_)) {
    LOG_DEBUG(host + ":" + std::to_string(port_) + " is reachable");
    return true;
  }
  if (try_connect(host, timeout_ms_ + retry_extra_ms_)) {
    LOG_DEBUG(host + ":" + std::to_string(port_) +
              " is reachable (second attempt)");
    return true;
  }
  LOG_DEBUG(host + ":" + std::to_string(port_) + " is not reachable");
  return false;
}

bool TcpProber::try_connect(const std::string &host, int timeout_ms) const {
  struct addrinfo hints {};
  struct addrinfo *res = nullptr;

  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  std::string port = std::to_string(port_);
  int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0 || res == nullptr) {
    LOG_DEBUG("Cannot resolve " + host + ": " + gai_strerror(rc));
    return false;
  }

  bool connected = false;
  for (struct addrinfo *ai = res; ai != nullptr && !connected;
       ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                    ai->ai_protocol);
    if (fd < 0) {
      continue;
    }

    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = true;
    } else if (errno == EINPROGRESS) {
      struct pollfd pfd {};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      int ready;
      do {
        ready = poll(&pfd, 1, timeout_ms);
      } while (ready < 0 && errno == EINTR);

      if (ready > 0) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) {
          connected = true;
        }
      }
    }

    close(fd);
  }

  freeaddrinfo(res);
  return connected;
}

} // namespace stablemount
