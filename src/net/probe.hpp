// net/probe.hpp - TCP reachability probe
#pragma once

#include <string>

namespace stablemount {

class Prober {
public:
  virtual ~Prober() = default;

  // Never throws; any failure means unreachable
  virtual bool reachable(const std::string &host) = 0;
};

// Bounded-time connect() to host:port. A second round with a slightly
// longer timeout covers slow resolvers on the first attempt.
class TcpProber : public Prober {
public:
  TcpProber(int port, int timeout_ms, int retry_extra_ms);

  bool reachable(const std::string &host) override;

private:
  bool try_connect(const std::string &host, int timeout_ms) const;

  int port_;
  int timeout_ms_;
  int retry_extra_ms_;
};

} // namespace stablemount
