// core/endpoints.hpp - Endpoint ranking and selection
#pragma once

#include "../conf/config.hpp"
#include "../net/probe.hpp"
#include "../net/vpn.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stablemount {

enum class EndpointKind { Local, VpnDynamic, VpnLastKnown };

struct Endpoint {
  std::string label;
  std::string probe_host; // what the prober connects to
  std::string mount_host; // what the mount request and mount source carry
  EndpointKind kind = EndpointKind::Local;
  int rank = 0;

  bool is_local() const { return kind == EndpointKind::Local; }
  bool matches_host(const std::string &host) const;
};

std::string endpoint_kind_to_string(EndpointKind kind);

// local 1 > local 2 > VPN (resolved now) > VPN (last known)
std::vector<Endpoint> rank_endpoints(const Config &config, VpnStatus &vpn);

std::vector<Endpoint> local_endpoints(const std::vector<Endpoint> &ranked);

// First reachable endpoint in rank order
std::optional<Endpoint> select_reachable(const std::vector<Endpoint> &ranked,
                                         Prober &prober);

// Endpoint the given mount source host belongs to, if any
std::optional<Endpoint> find_endpoint(const std::vector<Endpoint> &ranked,
                                      const std::string &host);

} // namespace stablemount
