// core/endpoints.cpp - Endpoint ranking and selection implementation
#include "endpoints.hpp"
#include "../utils.hpp"

namespace stablemount {

bool Endpoint::matches_host(const std::string &host) const {
  if (host.empty())
    return false;
  return host == mount_host || host == probe_host ||
         url_decode(host) == probe_host;
}

std::string endpoint_kind_to_string(EndpointKind kind) {
  switch (kind) {
  case EndpointKind::Local:
    return "local";
  case EndpointKind::VpnDynamic:
    return "vpn";
  case EndpointKind::VpnLastKnown:
    return "vpn-last-known";
  }
  return "unknown";
}

static void add_endpoint(std::vector<Endpoint> &ranked,
                         const std::string &label, const std::string &host,
                         EndpointKind kind) {
  if (host.empty())
    return;
  for (const auto &ep : ranked) {
    if (ep.probe_host == host)
      return;
  }

  Endpoint ep;
  ep.label = label;
  ep.probe_host = host;
  // Hosts with spaces (DNS-SD service names) travel encoded in URLs
  ep.mount_host =
      host.find(' ') == std::string::npos ? host : url_encode(host);
  ep.kind = kind;
  ep.rank = static_cast<int>(ranked.size());
  ranked.push_back(ep);
}

std::vector<Endpoint> rank_endpoints(const Config &config, VpnStatus &vpn) {
  std::vector<Endpoint> ranked;
  add_endpoint(ranked, "local-1", config.local_host_1, EndpointKind::Local);
  add_endpoint(ranked, "local-2", config.local_host_2, EndpointKind::Local);

  auto dynamic_ip = vpn.peer_ip(config.vpn_peer);
  if (dynamic_ip) {
    add_endpoint(ranked, "vpn", *dynamic_ip, EndpointKind::VpnDynamic);
  }
  add_endpoint(ranked, "vpn-last-known", config.vpn_fallback_ip,
               EndpointKind::VpnLastKnown);
  return ranked;
}

std::vector<Endpoint> local_endpoints(const std::vector<Endpoint> &ranked) {
  std::vector<Endpoint> result;
  for (const auto &ep : ranked) {
    if (ep.is_local())
      result.push_back(ep);
  }
  return result;
}

std::optional<Endpoint> select_reachable(const std::vector<Endpoint> &ranked,
                                         Prober &prober) {
  for (const auto &ep : ranked) {
    if (prober.reachable(ep.probe_host)) {
      return ep;
    }
  }
  return std::nullopt;
}

std::optional<Endpoint> find_endpoint(const std::vector<Endpoint> &ranked,
                                      const std::string &host) {
  for (const auto &ep : ranked) {
    if (ep.matches_host(host))
      return ep;
  }
  return std::nullopt;
}

} // namespace stablemount
