// net/vpn.cpp - VPN peer address lookup implementation
#include "vpn.hpp"
#include "../utils.hpp"
#include <sstream>

namespace stablemount {

TailscaleStatus::TailscaleStatus(const std::string &cli) : cli_(cli) {}

std::optional<std::string> TailscaleStatus::peer_ip(const std::string &peer) {
  if (cli_.empty() || peer.empty()) {
    return std::nullopt;
  }

  std::string output;
  if (!run_command_capture(shell_quote(cli_) + " status 2>/dev/null", output)) {
    LOG_DEBUG("VPN status query failed");
    return std::nullopt;
  }

  auto ip = find_peer_ip(output, peer);
  if (ip) {
    LOG_DEBUG("VPN peer " + peer + " is at " + *ip);
  }
  return ip;
}

std::optional<std::string> find_peer_ip(const std::string &status_output,
                                        const std::string &peer) {
  std::istringstream in(status_output);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    std::string ip, name;
    if (!(ls >> ip >> name))
      continue;
    if (name == peer)
      return ip;
  }
  return std::nullopt;
}

} // namespace stablemount
