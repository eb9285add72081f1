// net/vpn.hpp - VPN peer address lookup
#pragma once

#include <optional>
#include <string>

namespace stablemount {

class VpnStatus {
public:
  virtual ~VpnStatus() = default;

  virtual std::optional<std::string> peer_ip(const std::string &peer) = 0;
};

// Parses `<cli> status`, whose lines start with "<ip> <peer-name> ..."
class TailscaleStatus : public VpnStatus {
public:
  TailscaleStatus(const std::string &cli);

  std::optional<std::string> peer_ip(const std::string &peer) override;

private:
  std::string cli_;
};

std::optional<std::string> find_peer_ip(const std::string &status_output,
                                        const std::string &peer);

} // namespace stablemount
