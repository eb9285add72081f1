#include <doctest/doctest.h>

#include "TestHelpers.hpp"

#include <core/endpoints.hpp>
#include <net/vpn.hpp>

using namespace stablemount;
using namespace stablemount::test;

TEST_SUITE("Endpoints") {

TEST_CASE("rank_endpoints orders local names before VPN addresses") {
    TempDir tmp;
    Config config = make_test_config(tmp.path());
    FakeVpn vpn;
    vpn.ip = kVpnIp;

    auto ranked = rank_endpoints(config, vpn);
    REQUIRE(ranked.size() == 4);
    CHECK(ranked[0].probe_host == kLan1);
    CHECK(ranked[0].mount_host == kLan1);
    CHECK(ranked[1].probe_host == kLan2);
    CHECK(ranked[1].mount_host == kLan2Encoded);
    CHECK(ranked[2].probe_host == kVpnIp);
    CHECK(ranked[2].kind == EndpointKind::VpnDynamic);
    CHECK(ranked[3].probe_host == kVpnFallbackIp);
    CHECK(ranked[3].kind == EndpointKind::VpnLastKnown);
    for (size_t i = 0; i < ranked.size(); ++i)
        CHECK(ranked[i].rank == static_cast<int>(i));
}

TEST_CASE("rank_endpoints drops unknown and duplicate VPN addresses") {
    TempDir tmp;
    Config config = make_test_config(tmp.path());
    FakeVpn vpn;

    SUBCASE("peer not listed") {
        auto ranked = rank_endpoints(config, vpn);
        REQUIRE(ranked.size() == 3);
        CHECK(ranked[2].kind == EndpointKind::VpnLastKnown);
    }
    SUBCASE("peer at the last known address") {
        vpn.ip = kVpnFallbackIp;
        auto ranked = rank_endpoints(config, vpn);
        REQUIRE(ranked.size() == 3);
        CHECK(ranked[2].kind == EndpointKind::VpnDynamic);
    }
    SUBCASE("second local name unset") {
        config.local_host_2.clear();
        auto ranked = rank_endpoints(config, vpn);
        REQUIRE(ranked.size() == 2);
        CHECK(local_endpoints(ranked).size() == 1);
    }
}

TEST_CASE("select_reachable returns the highest ranked reachable endpoint") {
    TempDir tmp;
    Config config = make_test_config(tmp.path());
    FakeVpn vpn;
    vpn.ip = kVpnIp;
    auto ranked = rank_endpoints(config, vpn);
    FakeProber prober;

    SUBCASE("everything up") {
        prober.up = {kLan1, kLan2, kVpnIp, kVpnFallbackIp};
        auto chosen = select_reachable(ranked, prober);
        REQUIRE(chosen);
        CHECK(chosen->label == "local-1");
        CHECK(prober.probes.size() == 1);
    }
    SUBCASE("only the VPN addresses") {
        prober.up = {kVpnIp, kVpnFallbackIp};
        auto chosen = select_reachable(ranked, prober);
        REQUIRE(chosen);
        CHECK(chosen->probe_host == kVpnIp);
        CHECK(prober.probes == std::vector<std::string>{kLan1, kLan2, kVpnIp});
    }
    SUBCASE("nothing up") {
        CHECK_FALSE(select_reachable(ranked, prober));
        CHECK(prober.probes.size() == 4);
    }
}

TEST_CASE("find_endpoint matches the host as it appears in a mount source") {
    TempDir tmp;
    Config config = make_test_config(tmp.path());
    FakeVpn vpn;
    auto ranked = rank_endpoints(config, vpn);

    auto lan2 = find_endpoint(ranked, kLan2Encoded);
    REQUIRE(lan2);
    CHECK(lan2->label == "local-2");
    CHECK(lan2->is_local());

    auto vpn_ep = find_endpoint(ranked, kVpnFallbackIp);
    REQUIRE(vpn_ep);
    CHECK_FALSE(vpn_ep->is_local());

    CHECK_FALSE(find_endpoint(ranked, "elsewhere.example"));
    CHECK_FALSE(find_endpoint(ranked, ""));
}

TEST_CASE("find_peer_ip reads the address column of the status listing") {
    std::string status = "100.64.0.1   laptop   user@   linux   -\n"
                         "100.64.0.20  nas      user@   macOS   active; direct\n";
    CHECK(find_peer_ip(status, "nas") == std::optional<std::string>("100.64.0.20"));
    CHECK_FALSE(find_peer_ip(status, "printer"));
    CHECK_FALSE(find_peer_ip("", "nas"));
}

}
