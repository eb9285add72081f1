#include <doctest/doctest.h>

#include "TestHelpers.hpp"

#include <net/probe.hpp>
#include <net/vpn.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace stablemount;
using namespace stablemount::test;

namespace {

// Loopback TCP socket on an ephemeral port, listening or merely bound
class LoopbackSocket {
public:
    explicit LoopbackSocket(bool listening) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        if (listening)
            REQUIRE(::listen(fd_, 4) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackSocket() { ::close(fd_); }
    LoopbackSocket(const LoopbackSocket&) = delete;
    LoopbackSocket& operator=(const LoopbackSocket&) = delete;

    auto port() const -> int { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

} // namespace

TEST_SUITE("TcpProber") {

TEST_CASE("a listening loopback port is reachable") {
    LoopbackSocket server(true);
    TcpProber prober(server.port(), 500, 100);
    CHECK(prober.reachable("127.0.0.1"));
}

TEST_CASE("a port nobody listens on is unreachable") {
    LoopbackSocket bound(false);
    TcpProber prober(bound.port(), 200, 100);
    CHECK_FALSE(prober.reachable("127.0.0.1"));
}

TEST_CASE("names that do not resolve and empty hosts are unreachable") {
    TcpProber prober(445, 200, 100);
    CHECK_FALSE(prober.reachable("stablemount-test.invalid"));
    CHECK_FALSE(prober.reachable(""));
}

}

TEST_SUITE("TailscaleStatus") {

TEST_CASE("peer_ip runs the status command and picks the peer's address") {
    TempDir tmp;
    fs::path cli = write_script(tmp.path() / "bin" / "vpn cli",
                                "[ \"$1\" = status ] || exit 2\n"
                                "echo '100.64.0.1   laptop   user@   linux   -'\n"
                                "echo '100.64.0.20  nas      user@   macOS   active; direct'\n");

    TailscaleStatus vpn(cli.string());
    CHECK(vpn.peer_ip("nas") == std::optional<std::string>("100.64.0.20"));
    CHECK_FALSE(vpn.peer_ip("printer"));
    CHECK_FALSE(vpn.peer_ip(""));
}

TEST_CASE("peer_ip is empty when the status command fails") {
    TempDir tmp;
    fs::path cli = write_script(tmp.path() / "vpn", "echo '100.64.0.20 nas'\nexit 1\n");

    TailscaleStatus failing(cli.string());
    CHECK_FALSE(failing.peer_ip("nas"));

    TailscaleStatus missing((tmp.path() / "absent").string());
    CHECK_FALSE(missing.peer_ip("nas"));

    TailscaleStatus unset("");
    CHECK_FALSE(unset.peer_ip("nas"));
}

}
