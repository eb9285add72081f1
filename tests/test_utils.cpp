#include <doctest/doctest.h>

#include "TestHelpers.hpp"

#include <utils.hpp>

#include <string>

using namespace stablemount;
using namespace stablemount::test;

TEST_SUITE("Utils") {

TEST_CASE("url_encode escapes spaces and keeps unreserved characters") {
    CHECK(url_encode("RAID Store") == "RAID%20Store");
    CHECK(url_encode("Mac Server._smb._tcp.local") == "Mac%20Server._smb._tcp.local");
    CHECK(url_encode("a-b_c.d~e") == "a-b_c.d~e");
    CHECK(url_encode("x/y") == "x%2Fy");
}

TEST_CASE("url_decode reverses percent escapes and leaves malformed ones alone") {
    CHECK(url_decode("RAID%20Store") == "RAID Store");
    CHECK(url_decode("100%") == "100%");
    CHECK(url_decode("%zz") == "%zz");
    CHECK(url_decode("%2f") == "/");
}

TEST_CASE("shell_quote survives embedded single quotes") {
    CHECK(shell_quote("RAID Store") == "'RAID Store'");
    CHECK(shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("expand_template quotes known placeholders only") {
    std::string out = expand_template("mount {unc} {path} -o {opts}",
                                      {{"unc", "//host/RAID Store"}, {"path", "/mnt/RAID Store"}});
    CHECK(out == "mount '//host/RAID Store' '/mnt/RAID Store' -o {opts}");
    CHECK(expand_template("no placeholders", {}) == "no placeholders");
    CHECK(expand_template("dangling {path", {{"path", "/x"}}) == "dangling {path");
}

TEST_CASE("trim strips surrounding whitespace") {
    CHECK(trim("  a b \t\n") == "a b");
    CHECK(trim(" \t ").empty());
}

TEST_CASE("iso8601_now has date, T separator and a colon in the offset") {
    std::string ts = iso8601_now();
    REQUIRE(ts.size() == 25);
    CHECK(ts[4] == '-');
    CHECK(ts[10] == 'T');
    CHECK(ts[13] == ':');
    CHECK((ts[19] == '+' || ts[19] == '-'));
    CHECK(ts[22] == ':');
}

TEST_CASE("is_dir_at is true only for existing directories") {
    TempDir tmp;
    touch(tmp.path() / "file");
    CHECK(is_dir_at(tmp.path()));
    CHECK_FALSE(is_dir_at(tmp.path() / "file"));
    CHECK_FALSE(is_dir_at(tmp.path() / "absent"));
}

}
