#include <doctest/doctest.h>

#include "TestHelpers.hpp"

#include <conf/config.hpp>

#include <fstream>
#include <stdexcept>

using namespace stablemount;
using namespace stablemount::test;

TEST_SUITE("Config") {

TEST_CASE("from_file reads quoted strings, integers and booleans") {
    TempDir tmp;
    fs::path file = tmp.path() / "config.toml";
    std::ofstream(file) << "# share\n"
                           "mount_point = \"/Volumes/RAID Store\"\n"
                           "share_name = \"RAID Store\"\n"
                           "\n"
                           "local_host_1 = nas.local\n"
                           "port = 1445\n"
                           "poll_attempts=5\n"
                           "mount_command = \"open -g \"{url}\"\"\n"
                           "verbose = true\n";

    Config config = Config::from_file(file);
    CHECK(config.mount_point == fs::path("/Volumes/RAID Store"));
    CHECK(config.share_name == "RAID Store");
    CHECK(config.local_host_1 == "nas.local");
    CHECK(config.local_host_2 == DEFAULT_LOCAL_HOST_2);
    CHECK(config.port == 1445);
    CHECK(config.poll_attempts == 5);
    CHECK(config.mount_command == "open -g \"{url}\"");
    CHECK(config.verbose);
}

TEST_CASE("from_file rejects bad values") {
    TempDir tmp;
    fs::path file = tmp.path() / "config.toml";

    SUBCASE("non-numeric integer") {
        std::ofstream(file) << "poll_attempts = twenty\n";
        CHECK_THROWS_AS(Config::from_file(file), std::runtime_error);
    }
    SUBCASE("relative mount point") {
        std::ofstream(file) << "mount_point = mnt/share\n";
        CHECK_THROWS_AS(Config::from_file(file), std::runtime_error);
    }
    SUBCASE("missing file") {
        CHECK_THROWS_AS(Config::from_file(tmp.path() / "absent.toml"), std::runtime_error);
    }
}

TEST_CASE("save_to_file output loads back into the same settings") {
    TempDir tmp;
    Config original = make_test_config(tmp.path());
    original.session_capture_command = "list-windows --paths";
    fs::path file = tmp.path() / "saved.toml";
    REQUIRE(original.save_to_file(file));

    Config loaded = Config::from_file(file);
    CHECK(loaded.mount_point == original.mount_point);
    CHECK(loaded.local_host_2 == original.local_host_2);
    CHECK(loaded.poll_interval_ms == 0);
    CHECK(loaded.lock_file == original.lock_file);
    CHECK(loaded.mount_command == original.mount_command);
    CHECK(loaded.session_capture_command == "list-windows --paths");
}

TEST_CASE("candidate_paths lists the canonical path before its numbered variants") {
    Config config;
    config.mount_point = "/Volumes/RAID Store";
    config.variant_count = 2;
    auto paths = config.candidate_paths();
    REQUIRE(paths.size() == 3);
    CHECK(paths[0] == fs::path("/Volumes/RAID Store"));
    CHECK(paths[1] == fs::path("/Volumes/RAID Store-1"));
    CHECK(paths[2] == fs::path("/Volumes/RAID Store-2"));
}

TEST_CASE("merge_with_cli only overrides what was given") {
    Config config;
    config.log_file = "/var/log/stablemount.log";
    config.merge_with_cli("", false);
    CHECK(config.log_file == fs::path("/var/log/stablemount.log"));
    CHECK_FALSE(config.verbose);

    config.merge_with_cli("/tmp/other.log", true);
    CHECK(config.log_file == fs::path("/tmp/other.log"));
    CHECK(config.verbose);
}

}
