#include <doctest/doctest.h>

#include "TestHelpers.hpp"

#include <core/lock.hpp>

#include <chrono>

using namespace stablemount;
using namespace stablemount::test;

TEST_SUITE("RunGuard") {

TEST_CASE("a second guard on the same path is refused while the first holds it") {
    TempDir tmp;
    fs::path lock = tmp.path() / "run" / "pass.lock";

    RunGuard first(lock, 120);
    REQUIRE(first.acquire() == LockStatus::Acquired);
    CHECK(first.held());
    CHECK(fs::exists(lock));

    RunGuard second(lock, 120);
    CHECK(second.acquire() == LockStatus::Contended);
    CHECK_FALSE(second.held());

    first.release();
    CHECK_FALSE(fs::exists(lock));
    CHECK(second.acquire() == LockStatus::Acquired);
}

TEST_CASE("the marker is removed when the guard goes out of scope") {
    TempDir tmp;
    fs::path lock = tmp.path() / "pass.lock";
    {
        RunGuard guard(lock, 120);
        REQUIRE(guard.acquire() == LockStatus::Acquired);
    }
    CHECK_FALSE(fs::exists(lock));
}

TEST_CASE("a refused guard leaves the existing marker in place") {
    TempDir tmp;
    fs::path lock = tmp.path() / "pass.lock";
    touch(lock);
    {
        RunGuard guard(lock, 120);
        CHECK(guard.acquire() == LockStatus::Contended);
    }
    CHECK(fs::exists(lock));
}

TEST_CASE("a marker older than the threshold is reclaimed") {
    TempDir tmp;
    fs::path lock = tmp.path() / "pass.lock";
    touch(lock);
    fs::last_write_time(lock, fs::file_time_type::clock::now() - std::chrono::seconds(300));

    RunGuard guard(lock, 120);
    CHECK(guard.acquire() == LockStatus::Acquired);
    CHECK(guard.held());
}

TEST_CASE("a marker that cannot be created is an error, not contention") {
    TempDir tmp;
    touch(tmp.path() / "not-a-dir");

    RunGuard guard(tmp.path() / "not-a-dir" / "pass.lock", 120);
    CHECK(guard.acquire() == LockStatus::Error);
    CHECK_FALSE(guard.held());
}

TEST_CASE("release leaves a marker that another pass took over") {
    TempDir tmp;
    fs::path lock = tmp.path() / "pass.lock";

    RunGuard slow(lock, 120);
    REQUIRE(slow.acquire() == LockStatus::Acquired);

    // Another pass reclaimed the marker while this one was still running
    fs::remove(lock);
    RunGuard newer(lock, 120);
    REQUIRE(newer.acquire() == LockStatus::Acquired);

    slow.release();
    CHECK(fs::exists(lock));
    CHECK_FALSE(slow.held());

    newer.release();
    CHECK_FALSE(fs::exists(lock));
}

}
