#include "test_common.hpp"
#include "lock_utils.hpp"
#include "system_utils.hpp"
#include "thread_utils.hpp"
#include <fcntl.h>

TEST_CASE("Civil day numbers") {
    REQUIRE(days_from_civil(1970, 1, 1) == 0);
    REQUIRE(days_from_civil(1970, 1, 2) == 1);
    REQUIRE(days_from_civil(1969, 12, 31) == -1);
    REQUIRE(days_from_civil(2000, 3, 1) == 11017);
}

TEST_CASE("Local day changes only across midnight") {
    std::time_t noon = gitpet::test_support::local_noon(0);
    REQUIRE(local_day(noon) == local_day(noon + 3600));
    REQUIRE(local_day(gitpet::test_support::local_noon(1)) == local_day(noon) - 1);
}

TEST_CASE("ISO-8601 formatting and parsing") {
    REQUIRE(format_iso8601(0) == "1970-01-01T00:00:00Z");
    REQUIRE(format_iso8601(1'800'000'000) == "2027-01-15T08:00:00Z");
    REQUIRE(parse_iso8601("2027-01-15T08:00:00Z") == std::time_t{1'800'000'000});
    REQUIRE(parse_iso8601("2027-01-15T08:00:00.123Z") == std::time_t{1'800'000'000});
    REQUIRE(parse_iso8601("2027-01-15T10:00:00+02:00") == std::time_t{1'800'000'000});
    REQUIRE(parse_iso8601("2027-01-15T08:00:00") == std::time_t{1'800'000'000});
    REQUIRE_FALSE(parse_iso8601("yesterday").has_value());
    REQUIRE_FALSE(parse_iso8601("2027-13-15T08:00:00Z").has_value());
}

TEST_CASE("Timestamp has a fixed layout") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 19);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == ' ');
}

TEST_CASE("UniqueFd closes and releases") {
    int raw = open("/dev/null", O_RDONLY);
    REQUIRE(raw >= 0);
    {
        procutil::UniqueFd fd(raw);
        REQUIRE(fd);
        procutil::UniqueFd moved(std::move(fd));
        REQUIRE_FALSE(fd);
        REQUIRE(moved.get() == raw);
    }
    REQUIRE(fcntl(raw, F_GETFD) == -1);

    procutil::UniqueFd kept(open("/dev/null", O_RDONLY));
    int released = kept.release();
    REQUIRE_FALSE(kept);
    REQUIRE(fcntl(released, F_GETFD) != -1);
    close(released);
}

TEST_CASE("Home directory honours HOME") {
    const char* old = std::getenv("HOME");
    std::string saved = old ? old : "";
    setenv("HOME", "/tmp/gitpet-home", 1);
    auto home = procutil::home_directory();
    REQUIRE(home.has_value());
    REQUIRE(*home == fs::path("/tmp/gitpet-home"));
    if (old)
        setenv("HOME", saved.c_str(), 1);
    else
        unsetenv("HOME");
}

TEST_CASE("File lock excludes a second holder until released") {
    fs::path dir = gitpet::test_support::fresh_dir("gitpet_lock");
    fs::path lock = dir / "state.json.lock";
    std::atomic<bool> acquired{false};
    std::thread waiter;
    {
        procutil::FileLockGuard first(lock);
        REQUIRE(first.locked());
        REQUIRE(fs::exists(lock));
        waiter = std::thread([&] {
            procutil::FileLockGuard second(lock);
            acquired = second.locked();
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        REQUIRE_FALSE(acquired.load());
    }
    waiter.join();
    REQUIRE(acquired.load());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("File lock fails for an unreachable path") {
    procutil::FileLockGuard guard("/nonexistent-gitpet-dir/x.lock");
    REQUIRE_FALSE(guard.locked());
}

TEST_CASE("WorkerGroup joins every task") {
    std::atomic<int> done{0};
    {
        WorkerGroup group;
        for (int i = 0; i < 5; ++i)
            group.spawn([&] { ++done; });
        REQUIRE(group.size() == 5);
    }
    REQUIRE(done.load() == 5);

    WorkerGroup group;
    group.spawn([&] { ++done; });
    group.join_all();
    REQUIRE(group.size() == 0);
    REQUIRE(done.load() == 6);
}

namespace {
// Group whose thread creation fails after a fixed number of spawns.
struct LimitedGroup {
    WorkerGroup inner;
    std::size_t limit;
    template <class Fn> void spawn(Fn&& fn) {
        if (inner.size() >= limit)
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        inner.spawn(std::forward<Fn>(fn));
    }
};
} // namespace

TEST_CASE("Tasks run inline when threads cannot be created") {
    std::atomic<int> done{0};
    std::vector<std::function<void()>> tasks(7, [&] { ++done; });
    LimitedGroup group{{}, 3};
    REQUIRE(spawn_or_run(group, tasks) == 4);
    group.inner.join_all();
    REQUIRE(done.load() == 7);

    WorkerGroup unlimited;
    REQUIRE(spawn_or_run(unlimited, tasks) == 0);
    unlimited.join_all();
    REQUIRE(done.load() == 14);
}
