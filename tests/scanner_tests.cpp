#include "test_common.hpp"
#include <stdexcept>

using namespace gitpet;
using gitpet::test_support::FakeProbe;

TEST_CASE("Scanning a plain directory returns the sentinel without probes") {
    fs::path dir = test_support::fresh_dir("gitpet_not_repo");
    FakeProbe fake;
    ScanOptions opts;
    opts.probe = fake.fn();
    RepositoryHealth h = scan_repository(dir, opts);
    REQUIRE_FALSE(h.is_git_repo);
    REQUIRE(h.checks.empty());
    REQUIRE(h.total_score == 0);
    REQUIRE(fake.call_count() == 0);
    REQUIRE_FALSE(make_collector_context(dir, opts).has_value());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Health is built from raw metrics") {
    std::time_t now = 1'800'000'000;
    RawMetrics raw;
    raw.weekly_commits.value = 10;
    raw.streak.value = 7;
    raw.changed_files.value = 0;
    raw.test_files.value = 4;
    raw.readme.value = true;
    raw.last_commit.value = now - 60;
    raw.commit_count.value = 120;
    RepositoryHealth h = build_health(raw, now);
    REQUIRE(h.is_git_repo);
    REQUIRE(h.checks.size() == 6);
    REQUIRE(h.total_score == 100);
    REQUIRE(h.commit_count == 120);
    REQUIRE(h.streak == 7);
    REQUIRE(find_check(h, kCheckWorkingTree)->value == "clean");
}

TEST_CASE("Degraded metrics lower the score but keep the scan") {
    std::time_t now = 1'800'000'000;
    RawMetrics raw;
    raw.weekly_commits.value = 10;
    raw.streak.value = 7;
    raw.test_files.value = 4;
    raw.readme.value = true;
    raw.last_commit.value = now - 60;
    raw.changed_files.degraded = true;
    RepositoryHealth h = build_health(raw, now);
    REQUIRE(h.total_score == 80);
    const HealthCheck* tree = find_check(h, kCheckWorkingTree);
    REQUIRE(tree != nullptr);
    REQUIRE(tree->degraded);
    REQUIRE(tree->score == 0);
}

TEST_CASE("Weights of a full scan sum to one hundred") {
    RepositoryHealth h = build_health(RawMetrics{}, 1'800'000'000);
    int sum = 0;
    for (const auto& c : h.checks)
        sum += c.weight;
    REQUIRE(sum == 100);
}

TEST_CASE("Collectors run concurrently") {
    FakeProbe fake;
    fake.delay = std::chrono::milliseconds(300);
    fake.reply("log", "");
    fake.reply("status", "");
    fake.reply("rev-list", "0\n");
    fake.reply("ls-files", "");
    auto ctx = test_support::fake_context(fs::temp_directory_path(), fake);

    auto start = std::chrono::steady_clock::now();
    RawMetrics raw = collect_metrics(ctx, true);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(fake.call_count() == 6);
    REQUIRE(elapsed < std::chrono::milliseconds(1200));
    REQUIRE_FALSE(raw.changed_files.degraded);
}

TEST_CASE("Serial collection issues the same probes") {
    FakeProbe fake;
    auto ctx = test_support::fake_context(fs::temp_directory_path(), fake);
    RawMetrics raw = collect_metrics(ctx, false);
    REQUIRE(fake.call_count() == 6);
    REQUIRE(raw.weekly_commits.degraded);
    REQUIRE(raw.changed_files.degraded);
    REQUIRE_FALSE(raw.readme.degraded);
}

TEST_CASE("Collector exceptions degrade a single metric") {
    auto ctx = gitpet::CollectorContext{};
    ctx.workdir = fs::temp_directory_path();
    ctx.probe = [](const procutil::ProbeSpec& spec, const fs::path&) -> procutil::ProbeResult {
        if (!spec.args.empty() && spec.args.front() == "status")
            throw std::runtime_error("boom");
        procutil::ProbeResult r;
        r.status = procutil::ProbeStatus::Ok;
        r.exit_code = 0;
        r.output = "3\n";
        return r;
    };
    RawMetrics raw = collect_metrics(ctx, true);
    REQUIRE(raw.changed_files.degraded);
    REQUIRE_FALSE(raw.commit_count.degraded);
    REQUIRE(raw.commit_count.value == 3);
}

TEST_CASE("Scanning a real repository") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    fs::path repo = test_support::fresh_dir("gitpet_scan_repo");
    test_support::init_repo(repo);
    std::time_t now = std::time(nullptr);
    test_support::write_file(repo / "README.md", "# pet\n");
    test_support::write_file(repo / "src" / "main.cpp", "int main() { return 0; }\n");
    test_support::commit_all(repo, "init", now - 2 * 86400);
    test_support::write_file(repo / "tests" / "main_test.cpp", "// TODO more\n");
    test_support::commit_all(repo, "tests", now - 60);

    ScanOptions opts;
    opts.now = now;
    RepositoryHealth h = scan_repository(repo / "src", opts);
    REQUIRE(h.is_git_repo);
    REQUIRE(fs::equivalent(h.workdir, repo));
    REQUIRE(h.commit_count == 2);
    REQUIRE(h.last_commit.has_value());
    REQUIRE(find_check(h, kCheckWorkingTree)->value == "clean");
    REQUIRE(find_check(h, kCheckReadme)->score == 100);
    REQUIRE(find_check(h, kCheckTests)->raw == 1);
    REQUIRE(find_check(h, kCheckRecency)->value == "today");
    REQUIRE(h.head.size() == 7);

    test_support::write_file(repo / "scratch.txt", "x");
    RepositoryHealth dirty = scan_repository(repo, opts);
    REQUIRE(find_check(dirty, kCheckWorkingTree)->raw == 1);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("Scanning a repository without commits") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    fs::path repo = test_support::fresh_dir("gitpet_unborn_repo");
    test_support::init_repo(repo);
    RepositoryHealth h = scan_repository(repo);
    REQUIRE(h.is_git_repo);
    REQUIRE(h.commit_count == 0);
    REQUIRE_FALSE(h.last_commit.has_value());
    REQUIRE(find_check(h, kCheckRecency)->value == "no commits");
    REQUIRE(h.head.empty());
    FS_REMOVE_ALL(repo);
}
