#include "health.hpp"

#include <algorithm>

namespace gitpet {

const char* to_string(CheckStatus status) {
    switch (status) {
    case CheckStatus::Great:
        return "great";
    case CheckStatus::Ok:
        return "ok";
    case CheckStatus::Warning:
        return "warning";
    case CheckStatus::Bad:
        return "bad";
    }
    return "bad";
}

RepositoryHealth not_a_repository() { return RepositoryHealth{}; }

int total_score(const std::vector<HealthCheck>& checks) {
    long long weighted = 0;
    long long weights = 0;
    for (const auto& c : checks) {
        weighted += static_cast<long long>(c.score) * c.weight;
        weights += c.weight;
    }
    if (weights <= 0)
        return 0;
    long long rounded = (2 * weighted + weights) / (2 * weights);
    if (weighted < 0)
        rounded = 0;
    return static_cast<int>(std::clamp(rounded, 0LL, 100LL));
}

const HealthCheck* find_check(const RepositoryHealth& health, const std::string& name) {
    for (const auto& c : health.checks) {
        if (c.name == name)
            return &c;
    }
    return nullptr;
}

static HealthCheck make_check(const char* name, int weight, CheckStatus status, int score,
                              std::string value, long long raw, bool degraded) {
    HealthCheck c;
    c.name = name;
    c.weight = weight;
    c.status = status;
    c.score = score;
    c.value = std::move(value);
    c.raw = raw;
    c.degraded = degraded;
    return c;
}

HealthCheck evaluate_weekly_commits(long long commits, bool degraded) {
    if (degraded)
        commits = 0;
    std::string value = std::to_string(commits) + " commits";
    if (commits >= 10)
        return make_check(kCheckWeeklyCommits, kWeightWeeklyCommits, CheckStatus::Great, 100,
                          value, commits, degraded);
    if (commits >= 5)
        return make_check(kCheckWeeklyCommits, kWeightWeeklyCommits, CheckStatus::Ok, 75, value,
                          commits, degraded);
    if (commits >= 1)
        return make_check(kCheckWeeklyCommits, kWeightWeeklyCommits, CheckStatus::Warning, 40,
                          value, commits, degraded);
    return make_check(kCheckWeeklyCommits, kWeightWeeklyCommits, CheckStatus::Bad, 0, value, 0,
                      degraded);
}

HealthCheck evaluate_streak(int days, bool degraded) {
    if (degraded || days < 0)
        days = 0;
    std::string value = std::to_string(days) + " days";
    if (days >= 7)
        return make_check(kCheckStreak, kWeightStreak, CheckStatus::Great, 100, value, days,
                          degraded);
    if (days >= 3)
        return make_check(kCheckStreak, kWeightStreak, CheckStatus::Ok, 70, value, days,
                          degraded);
    if (days >= 1)
        return make_check(kCheckStreak, kWeightStreak, CheckStatus::Warning, 40, value, days,
                          degraded);
    return make_check(kCheckStreak, kWeightStreak, CheckStatus::Bad, 0, value, 0, degraded);
}

HealthCheck evaluate_working_tree(long long changed_files, bool degraded) {
    if (degraded)
        return make_check(kCheckWorkingTree, kWeightWorkingTree, CheckStatus::Bad, 0, "unknown",
                          0, true);
    if (changed_files <= 0)
        return make_check(kCheckWorkingTree, kWeightWorkingTree, CheckStatus::Great, 100, "clean",
                          0, false);
    std::string value = std::to_string(changed_files) + " changed files";
    if (changed_files < 5)
        return make_check(kCheckWorkingTree, kWeightWorkingTree, CheckStatus::Ok, 60, value,
                          changed_files, false);
    if (changed_files < 10)
        return make_check(kCheckWorkingTree, kWeightWorkingTree, CheckStatus::Warning, 30, value,
                          changed_files, false);
    return make_check(kCheckWorkingTree, kWeightWorkingTree, CheckStatus::Bad, 0, value,
                      changed_files, false);
}

HealthCheck evaluate_tests(long long test_files, bool degraded) {
    if (!degraded && test_files > 0)
        return make_check(kCheckTests, kWeightTests, CheckStatus::Great, 100,
                          std::to_string(test_files) + " test files", test_files, false);
    return make_check(kCheckTests, kWeightTests, CheckStatus::Warning, 20, "no tests found", 0,
                      degraded);
}

HealthCheck evaluate_readme(bool present, bool degraded) {
    if (!degraded && present)
        return make_check(kCheckReadme, kWeightReadme, CheckStatus::Great, 100, "present", 1,
                          false);
    return make_check(kCheckReadme, kWeightReadme, CheckStatus::Warning, 30, "missing", 0,
                      degraded);
}

HealthCheck evaluate_recency(const std::optional<std::time_t>& last_commit, std::time_t now,
                             bool degraded) {
    if (degraded || !last_commit)
        return make_check(kCheckRecency, kWeightRecency, CheckStatus::Bad, 0, "no commits", -1,
                          degraded);
    // A commit stamped in the future counts as just now.
    double seconds = std::max(0.0, std::difftime(now, *last_commit));
    double hours = seconds / 3600.0;
    long long hours_whole = static_cast<long long>(hours);
    std::string days_ago = std::to_string(hours_whole / 24) + " days ago";
    if (hours < 24)
        return make_check(kCheckRecency, kWeightRecency, CheckStatus::Great, 100, "today",
                          hours_whole, false);
    if (hours < 72)
        return make_check(kCheckRecency, kWeightRecency, CheckStatus::Ok, 70, days_ago,
                          hours_whole, false);
    if (hours < 168)
        return make_check(kCheckRecency, kWeightRecency, CheckStatus::Warning, 40, days_ago,
                          hours_whole, false);
    return make_check(kCheckRecency, kWeightRecency, CheckStatus::Bad, 10, days_ago, hours_whole,
                      false);
}

} // namespace gitpet
