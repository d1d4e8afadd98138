#include "test_common.hpp"

using namespace gitpet;

TEST_CASE("Total score is the rounded weighted mean") {
    std::vector<HealthCheck> checks(2);
    checks[0].score = 100;
    checks[0].weight = 30;
    checks[1].score = 0;
    checks[1].weight = 20;
    REQUIRE(total_score(checks) == 60);

    checks[1].score = 1;
    checks[1].weight = 1;
    checks[0].score = 0;
    checks[0].weight = 1;
    // 0.5 rounds up
    REQUIRE(total_score(checks) == 1);
}

TEST_CASE("Total score of nothing is zero") {
    REQUIRE(total_score({}) == 0);
    std::vector<HealthCheck> zero(1);
    zero[0].score = 100;
    zero[0].weight = 0;
    REQUIRE(total_score(zero) == 0);
}

TEST_CASE("Weekly commit thresholds") {
    REQUIRE(evaluate_weekly_commits(12).score == 100);
    REQUIRE(evaluate_weekly_commits(10).status == CheckStatus::Great);
    REQUIRE(evaluate_weekly_commits(5).score == 75);
    REQUIRE(evaluate_weekly_commits(1).score == 40);
    REQUIRE(evaluate_weekly_commits(0).score == 0);
    HealthCheck c = evaluate_weekly_commits(3);
    REQUIRE(c.name == kCheckWeeklyCommits);
    REQUIRE(c.weight == kWeightWeeklyCommits);
    REQUIRE(c.value == "3 commits");
}

TEST_CASE("Degraded metrics take the worst case") {
    HealthCheck weekly = evaluate_weekly_commits(40, true);
    REQUIRE(weekly.score == 0);
    REQUIRE(weekly.degraded);
    HealthCheck tree = evaluate_working_tree(0, true);
    REQUIRE(tree.score == 0);
    REQUIRE(tree.value == "unknown");
    REQUIRE(evaluate_tests(12, true).score == 20);
    REQUIRE(evaluate_recency(std::time_t{1000}, 1000, true).score == 0);
}

TEST_CASE("Streak thresholds") {
    REQUIRE(evaluate_streak(7).score == 100);
    REQUIRE(evaluate_streak(3).score == 70);
    REQUIRE(evaluate_streak(1).score == 40);
    REQUIRE(evaluate_streak(0).score == 0);
    REQUIRE(evaluate_streak(4).value == "4 days");
}

TEST_CASE("Working tree thresholds") {
    HealthCheck clean = evaluate_working_tree(0);
    REQUIRE(clean.score == 100);
    REQUIRE(clean.value == "clean");
    REQUIRE(evaluate_working_tree(4).score == 60);
    REQUIRE(evaluate_working_tree(5).score == 30);
    REQUIRE(evaluate_working_tree(9).score == 30);
    REQUIRE(evaluate_working_tree(10).score == 0);
    REQUIRE(evaluate_working_tree(2).value == "2 changed files");
}

TEST_CASE("Tests and README checks") {
    REQUIRE(evaluate_tests(3).score == 100);
    REQUIRE(evaluate_tests(3).value == "3 test files");
    HealthCheck none = evaluate_tests(0);
    REQUIRE(none.score == 20);
    REQUIRE(none.status == CheckStatus::Warning);
    REQUIRE(evaluate_readme(true).score == 100);
    REQUIRE(evaluate_readme(false).score == 30);
    REQUIRE(evaluate_readme(false).value == "missing");
}

TEST_CASE("Recency thresholds") {
    std::time_t now = 1'800'000'000;
    REQUIRE(evaluate_recency(std::nullopt, now).value == "no commits");
    REQUIRE(evaluate_recency(std::nullopt, now).raw == -1);
    REQUIRE(evaluate_recency(now - 3600, now).score == 100);
    REQUIRE(evaluate_recency(now - 3600, now).value == "today");
    REQUIRE(evaluate_recency(now - 30 * 3600, now).score == 70);
    REQUIRE(evaluate_recency(now - 30 * 3600, now).value == "1 days ago");
    REQUIRE(evaluate_recency(now - 100 * 3600, now).score == 40);
    REQUIRE(evaluate_recency(now - 200 * 3600, now).score == 10);
    REQUIRE(evaluate_recency(now - 200 * 3600, now).value == "8 days ago");
}

TEST_CASE("Future commit counts as just now") {
    std::time_t now = 1'800'000'000;
    HealthCheck c = evaluate_recency(now + 7200, now);
    REQUIRE(c.score == 100);
    REQUIRE(c.raw == 0);
}

TEST_CASE("Non repository sentinel") {
    RepositoryHealth h = not_a_repository();
    REQUIRE_FALSE(h.is_git_repo);
    REQUIRE(h.checks.empty());
    REQUIRE(h.total_score == 0);
    REQUIRE(find_check(h, kCheckTests) == nullptr);
}
