#include "progression.hpp"
#include "test_common.hpp"

using namespace gitpet;

static RepositoryHealth scanned(int score, long long changed, int streak) {
    RepositoryHealth h;
    h.is_git_repo = true;
    h.total_score = score;
    h.streak = streak;
    h.checks.push_back(evaluate_working_tree(changed));
    return h;
}

TEST_CASE("Default state") {
    ProgressionState s = default_state(1000);
    REQUIRE(s.experience == 0);
    REQUIRE(s.vitality == kDefaultVitality);
    REQUIRE(s.level() == 1);
    REQUIRE(s.last_visit == 1000);
    REQUIRE(s.created_at == 1000);
}

TEST_CASE("Awarding experience reports level ups") {
    ProgressionState s = default_state(0);
    s.experience = 95;
    AwardResult r = award(s, XpAction::Play);
    REQUIRE(r.gained == 10);
    REQUIRE(r.leveled_up);
    REQUIRE(r.level == 2);
    AwardResult none = award_xp(s, -50);
    REQUIRE(none.gained == 0);
    REQUIRE(s.experience == 105);
}

TEST_CASE("Scanning a clean repository") {
    ProgressionState s = default_state(0);
    ScanOutcome out = apply_scan(s, scanned(84, 0, 4));
    REQUIRE(out.recorded);
    REQUIRE(out.clean_tree);
    REQUIRE(out.award.gained == 7);
    REQUIRE(s.vitality == 84);
    REQUIRE(s.total_scans == 1);
    REQUIRE(s.clean_tree_count == 1);
    REQUIRE(s.longest_streak == 4);
}

TEST_CASE("Scanning a dirty repository") {
    ProgressionState s = default_state(0);
    s.longest_streak = 9;
    ScanOutcome out = apply_scan(s, scanned(40, 3, 2));
    REQUIRE_FALSE(out.clean_tree);
    REQUIRE(out.award.gained == 2);
    REQUIRE(s.clean_tree_count == 0);
    REQUIRE(s.longest_streak == 9);
}

TEST_CASE("Degraded working tree earns no clean bonus") {
    ProgressionState s = default_state(0);
    RepositoryHealth h = scanned(60, 0, 0);
    h.checks[0] = evaluate_working_tree(0, true);
    ScanOutcome out = apply_scan(s, h);
    REQUIRE_FALSE(out.clean_tree);
    REQUIRE(out.award.gained == 2);
}

TEST_CASE("Scanning outside a repository changes nothing") {
    ProgressionState s = default_state(0);
    s.vitality = 77;
    ScanOutcome out = apply_scan(s, not_a_repository());
    REQUIRE_FALSE(out.recorded);
    REQUIRE(s.vitality == 77);
    REQUIRE(s.total_scans == 0);
    REQUIRE(s.experience == 0);
}

TEST_CASE("Feeding scales with issues found") {
    ProgressionState s = default_state(0);
    REQUIRE(apply_feed(s, 3).gained == 15);
    REQUIRE(apply_feed(s, 0).gained == 0);
    REQUIRE(s.total_feeds == 2);
}

TEST_CASE("Visit after a long absence decays and grants the daily bonus") {
    std::time_t now = test_support::local_noon(0);
    ProgressionState s = default_state(test_support::local_noon(3, now) - 6 * 3600);
    s.vitality = 80;
    VisitResult v = apply_visit(s, now);
    REQUIRE(v.decay == 10);
    REQUIRE(s.vitality == 70);
    REQUIRE(v.first_visit_of_day);
    REQUIRE(v.award.gained == 10);
    REQUIRE(s.last_visit == now);
}

TEST_CASE("Second visit on the same day") {
    std::time_t now = test_support::local_noon(0);
    ProgressionState s = default_state(now - 1800);
    s.vitality = 80;
    VisitResult v = apply_visit(s, now);
    REQUIRE(v.decay == 0);
    REQUIRE_FALSE(v.first_visit_of_day);
    REQUIRE(s.experience == 0);
    REQUIRE(s.vitality == 80);
}

TEST_CASE("State JSON uses the stored key names") {
    ProgressionState s = default_state(1'800'000'000);
    s.experience = 320;
    s.vitality = 66;
    s.name = "Rex";
    s.total_scans = 4;
    nlohmann::json j = to_json(s);
    REQUIRE(j["xp"] == 320);
    REQUIRE(j["level"] == 3);
    REQUIRE(j["hp"] == 66);
    REQUIRE(j["name"] == "Rex");
    REQUIRE(j["lastVisit"] == "2027-01-15T08:00:00Z");
    REQUIRE(j["totalScans"] == 4);
}

TEST_CASE("State JSON is read tolerantly") {
    nlohmann::json j = {{"xp", -4},         {"hp", 250},      {"lastVisit", "garbage"},
                        {"name", 12},       {"totalFeeds", 3}, {"mood", "happy"},
                        {"level", 99}};
    ProgressionState s = state_from_json(j, 500);
    REQUIRE(s.experience == 0);
    REQUIRE(s.vitality == 100);
    REQUIRE(s.last_visit == 500);
    REQUIRE(s.name.empty());
    REQUIRE(s.total_feeds == 3);
    REQUIRE(s.level() == 1);
    REQUIRE(s.extra.contains("mood"));
    REQUIRE_FALSE(s.extra.contains("level"));
    REQUIRE(to_json(s)["mood"] == "happy");
    REQUIRE(state_from_json(nlohmann::json::array(), 7).last_visit == 7);
}

TEST_CASE("Out of range numbers fall back to defaults") {
    nlohmann::json j = {{"xp", 1e300},        {"hp", -1e300},         {"totalScans", 42.9},
                        {"totalFeeds", -1e19}, {"longestStreak", 1e18}};
    ProgressionState s = state_from_json(j, 500);
    REQUIRE(s.experience == 0);
    REQUIRE(s.vitality == kDefaultVitality);
    REQUIRE(s.total_scans == 42);
    REQUIRE(s.total_feeds == 0);
    REQUIRE(s.longest_streak == 1'000'000'000'000'000'000LL);
}
