#include <sstream>
#include "help_text.hpp"
#include "report.hpp"
#include "test_common.hpp"

using namespace gitpet;

TEST_CASE("Progress bar fills proportionally") {
    REQUIRE(progress_bar(0, 10) == "[----------]");
    REQUIRE(progress_bar(50, 10) == "[#####-----]");
    REQUIRE(progress_bar(100, 4) == "[####]");
    REQUIRE(progress_bar(250, 4) == "[####]");
}

TEST_CASE("Colors can be disabled") {
    ReportColors off = make_report_colors(true);
    REQUIRE(off.reset.empty());
    REQUIRE(status_color(CheckStatus::Bad, off).empty());
    ReportColors on = make_report_colors(false);
    REQUIRE(status_color(CheckStatus::Great, on) == on.green);
    REQUIRE(status_color(CheckStatus::Bad, on) == on.red);
}

TEST_CASE("Pet rendering shows level and vitality") {
    ProgressionState s = default_state(0);
    s.name = "Rex";
    s.experience = 150;
    s.vitality = 72;
    std::string text = render_pet(s, Mood::Happy, make_report_colors(true));
    REQUIRE(text.find("Rex") != std::string::npos);
    REQUIRE(text.find("happy") != std::string::npos);
    REQUIRE(text.find("72/100") != std::string::npos);
    REQUIRE(text.find("Level 2 Young Dog") != std::string::npos);
    REQUIRE(text.find("50/200") != std::string::npos);

    s.experience = 5000;
    REQUIRE(render_pet(s, Mood::Happy, make_report_colors(true)).find("max level") !=
            std::string::npos);
}

TEST_CASE("Health rendering") {
    ReportColors c = make_report_colors(true);
    REQUIRE(render_health(not_a_repository(), c).find("Not a git repository.") !=
            std::string::npos);

    RepositoryHealth h;
    h.is_git_repo = true;
    h.branch = "main";
    h.head = "abc1234";
    h.checks = {evaluate_readme(true), evaluate_working_tree(0, true)};
    h.total_score = total_score(h.checks);
    std::string text = render_health(h, c);
    REQUIRE(text.find("(main @ abc1234)") != std::string::npos);
    REQUIRE(text.find("README") != std::string::npos);
    REQUIRE(text.find("(unavailable)") != std::string::npos);

    h.branch.clear();
    REQUIRE(render_health(h, c).find("(detached @ abc1234)") != std::string::npos);
}

TEST_CASE("Feed rendering") {
    ReportColors c = make_report_colors(true);
    REQUIRE(render_feed({}, AwardResult{}, c).find("spotless") != std::string::npos);
    CodeIssue issue;
    issue.kind = IssueKind::Fixme;
    issue.file = "src/a.cpp";
    issue.line = 9;
    issue.content = "// FIXME leak";
    AwardResult award;
    award.gained = 5;
    std::string text = render_feed({issue}, award, c);
    REQUIRE(text.find("src/a.cpp:9") != std::string::npos);
    REQUIRE(text.find("fixme") != std::string::npos);
    REQUIRE(text.find("+5 XP") != std::string::npos);
}

TEST_CASE("Stats rendering") {
    RepoStats stats;
    stats.first_commit_days = 42;
    stats.total_commits = 7;
    stats.tracked_files = 3;
    stats.top_extension = ".cpp";
    stats.top_extension_count = 2;
    stats.average_message_length = 11.6;
    std::string text = render_stats(stats, true, make_report_colors(true));
    REQUIRE(text.find("42 days old") != std::string::npos);
    REQUIRE(text.find(".cpp files (2)") != std::string::npos);
    REQUIRE(text.find("average 12 characters") != std::string::npos);
    REQUIRE(text.find("could not be gathered") != std::string::npos);
}

TEST_CASE("JSON reports use camelCase keys") {
    RepositoryHealth h;
    h.is_git_repo = true;
    h.checks = {evaluate_tests(2)};
    h.total_score = 100;
    auto hj = health_to_json(h);
    REQUIRE(hj["isGitRepo"] == true);
    REQUIRE(hj["totalScore"] == 100);
    REQUIRE(hj["lastCommit"].is_null());
    REQUIRE(hj["checks"][0]["name"] == "Tests");
    REQUIRE(hj["checks"][0]["status"] == "great");

    ProgressionState s = default_state(0);
    s.experience = 320;
    auto pj = pet_to_json(s, Mood::Sleeping);
    REQUIRE(pj["mood"] == "sleeping");
    REQUIRE(pj["level"] == 3);
    REQUIRE(pj["title"] == "Adult Dog");

    CodeIssue issue;
    issue.kind = IssueKind::DebugLog;
    issue.file = "app.js";
    issue.line = 3;
    auto ij = issues_to_json({issue});
    REQUIRE(ij.size() == 1);
    REQUIRE(ij[0]["type"] == "console");

    RepoStats stats;
    auto sj = stats_to_json(stats, false);
    REQUIRE(sj["firstCommitDays"].is_null());
    REQUIRE(sj["topExtension"]["count"] == 0);
}

TEST_CASE("Help lists every command flag") {
    std::ostringstream os;
    print_help(os, "gitpet");
    std::string text = os.str();
    for (const char* flag : {"--status", "--feed", "--stats", "--reset", "--probe-timeout",
                             "--config-yaml", "--log-file"})
        REQUIRE(text.find(flag) != std::string::npos);
}
