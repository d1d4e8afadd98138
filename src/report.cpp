#include "report.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "time_utils.hpp"

namespace gitpet {

ReportColors make_report_colors(bool no_colors) {
    if (no_colors)
        return ReportColors{};
    return {"\033[0m",  "\033[32m", "\033[33m", "\033[31m",
            "\033[36m", "\033[90m", "\033[1m",  "\033[35m"};
}

const std::string& status_color(CheckStatus status, const ReportColors& c) {
    switch (status) {
    case CheckStatus::Great:
        return c.green;
    case CheckStatus::Ok:
        return c.cyan;
    case CheckStatus::Warning:
        return c.yellow;
    case CheckStatus::Bad:
        return c.red;
    }
    return c.reset;
}

static const char* status_icon(CheckStatus status) {
    switch (status) {
    case CheckStatus::Great:
        return "++";
    case CheckStatus::Ok:
        return "+ ";
    case CheckStatus::Warning:
        return "! ";
    case CheckStatus::Bad:
        return "x ";
    }
    return "  ";
}

static const char* mood_face(Mood mood) {
    switch (mood) {
    case Mood::Excited:
        return "(^o^)";
    case Mood::Happy:
        return "(^_^)";
    case Mood::Neutral:
        return "(-_-)";
    case Mood::Sad:
        return "(;_;)";
    case Mood::Sick:
        return "(x_x)";
    case Mood::Sleeping:
        return "(-.-) zZ";
    }
    return "(-_-)";
}

std::string progress_bar(int percent, int width) {
    percent = std::clamp(percent, 0, 100);
    int filled = percent * width / 100;
    return "[" + std::string(static_cast<size_t>(filled), '#') +
           std::string(static_cast<size_t>(width - filled), '-') + "]";
}

std::string render_pet(const ProgressionState& state, Mood mood, const ReportColors& c) {
    std::ostringstream ss;
    int level = state.level();
    LevelProgress lp = level_progress(state.experience);
    std::string name = state.name.empty() ? "Your pet" : state.name;
    const std::string& hp_color =
        state.vitality >= 70 ? c.green : (state.vitality >= 25 ? c.yellow : c.red);
    ss << c.bold << name << c.reset << " " << mood_face(mood) << "  " << c.gray << to_string(mood)
       << c.reset << "\n";
    ss << "  HP    " << hp_color << progress_bar(state.vitality) << c.reset << " "
       << state.vitality << "/100\n";
    ss << "  Level " << level << " " << c.magenta << level_title(level) << c.reset << "\n";
    if (lp.needed > 0) {
        ss << "  XP    " << c.cyan << progress_bar(lp.percent) << c.reset << " " << lp.current
           << "/" << lp.needed << " (" << state.experience << " total)\n";
    } else {
        ss << "  XP    " << c.cyan << progress_bar(100) << c.reset << " " << state.experience
           << " total, max level\n";
    }
    ss << "  Scans " << state.total_scans << "  Feeds " << state.total_feeds
       << "  Best streak " << state.longest_streak << "\n";
    return ss.str();
}

std::string render_health(const RepositoryHealth& health, const ReportColors& c) {
    std::ostringstream ss;
    if (!health.is_git_repo) {
        ss << c.yellow << "Not a git repository." << c.reset
           << " Run gitpet inside a work tree to check its health.\n";
        return ss.str();
    }
    ss << c.bold << "Repository health" << c.reset;
    std::string where = !health.branch.empty() ? health.branch
                                               : (health.head.empty() ? "" : "detached");
    if (!where.empty()) {
        ss << " " << c.gray << "(" << where;
        if (!health.head.empty())
            ss << " @ " << health.head;
        ss << ")" << c.reset;
    }
    ss << "\n";
    size_t width = 0;
    for (const auto& check : health.checks)
        width = std::max(width, check.name.size());
    for (const auto& check : health.checks) {
        const std::string& col = status_color(check.status, c);
        ss << "  " << col << status_icon(check.status) << c.reset << " " << std::left
           << std::setw(static_cast<int>(width) + 2) << check.name << col << check.value
           << c.reset;
        if (check.degraded)
            ss << " " << c.gray << "(unavailable)" << c.reset;
        ss << "\n";
    }
    ss << "  Score " << progress_bar(health.total_score) << " " << health.total_score << "/100"
       << "  Streak " << health.streak << "  Commits " << health.commit_count << "\n";
    return ss.str();
}

std::string render_stats(const RepoStats& stats, bool degraded, const ReportColors& c) {
    std::ostringstream ss;
    ss << c.bold << "Fun facts" << c.reset << "\n";
    if (stats.first_commit_days)
        ss << "  This repository is " << *stats.first_commit_days << " days old.\n";
    ss << "  " << stats.total_commits << " commits across " << stats.tracked_files
       << " tracked files.\n";
    if (!stats.top_extension.empty())
        ss << "  Favourite food: " << stats.top_extension << " files (" << stats.top_extension_count
           << ").\n";
    if (stats.average_message_length)
        ss << "  Commit subjects average "
           << static_cast<long long>(std::lround(*stats.average_message_length))
           << " characters.\n";
    if (degraded)
        ss << "  " << c.gray << "Some facts could not be gathered." << c.reset << "\n";
    return ss.str();
}

std::string render_feed(const std::vector<CodeIssue>& issues, const AwardResult& award,
                        const ReportColors& c) {
    std::ostringstream ss;
    if (issues.empty()) {
        ss << "Nothing to eat, the code is spotless.\n";
        return ss.str();
    }
    ss << c.bold << "Yum! Found " << issues.size() << " snacks" << c.reset << "\n";
    for (const auto& i : issues) {
        const std::string& col = i.kind == IssueKind::Fixme ? c.red : c.yellow;
        ss << "  " << col << std::left << std::setw(8) << to_string(i.kind) << c.reset << c.gray
           << i.file << ":" << i.line << c.reset << "  " << i.content << "\n";
    }
    ss << "  +" << award.gained << " XP\n";
    return ss.str();
}

std::string render_level_up(int level, const ReportColors& c) {
    std::ostringstream ss;
    ss << c.magenta << c.bold << "LEVEL UP! " << c.reset << "Now level " << level << ": "
       << level_title(level) << "\n";
    return ss.str();
}

nlohmann::json pet_to_json(const ProgressionState& state, Mood mood) {
    LevelProgress lp = level_progress(state.experience);
    nlohmann::json j;
    j["name"] = state.name;
    j["mood"] = to_string(mood);
    j["vitality"] = state.vitality;
    j["experience"] = state.experience;
    j["level"] = state.level();
    j["title"] = level_title(state.level());
    j["progress"] = {{"current", lp.current}, {"needed", lp.needed}, {"percent", lp.percent}};
    j["lastVisit"] = format_iso8601(state.last_visit);
    j["totalScans"] = state.total_scans;
    j["totalFeeds"] = state.total_feeds;
    j["longestStreak"] = state.longest_streak;
    j["cleanTreeCount"] = state.clean_tree_count;
    return j;
}

nlohmann::json health_to_json(const RepositoryHealth& health) {
    nlohmann::json j;
    j["isGitRepo"] = health.is_git_repo;
    j["totalScore"] = health.total_score;
    j["commitCount"] = health.commit_count;
    j["streak"] = health.streak;
    j["lastCommit"] = health.last_commit ? nlohmann::json(format_iso8601(*health.last_commit))
                                         : nlohmann::json(nullptr);
    j["branch"] = health.branch;
    j["head"] = health.head;
    j["checks"] = nlohmann::json::array();
    for (const auto& c : health.checks) {
        j["checks"].push_back({{"name", c.name},
                               {"status", to_string(c.status)},
                               {"value", c.value},
                               {"weight", c.weight},
                               {"score", c.score},
                               {"raw", c.raw},
                               {"degraded", c.degraded}});
    }
    return j;
}

nlohmann::json stats_to_json(const RepoStats& stats, bool degraded) {
    nlohmann::json j;
    j["firstCommitDays"] = stats.first_commit_days ? nlohmann::json(*stats.first_commit_days)
                                                   : nlohmann::json(nullptr);
    j["totalCommits"] = stats.total_commits;
    j["trackedFiles"] = stats.tracked_files;
    j["topExtension"] = {{"ext", stats.top_extension}, {"count", stats.top_extension_count}};
    j["avgCommitMessageLength"] = stats.average_message_length
                                      ? nlohmann::json(*stats.average_message_length)
                                      : nlohmann::json(nullptr);
    j["degraded"] = degraded;
    return j;
}

nlohmann::json issues_to_json(const std::vector<CodeIssue>& issues) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& i : issues) {
        arr.push_back({{"type", to_string(i.kind)},
                       {"file", i.file},
                       {"line", i.line},
                       {"content", i.content}});
    }
    return arr;
}

} // namespace gitpet
