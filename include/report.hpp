#ifndef REPORT_HPP
#define REPORT_HPP

#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "collectors.hpp"
#include "health.hpp"
#include "progression.hpp"
#include "scoring.hpp"

namespace gitpet {

/**
 * @brief ANSI escape sequences used by the text reports.
 *
 * Every member is empty when colors are disabled.
 */
struct ReportColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string gray;
    std::string bold;
    std::string magenta;
};

ReportColors make_report_colors(bool no_colors);

/// Color for a check status (green, cyan, yellow, red).
const std::string& status_color(CheckStatus status, const ReportColors& c);

/// Fixed-width bar such as `[#######---]` for a 0-100 value.
std::string progress_bar(int percent, int width = 20);

/**
 * @brief Pet block: name, mood, vitality bar, level, title and XP progress.
 */
std::string render_pet(const ProgressionState& state, Mood mood, const ReportColors& c);

/**
 * @brief One line per check plus the total, or a notice for a non-repository.
 */
std::string render_health(const RepositoryHealth& health, const ReportColors& c);

std::string render_stats(const RepoStats& stats, bool degraded, const ReportColors& c);

std::string render_feed(const std::vector<CodeIssue>& issues, const AwardResult& award,
                        const ReportColors& c);

std::string render_level_up(int level, const ReportColors& c);

nlohmann::json pet_to_json(const ProgressionState& state, Mood mood);
nlohmann::json health_to_json(const RepositoryHealth& health);
nlohmann::json stats_to_json(const RepoStats& stats, bool degraded);
nlohmann::json issues_to_json(const std::vector<CodeIssue>& issues);

} // namespace gitpet

#endif // REPORT_HPP
