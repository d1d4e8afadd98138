#ifndef COLLECTORS_HPP
#define COLLECTORS_HPP

#include <chrono>
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "probe.hpp"

namespace gitpet {

/**
 * @brief Value produced by a collector plus whether it is a fallback.
 *
 * When @ref degraded is set the probe behind the value failed and @ref value
 * holds the collector's least favorable default.
 */
template <typename T> struct Collected {
    T value{};
    bool degraded = false;
};

/**
 * @brief Time and output budgets for the probe families.
 */
struct ProbeBudget {
    std::chrono::milliseconds quick{3000};     ///< `log -1`
    std::chrono::milliseconds standard{5000};  ///< history, status and count probes
    std::chrono::milliseconds heavy{10000};    ///< `ls-files` and `grep`
    std::size_t max_output = 1024 * 1024;

    /// Same @p timeout for every family.
    static ProbeBudget uniform(std::chrono::milliseconds timeout, std::size_t max_output);
};

/**
 * @brief Everything a collector needs to query one repository.
 */
struct CollectorContext {
    std::filesystem::path workdir;
    bool has_commits = true;  ///< `false` for an unborn HEAD; history probes are skipped
    std::time_t now = 0;
    procutil::ProbeFn probe;  ///< Usually procutil::run_probe
    ProbeBudget budget;
};

// Output parsers. All of them tolerate malformed input by skipping it.

/// One epoch timestamp per line (`%ct`); malformed lines are dropped.
std::vector<std::time_t> parse_timestamps(const std::string& text);
/// Non-empty lines.
std::vector<std::string> split_lines(const std::string& text);
/// NUL separated records as printed by `-z`.
std::vector<std::string> split_nul(const std::string& text);
/// Single non-negative integer surrounded by optional whitespace.
std::optional<long long> parse_count(const std::string& text);

/**
 * @brief Whether a tracked path follows a common test-file convention.
 *
 * Matches `.test.`/`.spec.` infixes, `_test`/`_tests` stems, a `test_`
 * prefix, anything below a `__tests__` directory, and source files below a
 * `test`, `tests` or `spec` directory.
 */
bool is_test_path(const std::string& path);

/// Lower-cased extension with its dot, or an empty string.
std::string file_extension(const std::string& path);

/// Most frequent extension and its count; ties resolve to the smaller name.
std::pair<std::string, long long> top_extension(const std::vector<std::string>& paths);

/// Mean length in bytes of the non-empty @p lines, `std::nullopt` when none.
std::optional<double> average_length(const std::vector<std::string>& lines);

// Collectors. None of them throws; a failed probe yields a degraded result.

Collected<long long> collect_weekly_commits(const CollectorContext& ctx);
Collected<int> collect_streak(const CollectorContext& ctx);
Collected<long long> collect_changed_files(const CollectorContext& ctx);
Collected<long long> collect_test_files(const CollectorContext& ctx);
Collected<bool> collect_readme(const CollectorContext& ctx);
Collected<std::optional<std::time_t>> collect_last_commit(const CollectorContext& ctx);
Collected<long long> collect_commit_count(const CollectorContext& ctx);

/**
 * @brief Secondary statistics shown as fun facts; not part of the score.
 */
struct RepoStats {
    std::optional<long long> first_commit_days; ///< Age of the oldest root commit
    long long total_commits = 0;
    long long tracked_files = 0;
    std::string top_extension;                  ///< Empty when no file has one
    long long top_extension_count = 0;
    std::optional<double> average_message_length; ///< Last 50 subjects
};

Collected<RepoStats> collect_repo_stats(const CollectorContext& ctx);

enum class IssueKind { Todo, Fixme, DebugLog };

const char* to_string(IssueKind kind);

/**
 * @brief One leftover marker found in tracked source files.
 */
struct CodeIssue {
    IssueKind kind = IssueKind::Todo;
    std::string file;
    long long line = 0;
    std::string content; ///< Trimmed, at most kIssueContentMax bytes, cut on a UTF-8 boundary
};

inline constexpr std::size_t kMaxFeedIssues = 8;
inline constexpr std::size_t kIssueContentMax = 60;

/**
 * @brief Parse `git grep -n` output (`path:line:content`).
 *
 * @param text      Probe output.
 * @param detect    `true` to classify each line as Todo or Fixme from its
 *                  content; `false` to tag every line as DebugLog.
 */
std::vector<CodeIssue> parse_grep_issues(const std::string& text, bool detect);

/**
 * @brief Find TODO/FIXME markers and leftover `console.log` calls.
 *
 * Returns at most @p limit issues, markers first.
 */
Collected<std::vector<CodeIssue>> find_code_issues(const CollectorContext& ctx,
                                                   std::size_t limit = kMaxFeedIssues);

} // namespace gitpet

#endif // COLLECTORS_HPP
