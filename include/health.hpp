#ifndef HEALTH_HPP
#define HEALTH_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitpet {

/**
 * @brief Display category of one evaluated metric.
 *
 * The lowercase names returned by to_string() are matched by achievement and
 * challenge code, so they must not change.
 */
enum class CheckStatus { Great, Ok, Warning, Bad };

const char* to_string(CheckStatus status);

// Check names are matched verbatim by downstream consumers.
inline constexpr const char* kCheckWeeklyCommits = "Commits this week";
inline constexpr const char* kCheckStreak = "Commit streak";
inline constexpr const char* kCheckWorkingTree = "Working tree";
inline constexpr const char* kCheckTests = "Tests";
inline constexpr const char* kCheckReadme = "README";
inline constexpr const char* kCheckRecency = "Last activity";

inline constexpr int kWeightWeeklyCommits = 30;
inline constexpr int kWeightStreak = 15;
inline constexpr int kWeightWorkingTree = 20;
inline constexpr int kWeightTests = 15;
inline constexpr int kWeightReadme = 5;
inline constexpr int kWeightRecency = 15;
static_assert(kWeightWeeklyCommits + kWeightStreak + kWeightWorkingTree + kWeightTests +
                      kWeightReadme + kWeightRecency ==
                  100,
              "metric weights must sum to 100");

/**
 * @brief One weighted, scored metric produced by a scan.
 */
struct HealthCheck {
    std::string name;                       ///< One of the kCheck* names
    CheckStatus status = CheckStatus::Bad;  ///< Display category
    std::string value;                      ///< Human readable summary ("3 commits")
    int weight = 0;                         ///< Percentage weight in the total
    int score = 0;                          ///< 0-100
    long long raw = 0;                      ///< Raw measurement behind @ref value
    bool degraded = false;                  ///< Probe failed, worst-case default used
};

/**
 * @brief Result of one repository scan.
 *
 * Either a full scan of a repository or the not_a_repository() sentinel.
 */
struct RepositoryHealth {
    bool is_git_repo = false;
    std::vector<HealthCheck> checks;
    int total_score = 0;
    long long commit_count = 0;
    std::optional<std::time_t> last_commit;
    int streak = 0;
    std::filesystem::path workdir; ///< Work tree root, empty for the sentinel
    std::string branch;
    std::string head;              ///< Short HEAD hash
};

/**
 * @brief The canonical "not a repository" result: no checks, zero score.
 */
RepositoryHealth not_a_repository();

/**
 * @brief Weight-normalized weighted mean of the check scores.
 *
 * Computes `round(sum(score * weight) / sum(weight))` with halves rounded up
 * and clamps the result to [0, 100]. Returns 0 for an empty list or when the
 * weights sum to zero.
 */
int total_score(const std::vector<HealthCheck>& checks);

/**
 * @brief Find a check by name.
 *
 * @return Pointer into @p health or `nullptr` when absent.
 */
const HealthCheck* find_check(const RepositoryHealth& health, const std::string& name);

// Threshold tables turning raw measurements into checks. A degraded input
// always yields that metric's worst score.
HealthCheck evaluate_weekly_commits(long long commits, bool degraded = false);
HealthCheck evaluate_streak(int days, bool degraded = false);
HealthCheck evaluate_working_tree(long long changed_files, bool degraded = false);
HealthCheck evaluate_tests(long long test_files, bool degraded = false);
HealthCheck evaluate_readme(bool present, bool degraded = false);
HealthCheck evaluate_recency(const std::optional<std::time_t>& last_commit, std::time_t now,
                             bool degraded = false);

} // namespace gitpet

#endif // HEALTH_HPP
