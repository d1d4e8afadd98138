#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

#include "collectors.hpp"
#include "health.hpp"
#include "probe.hpp"

namespace gitpet {

/**
 * @brief Knobs for one scan.
 */
struct ScanOptions {
    procutil::ProbeFn probe = procutil::run_probe;
    ProbeBudget budget;
    bool parallel = true;             ///< Run collectors concurrently
    std::optional<std::time_t> now;   ///< Defaults to the current time
};

/**
 * @brief Raw collector outputs for one repository, before thresholds.
 */
struct RawMetrics {
    Collected<long long> weekly_commits;
    Collected<int> streak;
    Collected<long long> changed_files;
    Collected<long long> test_files;
    Collected<bool> readme;
    Collected<std::optional<std::time_t>> last_commit;
    Collected<long long> commit_count;
};

/**
 * @brief Run every collector against @p ctx and wait for all of them.
 *
 * With @p parallel each collector runs on its own thread, so the wall time is
 * bounded by the slowest probe rather than the sum of them.
 */
RawMetrics collect_metrics(const CollectorContext& ctx, bool parallel);

/**
 * @brief Turn raw metrics into the ordered, scored check list.
 *
 * Fills everything except the repository location fields.
 */
RepositoryHealth build_health(const RawMetrics& raw, std::time_t now);

/**
 * @brief Scan the repository containing @p dir.
 *
 * Discovery happens in-process; when @p dir is not inside a work tree the
 * not_a_repository() sentinel is returned without running any probe.
 */
RepositoryHealth scan_repository(const std::filesystem::path& dir,
                                 const ScanOptions& opts = ScanOptions());

/**
 * @brief Build a collector context for the repository containing @p dir.
 *
 * @return `std::nullopt` when @p dir is not inside a work tree.
 */
std::optional<CollectorContext> make_collector_context(const std::filesystem::path& dir,
                                                       const ScanOptions& opts);

} // namespace gitpet

#endif // SCANNER_HPP
