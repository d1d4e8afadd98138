#include "scanner.hpp"

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "logger.hpp"
#include "thread_utils.hpp"

namespace fs = std::filesystem;

namespace gitpet {

namespace {

// Collectors report failure through Collected::degraded; an exception here
// is a resource failure and degrades the single metric.
template <typename T, typename Fn> void guarded(Collected<T>& out, Fn fn) {
    try {
        out = fn();
    } catch (const std::exception& e) {
        if (logger_initialized())
            log_error(std::string("Collector exception: ") + e.what());
        out = Collected<T>{};
        out.degraded = true;
    }
}

CollectorContext context_for(const git::RepoLocation& loc, const ScanOptions& opts) {
    CollectorContext ctx;
    ctx.workdir = loc.workdir;
    ctx.has_commits = !loc.unborn;
    ctx.now = opts.now ? *opts.now : std::time(nullptr);
    ctx.probe = opts.probe;
    ctx.budget = opts.budget;
    return ctx;
}

} // namespace

RawMetrics collect_metrics(const CollectorContext& ctx, bool parallel) {
    RawMetrics raw;
    std::vector<std::function<void()>> tasks = {
        [&] { guarded(raw.weekly_commits, [&] { return collect_weekly_commits(ctx); }); },
        [&] { guarded(raw.streak, [&] { return collect_streak(ctx); }); },
        [&] { guarded(raw.changed_files, [&] { return collect_changed_files(ctx); }); },
        [&] { guarded(raw.test_files, [&] { return collect_test_files(ctx); }); },
        [&] { guarded(raw.readme, [&] { return collect_readme(ctx); }); },
        [&] { guarded(raw.last_commit, [&] { return collect_last_commit(ctx); }); },
        [&] { guarded(raw.commit_count, [&] { return collect_commit_count(ctx); }); },
    };
    if (!parallel) {
        for (auto& t : tasks)
            t();
        return raw;
    }
    WorkerGroup group;
    std::size_t serial = spawn_or_run(group, tasks);
    if (serial > 0 && logger_initialized())
        log_warning("Could not start collector threads; ran them serially",
                    {{"count", std::to_string(serial)}});
    group.join_all();
    return raw;
}

RepositoryHealth build_health(const RawMetrics& raw, std::time_t now) {
    RepositoryHealth health;
    health.is_git_repo = true;
    health.checks.push_back(
        evaluate_weekly_commits(raw.weekly_commits.value, raw.weekly_commits.degraded));
    health.checks.push_back(evaluate_streak(raw.streak.value, raw.streak.degraded));
    health.checks.push_back(
        evaluate_working_tree(raw.changed_files.value, raw.changed_files.degraded));
    health.checks.push_back(evaluate_tests(raw.test_files.value, raw.test_files.degraded));
    health.checks.push_back(evaluate_readme(raw.readme.value, raw.readme.degraded));
    health.checks.push_back(
        evaluate_recency(raw.last_commit.value, now, raw.last_commit.degraded));
    health.total_score = total_score(health.checks);
    health.commit_count = raw.commit_count.value;
    health.last_commit = raw.last_commit.value;
    health.streak = raw.streak.degraded ? 0 : raw.streak.value;
    return health;
}

std::optional<CollectorContext> make_collector_context(const fs::path& dir,
                                                       const ScanOptions& opts) {
    git::GitInitGuard guard;
    std::string error;
    auto loc = git::discover_repo(dir, &error);
    if (!loc) {
        if (logger_initialized())
            log_debug("Not a repository", {{"path", dir.string()}, {"error", error}});
        return std::nullopt;
    }
    return context_for(*loc, opts);
}

RepositoryHealth scan_repository(const fs::path& dir, const ScanOptions& opts) {
    git::GitInitGuard guard;
    std::string error;
    auto loc = git::discover_repo(dir, &error);
    if (!loc) {
        if (logger_initialized())
            log_debug("Not a repository", {{"path", dir.string()}, {"error", error}});
        return not_a_repository();
    }
    CollectorContext ctx = context_for(*loc, opts);
    RawMetrics raw = collect_metrics(ctx, opts.parallel);
    RepositoryHealth health = build_health(raw, ctx.now);
    health.workdir = loc->workdir;
    health.branch = loc->branch;
    health.head = loc->head;

    if (logger_initialized()) {
        for (const auto& c : health.checks) {
            if (c.degraded)
                log_warning("Metric degraded", {{"check", c.name}});
        }
        log_info("Scan complete", {{"repo", loc->workdir.string()},
                                   {"score", std::to_string(health.total_score)}});
    }
    return health;
}

} // namespace gitpet
