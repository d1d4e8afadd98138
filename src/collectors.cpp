#include "collectors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <map>
#include "logger.hpp"
#include "streak.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace gitpet {

ProbeBudget ProbeBudget::uniform(std::chrono::milliseconds timeout, std::size_t max_output) {
    ProbeBudget b;
    b.quick = timeout;
    b.standard = timeout;
    b.heavy = timeout;
    b.max_output = max_output;
    return b;
}

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); })
                    .base();
    return first < last ? std::string(first, last) : std::string();
}

/// Cut @p s to at most @p max bytes without splitting a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, std::size_t max) {
    if (s.size() <= max)
        return s;
    std::size_t end = max;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80)
        --end;
    return s.substr(0, end);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string uppercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool parse_whole(const std::string& s, long long& out) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front())))
        return false;
    const char* end = s.data() + s.size();
    auto res = std::from_chars(s.data(), end, out);
    return res.ec == std::errc() && res.ptr == end;
}

// Run one git query. `std::nullopt` means the probe failed; @p no_match_exit
// names an exit code that means "empty result" rather than failure.
std::optional<std::string> run_git(const CollectorContext& ctx, std::vector<std::string> args,
                                   std::chrono::milliseconds timeout, int no_match_exit = -1) {
    if (!ctx.probe)
        return std::nullopt;
    procutil::ProbeSpec spec;
    spec.args = std::move(args);
    spec.timeout = timeout;
    spec.max_output = ctx.budget.max_output;
    procutil::ProbeResult res = ctx.probe(spec, ctx.workdir);
    if (res.ok())
        return std::move(res.output);
    if (res.status == procutil::ProbeStatus::NonZeroExit && no_match_exit >= 0 &&
        res.exit_code == no_match_exit)
        return std::string();
    if (logger_initialized()) {
        log_debug("Probe failed", {{"args", spec.args.empty() ? "" : spec.args.front()},
                                   {"status", procutil::to_string(res.status)},
                                   {"exit", std::to_string(res.exit_code)},
                                   {"ms", std::to_string(res.elapsed.count())}});
    }
    return std::nullopt;
}

bool has_source_extension(const std::string& ext) {
    static const char* const kSource[] = {".c",  ".cc", ".cpp", ".cxx", ".h",  ".hpp",
                                          ".js", ".jsx", ".ts", ".tsx", ".py", ".rb",
                                          ".go", ".rs", ".java", ".kt", ".cs", ".swift"};
    return std::find(std::begin(kSource), std::end(kSource), ext) != std::end(kSource);
}

} // namespace

std::vector<std::time_t> parse_timestamps(const std::string& text) {
    std::vector<std::time_t> out;
    for (const auto& line : split_lines(text)) {
        long long v = 0;
        if (parse_whole(trim(line), v))
            out.push_back(static_cast<std::time_t>(v));
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos
                                                                      : nl - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!trim(line).empty())
            out.push_back(line);
        if (nl == std::string::npos)
            break;
        start = nl + 1;
    }
    return out;
}

std::vector<std::string> split_nul(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\0', start);
        if (end == std::string::npos)
            end = text.size();
        if (end > start)
            out.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

std::optional<long long> parse_count(const std::string& text) {
    long long v = 0;
    if (!parse_whole(trim(text), v))
        return std::nullopt;
    return v;
}

std::string file_extension(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    std::size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
        return "";
    return lowercase(name.substr(dot));
}

bool is_test_path(const std::string& path) {
    fs::path p(path);
    std::string name = lowercase(p.filename().string());
    if (name.find(".test.") != std::string::npos || name.find(".spec.") != std::string::npos)
        return true;
    std::string stem = lowercase(p.stem().string());
    auto ends_with = [&](const std::string& suffix) {
        return stem.size() > suffix.size() &&
               stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    bool source = has_source_extension(file_extension(path));
    if (source && (ends_with("_test") || ends_with("_tests") || stem.rfind("test_", 0) == 0))
        return true;
    for (auto it = p.begin(); it != p.end(); ++it) {
        if (std::next(it) == p.end())
            break;
        std::string dir = lowercase(it->string());
        if (dir == "__tests__")
            return true;
        if (source && (dir == "test" || dir == "tests" || dir == "spec"))
            return true;
    }
    return false;
}

std::pair<std::string, long long> top_extension(const std::vector<std::string>& paths) {
    std::map<std::string, long long> counts;
    for (const auto& p : paths) {
        std::string ext = file_extension(p);
        if (!ext.empty())
            ++counts[ext];
    }
    std::pair<std::string, long long> best{"", 0};
    for (const auto& [ext, n] : counts) {
        if (n > best.second)
            best = {ext, n};
    }
    return best;
}

std::optional<double> average_length(const std::vector<std::string>& lines) {
    long long total = 0;
    long long n = 0;
    for (const auto& l : lines) {
        std::string t = trim(l);
        if (t.empty())
            continue;
        total += static_cast<long long>(t.size());
        ++n;
    }
    if (n == 0)
        return std::nullopt;
    return static_cast<double>(total) / static_cast<double>(n);
}

Collected<long long> collect_weekly_commits(const CollectorContext& ctx) {
    if (!ctx.has_commits)
        return {0, false};
    auto out = run_git(ctx, {"log", "--since=8.days.ago", "--format=%ct"}, ctx.budget.standard);
    if (!out)
        return {0, true};
    return {count_in_window(parse_timestamps(*out), local_day(ctx.now), 7), false};
}

Collected<int> collect_streak(const CollectorContext& ctx) {
    if (!ctx.has_commits)
        return {0, false};
    auto out = run_git(ctx, {"log", "-100", "--format=%ct"}, ctx.budget.standard);
    if (!out)
        return {0, true};
    return {compute_streak(distinct_days_desc(parse_timestamps(*out)), local_day(ctx.now)),
            false};
}

Collected<long long> collect_changed_files(const CollectorContext& ctx) {
    auto out = run_git(ctx, {"status", "--porcelain"}, ctx.budget.standard);
    if (!out)
        return {0, true};
    return {static_cast<long long>(split_lines(*out).size()), false};
}

Collected<long long> collect_test_files(const CollectorContext& ctx) {
    auto out = run_git(ctx, {"ls-files", "-z"}, ctx.budget.heavy);
    if (!out)
        return {0, true};
    auto paths = split_nul(*out);
    return {std::count_if(paths.begin(), paths.end(), is_test_path), false};
}

Collected<bool> collect_readme(const CollectorContext& ctx) {
    static const char* const kNames[] = {"README.md",  "README",    "README.txt",
                                         "README.rst", "readme.md", "Readme.md",
                                         "README.markdown"};
    for (const char* name : kNames) {
        std::error_code ec;
        if (fs::is_regular_file(ctx.workdir / name, ec))
            return {true, false};
    }
    return {false, false};
}

Collected<std::optional<std::time_t>> collect_last_commit(const CollectorContext& ctx) {
    if (!ctx.has_commits)
        return {std::nullopt, false};
    auto out = run_git(ctx, {"log", "-1", "--format=%ct"}, ctx.budget.quick);
    if (!out)
        return {std::nullopt, true};
    auto stamps = parse_timestamps(*out);
    if (stamps.empty())
        return {std::nullopt, false};
    return {stamps.front(), false};
}

Collected<long long> collect_commit_count(const CollectorContext& ctx) {
    if (!ctx.has_commits)
        return {0, false};
    auto out = run_git(ctx, {"rev-list", "--count", "HEAD"}, ctx.budget.standard);
    if (!out)
        return {0, true};
    auto n = parse_count(*out);
    if (!n)
        return {0, true};
    return {*n, false};
}

Collected<RepoStats> collect_repo_stats(const CollectorContext& ctx) {
    Collected<RepoStats> result;
    RepoStats& stats = result.value;

    auto files = run_git(ctx, {"ls-files", "-z"}, ctx.budget.heavy);
    if (files) {
        auto paths = split_nul(*files);
        stats.tracked_files = static_cast<long long>(paths.size());
        auto [ext, count] = top_extension(paths);
        stats.top_extension = ext;
        stats.top_extension_count = count;
    } else {
        result.degraded = true;
    }
    if (!ctx.has_commits)
        return result;

    auto count = collect_commit_count(ctx);
    stats.total_commits = count.value;
    result.degraded = result.degraded || count.degraded;

    // Every root commit, in case of merged unrelated histories.
    auto roots = run_git(ctx, {"log", "--max-parents=0", "--format=%ct", "HEAD"},
                         ctx.budget.standard);
    if (roots) {
        auto stamps = parse_timestamps(*roots);
        if (!stamps.empty()) {
            std::time_t first = *std::min_element(stamps.begin(), stamps.end());
            double secs = std::max(0.0, std::difftime(ctx.now, first));
            stats.first_commit_days = static_cast<long long>(secs / 86400.0);
        }
    } else {
        result.degraded = true;
    }

    auto subjects = run_git(ctx, {"log", "-50", "--format=%s"}, ctx.budget.standard);
    if (subjects)
        stats.average_message_length = average_length(split_lines(*subjects));
    else
        result.degraded = true;
    return result;
}

const char* to_string(IssueKind kind) {
    switch (kind) {
    case IssueKind::Todo:
        return "todo";
    case IssueKind::Fixme:
        return "fixme";
    case IssueKind::DebugLog:
        return "console";
    }
    return "todo";
}

std::vector<CodeIssue> parse_grep_issues(const std::string& text, bool detect) {
    std::vector<CodeIssue> out;
    for (const auto& line : split_lines(text)) {
        std::size_t c1 = line.find(':');
        if (c1 == std::string::npos || c1 == 0)
            continue;
        std::size_t c2 = line.find(':', c1 + 1);
        if (c2 == std::string::npos)
            continue;
        long long number = 0;
        if (!parse_whole(line.substr(c1 + 1, c2 - c1 - 1), number))
            continue;
        CodeIssue issue;
        issue.file = line.substr(0, c1);
        issue.line = number;
        issue.content = utf8_prefix(trim(line.substr(c2 + 1)), kIssueContentMax);
        if (!detect)
            issue.kind = IssueKind::DebugLog;
        else if (uppercase(issue.content).find("FIXME") != std::string::npos)
            issue.kind = IssueKind::Fixme;
        else
            issue.kind = IssueKind::Todo;
        out.push_back(std::move(issue));
    }
    return out;
}

Collected<std::vector<CodeIssue>> find_code_issues(const CollectorContext& ctx,
                                                   std::size_t limit) {
    Collected<std::vector<CodeIssue>> result;
    // git grep exits with 1 when nothing matches.
    auto markers = run_git(ctx,
                           {"grep", "-n", "-I", "-E", "TODO|FIXME", "--", "*.ts", "*.js", "*.tsx",
                            "*.jsx", "*.py", "*.rb", "*.go", "*.c", "*.cc", "*.cpp", "*.h",
                            "*.hpp", "*.rs", "*.java"},
                           ctx.budget.heavy, 1);
    auto logs = run_git(ctx, {"grep", "-n", "-I", "-F", "console.log", "--", "*.ts", "*.js",
                              "*.tsx", "*.jsx"},
                        ctx.budget.heavy, 1);
    if (markers) {
        for (auto& i : parse_grep_issues(*markers, true))
            result.value.push_back(std::move(i));
    } else {
        result.degraded = true;
    }
    if (logs) {
        for (auto& i : parse_grep_issues(*logs, false))
            result.value.push_back(std::move(i));
    } else {
        result.degraded = true;
    }
    if (result.value.size() > limit)
        result.value.resize(limit);
    return result;
}

} // namespace gitpet
