#include <filesystem>
#include <string>

#include "cli_commands.hpp"
#include "logger.hpp"
#include "progression.hpp"
#include "report.hpp"
#include "state_store.hpp"

namespace fs = std::filesystem;
using gitpet::AwardResult;
using gitpet::ProgressionState;
using gitpet::StateStore;

namespace cli {

namespace {

struct VisitOutcome {
    ProgressionState state;
    gitpet::VisitResult visit;
};

// Decay and first-visit bonus, plus the pet name when one was given.
VisitOutcome visit(const Options& opts, const StateStore& store, std::time_t now) {
    VisitOutcome out;
    out.state = store.update(
        [&](ProgressionState& s) {
            out.visit = gitpet::apply_visit(s, now);
            if (!opts.name.empty())
                s.name = opts.name;
        },
        now);
    if (logger_initialized() && out.visit.decay > 0)
        log_info("Vitality decayed", {{"points", std::to_string(out.visit.decay)}});
    return out;
}

gitpet::Mood current_mood(const Options& opts, const ProgressionState& state) {
    return gitpet::mood(state.vitality, opts.idle_seconds);
}

void print_pet(const Options& opts, std::ostream& out, const ProgressionState& state,
               bool leveled_up, nlohmann::json& doc) {
    gitpet::Mood m = current_mood(opts, state);
    if (opts.json) {
        doc["pet"] = gitpet::pet_to_json(state, m);
        doc["levelUp"] = leveled_up;
        return;
    }
    auto colors = gitpet::make_report_colors(opts.no_colors);
    out << gitpet::render_pet(state, m, colors);
    if (leveled_up)
        out << gitpet::render_level_up(state.level(), colors);
}

void finish(const Options& opts, std::ostream& out, const nlohmann::json& doc) {
    if (opts.json)
        out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

} // namespace

bool setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return false;
    LoggerSettings settings;
    settings.path = logging.log_file;
    settings.level = logging.log_level;
    settings.max_size = logging.max_log_size;
    settings.max_files = logging.log_files;
    settings.json = logging.json_log;
    settings.compress = logging.compress_logs;
    return init_logger(settings);
}

gitpet::ScanOptions make_scan_options(const Options& opts, std::time_t now) {
    gitpet::ScanOptions so;
    if (opts.probe.timeout)
        so.budget = gitpet::ProbeBudget::uniform(*opts.probe.timeout, opts.probe.max_output);
    else
        so.budget.max_output = opts.probe.max_output;
    so.parallel = !opts.probe.serial;
    so.now = now;
    return so;
}

int handle_scan(const Options& opts, std::ostream& out, std::time_t now) {
    StateStore store(opts.state_file);
    VisitOutcome v = visit(opts, store, now);
    gitpet::RepositoryHealth health = gitpet::scan_repository(opts.root, make_scan_options(opts, now));
    gitpet::ScanOutcome scan;
    ProgressionState state = store.update(
        [&](ProgressionState& s) { scan = gitpet::apply_scan(s, health); }, now);
    bool leveled = v.visit.award.leveled_up || scan.award.leveled_up;

    nlohmann::json doc;
    print_pet(opts, out, state, leveled, doc);
    if (opts.json) {
        doc["health"] = gitpet::health_to_json(health);
        doc["xpGained"] = v.visit.award.gained + scan.award.gained;
    } else {
        out << "\n" << gitpet::render_health(health, gitpet::make_report_colors(opts.no_colors));
    }
    finish(opts, out, doc);
    return 0;
}

int handle_status(const Options& opts, std::ostream& out, std::time_t now) {
    StateStore store(opts.state_file);
    VisitOutcome v = visit(opts, store, now);
    nlohmann::json doc;
    print_pet(opts, out, v.state, v.visit.award.leveled_up, doc);
    finish(opts, out, doc);
    return 0;
}

int handle_feed(const Options& opts, std::ostream& out, std::time_t now) {
    StateStore store(opts.state_file);
    VisitOutcome v = visit(opts, store, now);
    auto colors = gitpet::make_report_colors(opts.no_colors);
    auto ctx = gitpet::make_collector_context(opts.root, make_scan_options(opts, now));
    nlohmann::json doc;
    if (!ctx) {
        print_pet(opts, out, v.state, v.visit.award.leveled_up, doc);
        if (opts.json)
            doc["issues"] = nlohmann::json::array();
        else
            out << "\n" << gitpet::render_health(gitpet::not_a_repository(), colors);
        finish(opts, out, doc);
        return 0;
    }
    auto issues = gitpet::find_code_issues(*ctx);
    if (issues.degraded && logger_initialized())
        log_warning("Code issue search incomplete");
    AwardResult award;
    ProgressionState state = store.update(
        [&](ProgressionState& s) { award = gitpet::apply_feed(s, issues.value.size()); }, now);
    print_pet(opts, out, state, v.visit.award.leveled_up || award.leveled_up, doc);
    if (opts.json) {
        doc["issues"] = gitpet::issues_to_json(issues.value);
        doc["xpGained"] = award.gained;
    } else {
        out << "\n" << gitpet::render_feed(issues.value, award, colors);
    }
    finish(opts, out, doc);
    return 0;
}

int handle_stats(const Options& opts, std::ostream& out, std::time_t now) {
    StateStore store(opts.state_file);
    VisitOutcome v = visit(opts, store, now);
    auto colors = gitpet::make_report_colors(opts.no_colors);
    auto ctx = gitpet::make_collector_context(opts.root, make_scan_options(opts, now));
    nlohmann::json doc;
    if (!ctx) {
        print_pet(opts, out, v.state, v.visit.award.leveled_up, doc);
        if (opts.json)
            doc["stats"] = nullptr;
        else
            out << "\n" << gitpet::render_health(gitpet::not_a_repository(), colors);
        finish(opts, out, doc);
        return 0;
    }
    auto stats = gitpet::collect_repo_stats(*ctx);
    AwardResult award;
    ProgressionState state = store.update(
        [&](ProgressionState& s) { award = gitpet::award(s, gitpet::XpAction::StatCheck); },
        now);
    print_pet(opts, out, state, v.visit.award.leveled_up || award.leveled_up, doc);
    if (opts.json)
        doc["stats"] = gitpet::stats_to_json(stats.value, stats.degraded);
    else
        out << "\n" << gitpet::render_stats(stats.value, stats.degraded, colors);
    finish(opts, out, doc);
    return 0;
}

int handle_reset(const Options& opts, std::ostream& out) {
    StateStore store(opts.state_file);
    bool ok = store.reset();
    if (opts.json) {
        nlohmann::json j{{"reset", ok}, {"stateFile", store.path().string()}};
        out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else if (ok) {
        out << "Pet state removed: " << store.path().string() << "\n";
    } else {
        out << "Could not remove " << store.path().string() << "\n";
    }
    return ok ? 0 : 1;
}

int run_command(const Options& opts, std::ostream& out, std::time_t now) {
    if (logger_initialized())
        log_debug("Running command", {{"root", opts.root.string()},
                                      {"state", opts.state_file.string()}});
    switch (opts.command) {
    case Command::Status:
        return handle_status(opts, out, now);
    case Command::Feed:
        return handle_feed(opts, out, now);
    case Command::Stats:
        return handle_stats(opts, out, now);
    case Command::Reset:
        return handle_reset(opts, out);
    case Command::Scan:
        break;
    }
    return handle_scan(opts, out, now);
}

} // namespace cli
