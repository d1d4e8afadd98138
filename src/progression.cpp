#include "progression.hpp"

#include <algorithm>

#include "time_utils.hpp"

namespace gitpet {

namespace {

const char* const kKnownKeys[] = {"xp",         "level",      "hp",            "lastVisit",
                                  "name",       "createdAt",  "totalScans",    "totalFeeds",
                                  "longestStreak", "cleanTreeCount"};

long long read_int(const nlohmann::json& j, const char* key, long long fallback) {
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    if (it->is_number_integer() || it->is_number_unsigned())
        return it->get<long long>();
    if (it->is_number_float()) {
        double v = it->get<double>();
        // Out of range (or NaN) cannot be converted.
        if (!(v > -9.2e18 && v < 9.2e18))
            return fallback;
        return static_cast<long long>(v);
    }
    return fallback;
}

std::time_t read_time(const nlohmann::json& j, const char* key, std::time_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return fallback;
    auto t = parse_iso8601(it->get<std::string>());
    return t ? *t : fallback;
}

} // namespace

ProgressionState default_state(std::time_t now) {
    ProgressionState s;
    s.last_visit = now;
    s.created_at = now;
    return s;
}

nlohmann::json to_json(const ProgressionState& state) {
    nlohmann::json j = state.extra.is_object() ? state.extra : nlohmann::json::object();
    j["xp"] = state.experience;
    j["level"] = state.level();
    j["hp"] = state.vitality;
    j["lastVisit"] = format_iso8601(state.last_visit);
    j["name"] = state.name;
    j["createdAt"] = format_iso8601(state.created_at);
    j["totalScans"] = state.total_scans;
    j["totalFeeds"] = state.total_feeds;
    j["longestStreak"] = state.longest_streak;
    j["cleanTreeCount"] = state.clean_tree_count;
    return j;
}

ProgressionState state_from_json(const nlohmann::json& j, std::time_t now) {
    ProgressionState s = default_state(now);
    if (!j.is_object())
        return s;
    s.experience = std::max(0LL, read_int(j, "xp", 0));
    s.vitality = static_cast<int>(std::clamp(read_int(j, "hp", kDefaultVitality), 0LL, 100LL));
    s.last_visit = read_time(j, "lastVisit", now);
    s.created_at = read_time(j, "createdAt", s.last_visit);
    auto name = j.find("name");
    if (name != j.end() && name->is_string())
        s.name = name->get<std::string>();
    s.total_scans = std::max(0LL, read_int(j, "totalScans", 0));
    s.total_feeds = std::max(0LL, read_int(j, "totalFeeds", 0));
    s.longest_streak = std::max(0LL, read_int(j, "longestStreak", 0));
    s.clean_tree_count = std::max(0LL, read_int(j, "cleanTreeCount", 0));
    s.extra = j;
    for (const char* key : kKnownKeys)
        s.extra.erase(key);
    return s;
}

AwardResult award_xp(ProgressionState& state, long long amount) {
    AwardResult r;
    long long before = state.experience;
    if (amount > 0)
        state.experience += amount;
    r.gained = state.experience - before;
    r.leveled_up = level_up(before, state.experience);
    r.level = state.level();
    return r;
}

AwardResult award(ProgressionState& state, XpAction action, long long multiplier) {
    return award_xp(state, xp_reward(action, multiplier));
}

VisitResult apply_visit(ProgressionState& state, std::time_t now) {
    VisitResult r;
    double hours = hours_between(state.last_visit, now);
    int before = state.vitality;
    state.vitality = apply_decay(state.vitality, hours);
    r.decay = std::max(0, before - state.vitality);
    if (local_day(now) > local_day(state.last_visit)) {
        r.first_visit_of_day = true;
        r.award = award(state, XpAction::FirstVisitOfDay);
    } else {
        r.award.level = state.level();
    }
    state.last_visit = now;
    return r;
}

ScanOutcome apply_scan(ProgressionState& state, const RepositoryHealth& health) {
    ScanOutcome out;
    out.award.level = state.level();
    if (!health.is_git_repo)
        return out;
    out.recorded = true;
    state.vitality = vitality_from_score(health.total_score);
    state.total_scans += 1;
    state.longest_streak = std::max<long long>(state.longest_streak, health.streak);

    long long gained = xp_reward(XpAction::Scan);
    const HealthCheck* tree = find_check(health, kCheckWorkingTree);
    if (tree && !tree->degraded && tree->raw == 0) {
        out.clean_tree = true;
        state.clean_tree_count += 1;
        gained += xp_reward(XpAction::CleanBonus);
    }
    out.award = award_xp(state, gained);
    return out;
}

AwardResult apply_feed(ProgressionState& state, std::size_t issue_count) {
    state.total_feeds += 1;
    return award(state, XpAction::Feed, static_cast<long long>(issue_count));
}

} // namespace gitpet
