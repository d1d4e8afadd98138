#ifndef PROGRESSION_HPP
#define PROGRESSION_HPP

#include <cstddef>
#include <ctime>
#include <nlohmann/json.hpp>
#include <string>

#include "health.hpp"
#include "scoring.hpp"

namespace gitpet {

/**
 * @brief Durable companion state.
 *
 * The level is never stored authoritatively; level() derives it from
 * @ref experience every time.
 */
struct ProgressionState {
    long long experience = 0;
    int vitality = kDefaultVitality;
    std::time_t last_visit = 0;
    std::string name;
    std::time_t created_at = 0;
    long long total_scans = 0;
    long long total_feeds = 0;
    long long longest_streak = 0;
    long long clean_tree_count = 0;
    nlohmann::json extra = nlohmann::json::object(); ///< Keys this version does not know

    int level() const { return level_for(experience); }
};

/// Fresh state: no experience, default vitality, visited and created at @p now.
ProgressionState default_state(std::time_t now);

/**
 * @brief Serialize to the on-disk object (`xp`, `level`, `hp`, `lastVisit`...).
 *
 * Unknown keys kept in @ref ProgressionState::extra are written back
 * unchanged; `level` is always the derived value.
 */
nlohmann::json to_json(const ProgressionState& state);

/**
 * @brief Read a state object, falling back field by field to the defaults.
 *
 * Missing or mistyped fields take their default, negative experience is
 * clamped to 0, vitality to [0, 100], and any stored level is ignored.
 */
ProgressionState state_from_json(const nlohmann::json& j, std::time_t now);

/**
 * @brief Experience change and level edge of one award.
 */
struct AwardResult {
    long long gained = 0;
    bool leveled_up = false;
    int level = kMinLevel; ///< Level after the award
};

/// Add @p amount experience (non-positive amounts add nothing).
AwardResult award_xp(ProgressionState& state, long long amount);

/// Add xp_reward(@p action, @p multiplier).
AwardResult award(ProgressionState& state, XpAction action, long long multiplier = 1);

struct VisitResult {
    int decay = 0;               ///< Vitality points lost
    bool first_visit_of_day = false;
    AwardResult award;           ///< First-visit bonus, if any
};

/**
 * @brief Apply decay since the last visit, grant the first-visit-of-day bonus
 * when the local day changed, and set the last visit to @p now.
 */
VisitResult apply_visit(ProgressionState& state, std::time_t now);

struct ScanOutcome {
    bool recorded = false;  ///< `false` for a non-repository scan
    bool clean_tree = false;
    AwardResult award;
};

/**
 * @brief Fold a scan into the state.
 *
 * Only repository scans count: vitality becomes the score, counters and the
 * longest streak are updated, and scan XP is granted, plus the clean-tree
 * bonus when the working tree was clean.
 */
ScanOutcome apply_scan(ProgressionState& state, const RepositoryHealth& health);

/// Count a feed and grant feed XP for @p issue_count issues.
AwardResult apply_feed(ProgressionState& state, std::size_t issue_count);

} // namespace gitpet

#endif // PROGRESSION_HPP
