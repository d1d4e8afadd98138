#ifndef SCORING_HPP
#define SCORING_HPP

#include <ctime>
#include <string>

namespace gitpet {

/**
 * @brief Pure scoring and progression math. No I/O, no clocks.
 */

enum class Mood { Excited, Happy, Neutral, Sad, Sick, Sleeping };

const char* to_string(Mood mood);

inline constexpr int kMinLevel = 1;
inline constexpr int kMaxLevel = 5;
inline constexpr long long kIdleSleepSeconds = 60;
inline constexpr int kDefaultVitality = 50;
inline constexpr int kDecayFloor = 10;
inline constexpr int kDecayCap = 30;

/// Vitality mirrors the scan score, clamped to [0, 100].
int vitality_from_score(int total_score);

/**
 * @brief Mood for a vitality and an idle time.
 *
 * Idle time of at least kIdleSleepSeconds means Sleeping whatever the
 * vitality; otherwise bands are checked from the highest threshold down.
 */
Mood mood(int vitality, long long idle_seconds);

/// Experience needed to reach @p level (1-based); clamps out-of-range levels.
long long level_threshold(int level);

/// Highest plateau not above @p experience, in [1, 5].
int level_for(long long experience);

/// `true` when @p new_xp sits on a higher plateau than @p old_xp.
bool level_up(long long old_xp, long long new_xp);

const char* level_title(int level);

/**
 * @brief Position inside the current level.
 *
 * At the top level @ref needed is 0 and @ref percent is 100.
 */
struct LevelProgress {
    long long current = 0; ///< Experience earned since the level started
    long long needed = 0;  ///< Experience span of the level
    int percent = 0;       ///< 0-100, rounded down
};

LevelProgress level_progress(long long experience);

/**
 * @brief Vitality points lost after @p hours_since_visit hours away.
 *
 * Nothing during the first 24 hours, then 5 points per further full day,
 * capped at kDecayCap.
 */
int decay_points(double hours_since_visit);

/**
 * @brief Vitality after decay: unchanged without decay, otherwise
 * `max(kDecayFloor, vitality - decay_points())`.
 */
int apply_decay(int vitality, double hours_since_visit);

/// Hours between two instants, 0 when @p now precedes @p since.
double hours_between(std::time_t since, std::time_t now);

enum class XpAction {
    Scan,
    Feed,
    Play,
    Trick,
    AdvancedTrick,
    StatCheck,
    Commit,
    SmartCommit,
    StreakDay,
    CleanBonus,
    FirstVisitOfDay
};

const char* to_string(XpAction action);

/// Table value for @p action times @p multiplier; negative multipliers give 0.
long long xp_reward(XpAction action, long long multiplier = 1);

} // namespace gitpet

#endif // SCORING_HPP
