#include "scoring.hpp"

#include <algorithm>
#include <cmath>

namespace gitpet {

namespace {

constexpr long long kLevelThresholds[kMaxLevel] = {0, 100, 300, 600, 1000};
const char* const kLevelTitles[kMaxLevel] = {"Puppy", "Young Dog", "Adult Dog", "Cool Dog",
                                             "Legendary Doge"};

} // namespace

const char* to_string(Mood mood) {
    switch (mood) {
    case Mood::Excited:
        return "excited";
    case Mood::Happy:
        return "happy";
    case Mood::Neutral:
        return "neutral";
    case Mood::Sad:
        return "sad";
    case Mood::Sick:
        return "sick";
    case Mood::Sleeping:
        return "sleeping";
    }
    return "neutral";
}

int vitality_from_score(int total_score) { return std::clamp(total_score, 0, 100); }

Mood mood(int vitality, long long idle_seconds) {
    if (idle_seconds >= kIdleSleepSeconds)
        return Mood::Sleeping;
    if (vitality >= 90)
        return Mood::Excited;
    if (vitality >= 70)
        return Mood::Happy;
    if (vitality >= 50)
        return Mood::Neutral;
    if (vitality >= 25)
        return Mood::Sad;
    return Mood::Sick;
}

long long level_threshold(int level) {
    level = std::clamp(level, kMinLevel, kMaxLevel);
    return kLevelThresholds[level - 1];
}

int level_for(long long experience) {
    int level = kMinLevel;
    for (int i = 0; i < kMaxLevel; ++i) {
        if (experience >= kLevelThresholds[i])
            level = i + 1;
    }
    return level;
}

bool level_up(long long old_xp, long long new_xp) { return level_for(new_xp) > level_for(old_xp); }

const char* level_title(int level) {
    return kLevelTitles[std::clamp(level, kMinLevel, kMaxLevel) - 1];
}

LevelProgress level_progress(long long experience) {
    experience = std::max(0LL, experience);
    int level = level_for(experience);
    LevelProgress p;
    p.current = experience - level_threshold(level);
    if (level == kMaxLevel) {
        p.percent = 100;
        return p;
    }
    p.needed = level_threshold(level + 1) - level_threshold(level);
    p.percent = static_cast<int>(std::min(100LL, p.current * 100 / p.needed));
    return p;
}

int decay_points(double hours_since_visit) {
    if (!(hours_since_visit >= 24.0))
        return 0;
    double days = std::floor((hours_since_visit - 24.0) / 24.0);
    double points = std::min(static_cast<double>(kDecayCap), days * 5.0);
    return static_cast<int>(points);
}

int apply_decay(int vitality, double hours_since_visit) {
    int points = decay_points(hours_since_visit);
    if (points <= 0)
        return vitality;
    return std::max(kDecayFloor, vitality - points);
}

double hours_between(std::time_t since, std::time_t now) {
    return std::max(0.0, std::difftime(now, since) / 3600.0);
}

const char* to_string(XpAction action) {
    switch (action) {
    case XpAction::Scan:
        return "scan";
    case XpAction::Feed:
        return "feed";
    case XpAction::Play:
        return "play";
    case XpAction::Trick:
        return "trick";
    case XpAction::AdvancedTrick:
        return "advanced-trick";
    case XpAction::StatCheck:
        return "stat-check";
    case XpAction::Commit:
        return "commit";
    case XpAction::SmartCommit:
        return "smart-commit";
    case XpAction::StreakDay:
        return "streak-day";
    case XpAction::CleanBonus:
        return "clean-bonus";
    case XpAction::FirstVisitOfDay:
        return "first-visit";
    }
    return "scan";
}

long long xp_reward(XpAction action, long long multiplier) {
    if (multiplier <= 0)
        return 0;
    long long base = 0;
    switch (action) {
    case XpAction::Scan:
        base = 2;
        break;
    case XpAction::Feed:
        base = 5;
        break;
    case XpAction::Play:
        base = 10;
        break;
    case XpAction::Trick:
        base = 5;
        break;
    case XpAction::AdvancedTrick:
        base = 15;
        break;
    case XpAction::StatCheck:
        base = 1;
        break;
    case XpAction::Commit:
        base = 10;
        break;
    case XpAction::SmartCommit:
        base = 15;
        break;
    case XpAction::StreakDay:
        base = 3;
        break;
    case XpAction::CleanBonus:
        base = 5;
        break;
    case XpAction::FirstVisitOfDay:
        base = 10;
        break;
    }
    return base * multiplier;
}

} // namespace gitpet
