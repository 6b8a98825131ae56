#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "BoxSchedule.hpp"
#include "Progress.hpp"

struct PlayerStats {
    std::string name;
    int total_answered = 0;
    int correct = 0;
    int incorrect = 0;

    bool has_history = false;     // time-based fields are only valid when true
    int answered_today = 0;
    int longest_streak_days = 0;

    std::vector<int> box_counts;  // index 0 = box 1
    int mastered = 0;
};

class StatsReporter {
public:
    explicit StatsReporter(const BoxSchedule& schedule);

    PlayerStats compute(const PlayerRecord& player, std::time_t now) const;

    // Multi-line report; the first six labels are scraped by the editor plugin.
    std::string format(const PlayerStats& stats) const;

    // Longest run of consecutive UTC calendar days with at least one answer.
    static int longestDailyStreak(const std::vector<HistoryEvent>& history);

private:
    const BoxSchedule& schedule;
};
