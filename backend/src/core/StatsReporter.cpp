#include "StatsReporter.hpp"
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>
#include "../utils/TimeFormat.hpp"

StatsReporter::StatsReporter(const BoxSchedule& schedule)
    : schedule(schedule)
{
}

PlayerStats StatsReporter::compute(const PlayerRecord& player, std::time_t now) const {
    PlayerStats stats;
    stats.name = player.name;
    stats.box_counts.assign(schedule.boxCount(), 0);

    // Totals come from the per-card counters, not the history log.
    for (const auto& p : player.cards) {
        const ProgressEntry& e = p.second;
        stats.correct += e.passed;
        stats.incorrect += e.failed;

        if (schedule.isMastered(e.box)) stats.mastered++;
        else if (e.box >= 1) stats.box_counts[e.box - 1]++;
    }
    stats.total_answered = stats.correct + stats.incorrect;

    if (player.history.empty()) {
        spdlog::debug("Stats for '{}': no history", player.name);
        return stats;
    }

    stats.has_history = true;
    std::time_t midnight = TimeFormat::localMidnight(now);
    for (const auto& e : player.history) {
        if (e.timestamp >= midnight) stats.answered_today++;
    }
    stats.longest_streak_days = longestDailyStreak(player.history);

    spdlog::debug("Stats for '{}': total={} today={} streak={}",
        player.name, stats.total_answered, stats.answered_today, stats.longest_streak_days);
    return stats;
}

int StatsReporter::longestDailyStreak(const std::vector<HistoryEvent>& history) {
    if (history.empty()) return 0;

    std::vector<long long> days;
    days.reserve(history.size());
    for (const auto& e : history) {
        days.push_back(TimeFormat::utcDayNumber(e.timestamp));
    }
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());

    int longest = 1;
    int current = 1;
    for (size_t i = 1; i < days.size(); ++i) {
        if (days[i] - days[i - 1] == 1) current++;
        else current = 1;
        longest = std::max(longest, current);
    }
    return longest;
}

std::string StatsReporter::format(const PlayerStats& stats) const {
    std::ostringstream oss;
    oss << "Stats for Player: " << stats.name << "\n"
        << "Total Cards Answered: " << stats.total_answered << "\n"
        << "Correct Answers: " << stats.correct << "\n"
        << "Incorrect Answers: " << stats.incorrect << "\n";

    if (stats.has_history) {
        oss << "Cards Answered Today: " << stats.answered_today << "\n"
            << "Longest Daily Streak: " << stats.longest_streak_days << " day(s)\n";
    }
    else {
        oss << "No review history yet, so there is no time-based data to show.\n";
    }

    oss << "\nCards per Box:\n";
    for (size_t i = 0; i < stats.box_counts.size(); ++i) {
        oss << "  Box " << i + 1 << ": " << stats.box_counts[i] << "\n";
    }
    oss << "  Mastered: " << stats.mastered << "\n";
    return oss.str();
}
