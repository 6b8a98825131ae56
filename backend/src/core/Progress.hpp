#pragma once
#include <ctime>
#include <map>
#include <string>
#include <vector>

// Review state of one card for one player.
struct ProgressEntry {
    int box = 1;                  // 1..N while in rotation, > N once mastered
    int streak = 0;               // Consecutive correct answers
    int passed = 0;
    int failed = 0;
    std::time_t last_reviewed = 0;
};

// One answered card. History is append-only.
struct HistoryEvent {
    std::string card_id;
    std::time_t timestamp = 0;
    bool correct = false;
};

struct PlayerRecord {
    std::string name;
    int total_answered = 0;       // Always history.size()
    std::map<std::string, ProgressEntry> cards;
    std::vector<HistoryEvent> history;
};

// player id -> record; the whole file is rewritten on every change.
using ProgressCollection = std::map<std::string, PlayerRecord>;
