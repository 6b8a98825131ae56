#pragma once
#include <ctime>
#include <random>
#include <vector>
#include "BoxSchedule.hpp"
#include "CardCatalog.hpp"
#include "Progress.hpp"

/*
  Picks the next card to review:
   - cards are grouped by their current box; mastered cards drop out
   - a box is drawn with probability weight / (sum of weights of non-empty boxes)
   - a card is drawn uniformly within that box
*/
class Selector {
public:
    Selector(const BoxSchedule& schedule, std::mt19937_64& rng);

    // Gives every catalog card the player has not seen yet a fresh box-1
    // entry. Returns how many were created so the caller knows to save.
    int ensureEntries(const CardCatalog& catalog, PlayerRecord& player, std::time_t now) const;

    // nullptr when no card is eligible (empty catalog or everything mastered).
    // Cards without an entry are treated as box 1.
    const Card* select(const CardCatalog& catalog, const PlayerRecord& player) const;

    // Cards in boxes 1..N, index 0 = box 1.
    std::vector<std::vector<const Card*>> buckets(const CardCatalog& catalog, const PlayerRecord& player) const;

private:
    const BoxSchedule& schedule;
    std::mt19937_64& rng;
};
