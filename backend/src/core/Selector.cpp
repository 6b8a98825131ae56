#include "Selector.hpp"
#include <spdlog/spdlog.h>
#include "WeightedSampler.hpp"

Selector::Selector(const BoxSchedule& schedule, std::mt19937_64& rng)
    : schedule(schedule), rng(rng)
{
}

int Selector::ensureEntries(const CardCatalog& catalog, PlayerRecord& player, std::time_t now) const {
    int created = 0;
    for (const auto& card : catalog.cards()) {
        if (player.cards.count(card.id)) continue;

        ProgressEntry entry;
        entry.box = 1;
        entry.last_reviewed = now;
        player.cards.emplace(card.id, entry);
        ++created;
    }
    if (created > 0)
        spdlog::info("Initialized progress for {} new card(s)", created);
    return created;
}

std::vector<std::vector<const Card*>> Selector::buckets(const CardCatalog& catalog, const PlayerRecord& player) const {
    std::vector<std::vector<const Card*>> boxes(schedule.boxCount());

    for (const auto& card : catalog.cards()) {
        int box = 1;
        auto it = player.cards.find(card.id);
        if (it != player.cards.end()) box = it->second.box;

        if (box < 1 || box > schedule.boxCount()) continue;
        boxes[box - 1].push_back(&card);
    }
    return boxes;
}

const Card* Selector::select(const CardCatalog& catalog, const PlayerRecord& player) const {
    auto boxes = buckets(catalog, player);

    std::vector<int> weights(boxes.size(), 0);
    for (size_t i = 0; i < boxes.size(); ++i) {
        if (!boxes[i].empty()) weights[i] = schedule.weightFor(static_cast<int>(i) + 1);
    }

    WeightedSampler sampler(weights);
    if (sampler.empty()) {
        spdlog::info("No eligible cards left ({} in catalog)", catalog.size());
        return nullptr;
    }

    size_t boxIndex = sampler.sample(rng);
    const auto& members = boxes[boxIndex];

    std::uniform_int_distribution<size_t> pick(0, members.size() - 1);
    const Card* chosen = members[pick(rng)];

    spdlog::debug("Selected card '{}' from box {} (total weight {})",
        chosen->id, boxIndex + 1, sampler.totalWeight());
    return chosen;
}
