#include "PlayerRegistry.hpp"
#include <algorithm>
#include <sodium.h>
#include <spdlog/spdlog.h>

static constexpr std::size_t PLAYER_ID_BYTES = 16;

PlayerRegistry::PlayerRegistry(ProgressStore& store)
    : store(store)
{
}

std::string PlayerRegistry::generatePlayerId() {
    unsigned char raw[PLAYER_ID_BYTES];
    randombytes_buf(raw, sizeof(raw));

    char hex[2 * PLAYER_ID_BYTES + 1];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    return std::string(hex);
}

Status PlayerRegistry::create(const std::string& name, std::string& newId) {
    spdlog::info("Creating player '{}'", name);

    if (name.empty()) {
        spdlog::warn("Player creation failed: empty name");
        return Status::error(ErrorKind::Validation, "Player name must not be empty.");
    }

    std::string id = generatePlayerId();
    PlayerRecord record;
    record.name = name;
    store.collection()[id] = record;

    Status st = store.save();
    if (!st) {
        store.collection().erase(id);
        return st;
    }

    spdlog::info("Player '{}' created with id {}", name, id);
    newId = id;
    return Status::ok();
}

std::vector<PlayerSummary> PlayerRegistry::list() const {
    std::vector<PlayerSummary> out;
    const auto& players = store.collection();
    out.reserve(players.size());
    for (const auto& p : players) {
        out.push_back(PlayerSummary{ p.second.name, p.first });
    }

    std::sort(out.begin(), out.end(), [](const PlayerSummary& a, const PlayerSummary& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.id < b.id;
    });
    spdlog::debug("Listing {} player(s)", out.size());
    return out;
}

Status PlayerRegistry::remove(const std::string& id, PlayerSummary& removed) {
    spdlog::info("Deleting player {}", id);

    auto& players = store.collection();
    auto it = players.find(id);
    if (it == players.end()) {
        spdlog::warn("Delete failed: player {} not found", id);
        return Status::error(ErrorKind::NotFound, "Player with ID '" + id + "' not found.");
    }

    PlayerRecord backup = it->second;
    removed = PlayerSummary{ backup.name, id };
    players.erase(it);

    Status st = store.save();
    if (!st) {
        players.emplace(id, std::move(backup));
        return st;
    }

    spdlog::info("Player '{}' ({}) deleted", removed.name, id);
    return Status::ok();
}
