#pragma once

#include <string>
#include <vector>
#include "../storage/ProgressStore.hpp"
#include "../utils/Status.hpp"

struct PlayerSummary {
    std::string name;
    std::string id;
};

// Player identities inside the multi-player progress collection.
// Each mutating call persists the store before returning.
class PlayerRegistry {
public:
    explicit PlayerRegistry(ProgressStore& store);

    // Empty name -> Validation. newId receives 32 hex characters.
    Status create(const std::string& name, std::string& newId);

    // Sorted by name, then id.
    std::vector<PlayerSummary> list() const;

    // Unknown id -> NotFound and the file is left untouched.
    Status remove(const std::string& id, PlayerSummary& removed);

    // 16 random bytes from libsodium, hex-encoded. Uniqueness is not checked.
    static std::string generatePlayerId();

private:
    ProgressStore& store;
};
