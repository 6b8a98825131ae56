#pragma once
#include <string>
#include "../core/Progress.hpp"
#include "../utils/Status.hpp"

enum class ProgressLayout {
    MultiPlayer,   // { player_id: { name, total_answered, cards, history } }
    SinglePlayer   // legacy { card_id: entry } for the one implicit player
};

// Progress file owner for one command: load() at the start, mutate
// collection(), save() at the end. A missing or blank file is an empty
// collection. save() rewrites the whole file, indented by two spaces.
//
// In the single-player layout the collection holds one record under
// SINGLE_PLAYER_ID and only its card map is written back.
class ProgressStore {
public:
    static const char* const SINGLE_PLAYER_ID;

    explicit ProgressStore(const std::string& filename, ProgressLayout layout = ProgressLayout::MultiPlayer);

    Status load();
    Status save() const;

    ProgressCollection& collection() { return players; }
    const ProgressCollection& collection() const { return players; }

    PlayerRecord* findPlayer(const std::string& id);
    // The implicit record of the single-player layout.
    PlayerRecord& singlePlayer();

    const std::string& path() const { return filePath; }
    ProgressLayout layout() const { return fileLayout; }

    // Serialized file content for the current collection.
    std::string serialize() const;
    Status deserialize(const std::string& text);

private:
    std::string filePath;
    ProgressLayout fileLayout;
    ProgressCollection players;
};
