#include "ProgressStore.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "JsonCodec.hpp"

const char* const ProgressStore::SINGLE_PLAYER_ID = "local";

ProgressStore::ProgressStore(const std::string& filename, ProgressLayout layout)
    : filePath(filename), fileLayout(layout)
{
}

PlayerRecord* ProgressStore::findPlayer(const std::string& id) {
    auto it = players.find(id);
    if (it == players.end()) return nullptr;
    return &it->second;
}

PlayerRecord& ProgressStore::singlePlayer() {
    return players[SINGLE_PLAYER_ID];
}

Status ProgressStore::load() {
    spdlog::info("Loading progress from '{}'", filePath);
    players.clear();

    std::ifstream in(filePath);
    if (!in) {
        spdlog::warn("Progress file '{}' not found; treating as empty", filePath);
        return Status::ok();
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        spdlog::error("Failed to read '{}'", filePath);
        return Status::error(ErrorKind::Storage, "Error reading progress file (" + filePath + ").");
    }

    Status st = deserialize(buffer.str());
    if (st) spdlog::info("Loaded progress for {} player(s)", players.size());
    return st;
}

Status ProgressStore::deserialize(const std::string& text) {
    players.clear();

    bool blank = std::all_of(text.begin(), text.end(),
        [](char c) { return std::isspace((unsigned char)c) != 0; });
    if (blank) return Status::ok();

    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object())
            throw std::invalid_argument("Expected a JSON object at top level");

        if (fileLayout == ProgressLayout::SinglePlayer) {
            singlePlayer().cards = JsonCodec::cardMapFromJson(json);
            return Status::ok();
        }

        for (auto it = json.begin(); it != json.end(); ++it) {
            PlayerRecord record = JsonCodec::playerFromJson(it.value());
            if (record.total_answered != static_cast<int>(record.history.size())) {
                spdlog::warn("Player '{}' has total_answered={} but {} history events",
                    it.key(), record.total_answered, record.history.size());
            }
            players.emplace(it.key(), std::move(record));
        }
    }
    catch (const nlohmann::json::exception& ex) {
        spdlog::error("Failed to parse progress file '{}': {}", filePath, ex.what());
        players.clear();
        return Status::error(ErrorKind::MalformedData, "Error parsing progress JSON in " + filePath + ": " + ex.what());
    }
    catch (const std::invalid_argument& ex) {
        spdlog::error("Invalid progress data in '{}': {}", filePath, ex.what());
        players.clear();
        return Status::error(ErrorKind::MalformedData, "Invalid progress JSON in " + filePath + ": " + ex.what());
    }
    return Status::ok();
}

std::string ProgressStore::serialize() const {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();

    if (fileLayout == ProgressLayout::SinglePlayer) {
        auto it = players.find(SINGLE_PLAYER_ID);
        if (it != players.end()) json = JsonCodec::cardMapToJson(it->second.cards);
    }
    else {
        for (const auto& p : players) {
            json[p.first] = JsonCodec::playerToJson(p.second);
        }
    }
    // Invalid UTF-8 in a player name becomes U+FFFD instead of throwing
    return json.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

Status ProgressStore::save() const {
    spdlog::info("Saving progress for {} player(s) to '{}'", players.size(), filePath);

    std::string data = serialize();

    std::ofstream out(filePath, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing progress", filePath);
        return Status::error(ErrorKind::Storage, "Error writing progress file (" + filePath + ").");
    }

    out << data << "\n";
    out.flush();
    if (!out) {
        spdlog::error("Failed while writing '{}'", filePath);
        return Status::error(ErrorKind::Storage, "Error writing progress file (" + filePath + ").");
    }
    return Status::ok();
}
