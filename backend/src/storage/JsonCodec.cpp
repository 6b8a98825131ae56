#include "JsonCodec.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include "../utils/TimeFormat.hpp"

namespace
{
    std::string jsonToString(const nlohmann::json& obj, const char* key, bool required) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            if (required) throw std::invalid_argument(std::string("Missing field '") + key + "'");
            return "";
        }
        if (!it->is_string())
            throw std::invalid_argument(std::string("Expected string for field '") + key + "'");
        return it->get<std::string>();
    }

    int jsonToInt(const nlohmann::json& obj, const char* key, int fallback) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return fallback;
        if (!it->is_number_integer())
            throw std::invalid_argument(std::string("Expected integer for field '") + key + "'");
        bool inRange = it->is_number_unsigned()
            ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : it->get<std::int64_t>() >= std::numeric_limits<int>::min()
                && it->get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!inRange)
            throw std::invalid_argument(std::string("Integer out of range for field '") + key + "'");
        return it->get<int>();
    }

    int jsonToCount(const nlohmann::json& obj, const char* key) {
        int v = jsonToInt(obj, key, 0);
        if (v < 0)
            throw std::invalid_argument(std::string("Field '") + key + "' must not be negative");
        return v;
    }

    std::time_t jsonToTimestamp(const nlohmann::json& obj, const char* key) {
        std::string text = jsonToString(obj, key, false);
        if (text.empty()) return 0;
        std::time_t t = 0;
        if (!TimeFormat::fromRfc3339(text, t))
            throw std::invalid_argument(std::string("Invalid timestamp '") + text + "' for field '" + key + "'");
        return t;
    }

    void requireObject(const nlohmann::json& value, const char* what) {
        if (!value.is_object())
            throw std::invalid_argument(std::string("Expected object for ") + what);
    }
}

namespace JsonCodec
{
    nlohmann::ordered_json cardToJson(const Card& card) {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        json["id"] = card.id;
        json["language"] = card.language;
        json["tags"] = card.tags;
        json["prompt"] = card.prompt;
        json["solution"] = card.solution;
        return json;
    }

    Card cardFromJson(const nlohmann::json& value) {
        requireObject(value, "card");

        Card card;
        card.id = jsonToString(value, "id", true);
        if (card.id.empty()) throw std::invalid_argument("Card id must not be empty");
        card.language = jsonToString(value, "language", false);
        card.prompt = jsonToString(value, "prompt", false);
        card.solution = jsonToString(value, "solution", false);

        auto tags = value.find("tags");
        if (tags != value.end() && !tags->is_null()) {
            if (!tags->is_array())
                throw std::invalid_argument("Expected array<string> for field 'tags' of card '" + card.id + "'");
            for (const auto& t : *tags) {
                if (!t.is_string())
                    throw std::invalid_argument("Expected array<string> for field 'tags' of card '" + card.id + "'");
                card.tags.push_back(t.get<std::string>());
            }
        }
        return card;
    }

    nlohmann::ordered_json entryToJson(const ProgressEntry& entry) {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        json["box"] = entry.box;
        json["streak"] = entry.streak;
        json["passed"] = entry.passed;
        json["failed"] = entry.failed;
        json["last_reviewed"] = TimeFormat::toRfc3339(entry.last_reviewed);
        return json;
    }

    ProgressEntry entryFromJson(const nlohmann::json& value) {
        requireObject(value, "progress entry");

        ProgressEntry entry;
        entry.box = jsonToInt(value, "box", 1);
        entry.streak = jsonToCount(value, "streak");
        entry.passed = jsonToCount(value, "passed");
        entry.failed = jsonToCount(value, "failed");
        entry.last_reviewed = jsonToTimestamp(value, "last_reviewed");
        return entry;
    }

    nlohmann::ordered_json eventToJson(const HistoryEvent& event) {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        json["card_id"] = event.card_id;
        json["timestamp"] = TimeFormat::toRfc3339(event.timestamp);
        json["correct"] = event.correct;
        return json;
    }

    HistoryEvent eventFromJson(const nlohmann::json& value) {
        requireObject(value, "history event");

        HistoryEvent event;
        event.card_id = jsonToString(value, "card_id", true);
        event.timestamp = jsonToTimestamp(value, "timestamp");

        auto correct = value.find("correct");
        if (correct != value.end() && !correct->is_null()) {
            if (!correct->is_boolean())
                throw std::invalid_argument("Expected bool for field 'correct'");
            event.correct = correct->get<bool>();
        }
        return event;
    }

    nlohmann::ordered_json cardMapToJson(const std::map<std::string, ProgressEntry>& cards) {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        for (const auto& p : cards) {
            json[p.first] = entryToJson(p.second);
        }
        return json;
    }

    std::map<std::string, ProgressEntry> cardMapFromJson(const nlohmann::json& value) {
        requireObject(value, "card progress map");

        std::map<std::string, ProgressEntry> cards;
        for (auto it = value.begin(); it != value.end(); ++it) {
            cards[it.key()] = entryFromJson(it.value());
        }
        return cards;
    }

    nlohmann::ordered_json playerToJson(const PlayerRecord& player) {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        json["name"] = player.name;
        json["total_answered"] = player.total_answered;
        json["cards"] = cardMapToJson(player.cards);

        nlohmann::ordered_json history = nlohmann::ordered_json::array();
        for (const auto& e : player.history) {
            history.push_back(eventToJson(e));
        }
        json["history"] = std::move(history);
        return json;
    }

    PlayerRecord playerFromJson(const nlohmann::json& value) {
        requireObject(value, "player record");

        PlayerRecord player;
        player.name = jsonToString(value, "name", false);
        player.total_answered = jsonToCount(value, "total_answered");

        auto cards = value.find("cards");
        if (cards != value.end() && !cards->is_null()) {
            player.cards = cardMapFromJson(*cards);
        }

        auto history = value.find("history");
        if (history != value.end() && !history->is_null()) {
            if (!history->is_array())
                throw std::invalid_argument("Expected array for field 'history'");
            player.history.reserve(history->size());
            for (const auto& e : *history) {
                player.history.push_back(eventFromJson(e));
            }
        }
        return player;
    }
}
