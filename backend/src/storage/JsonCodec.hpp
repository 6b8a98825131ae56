#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../core/Card.hpp"
#include "../core/Progress.hpp"

// JSON <-> model conversion shared by the catalog, the progress store and the
// command output. The *FromJson functions throw std::invalid_argument naming
// the offending field; callers turn that into a MalformedData status.
namespace JsonCodec
{
    nlohmann::ordered_json cardToJson(const Card& card);
    Card cardFromJson(const nlohmann::json& value);

    nlohmann::ordered_json entryToJson(const ProgressEntry& entry);
    ProgressEntry entryFromJson(const nlohmann::json& value);

    nlohmann::ordered_json eventToJson(const HistoryEvent& event);
    HistoryEvent eventFromJson(const nlohmann::json& value);

    nlohmann::ordered_json playerToJson(const PlayerRecord& player);
    PlayerRecord playerFromJson(const nlohmann::json& value);

    // card id -> entry, the legacy single-player file and PlayerRecord::cards
    nlohmann::ordered_json cardMapToJson(const std::map<std::string, ProgressEntry>& cards);
    std::map<std::string, ProgressEntry> cardMapFromJson(const nlohmann::json& value);
}
