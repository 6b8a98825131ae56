#include "CardCatalog.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include "../storage/JsonCodec.hpp"

CardCatalog::CardCatalog(std::vector<Card> cards)
{
    all_cards.reserve(cards.size());
    for (auto& c : cards) {
        if (index_by_id.count(c.id)) continue;
        index_by_id.emplace(c.id, all_cards.size());
        all_cards.push_back(std::move(c));
    }
}

const Card* CardCatalog::find(const std::string& id) const {
    auto it = index_by_id.find(id);
    if (it == index_by_id.end()) return nullptr;
    return &all_cards[it->second];
}

Status CardCatalog::loadFromFile(const std::string& filename, CardCatalog& out) {
    spdlog::info("Loading cards from '{}'", filename);
    std::ifstream in(filename);
    if (!in) {
        spdlog::error("Card file '{}' not found", filename);
        return Status::error(ErrorKind::Configuration,
            "Card file not found at " + filename + ". Please create it with your flashcards.");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), filename, out);
}

Status CardCatalog::parse(const std::string& text, const std::string& origin, CardCatalog& out) {
    std::vector<Card> cards;
    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_array())
            throw std::invalid_argument("Expected an array of cards");

        cards.reserve(json.size());
        for (const auto& value : json) {
            cards.push_back(JsonCodec::cardFromJson(value));
        }
    }
    catch (const nlohmann::json::exception& ex) {
        spdlog::error("Failed to parse '{}': {}", origin, ex.what());
        return Status::error(ErrorKind::MalformedData, "Error parsing cards JSON in " + origin + ": " + ex.what());
    }
    catch (const std::invalid_argument& ex) {
        spdlog::error("Invalid card data in '{}': {}", origin, ex.what());
        return Status::error(ErrorKind::MalformedData, "Invalid cards JSON in " + origin + ": " + ex.what());
    }

    std::unordered_map<std::string, int> seen;
    for (const auto& c : cards) {
        if (++seen[c.id] > 1) {
            spdlog::error("Duplicate card id '{}' in '{}'", c.id, origin);
            return Status::error(ErrorKind::MalformedData, "Duplicate card id '" + c.id + "' in " + origin);
        }
    }

    out = CardCatalog(std::move(cards));
    spdlog::info("Loaded {} cards", out.size());
    return Status::ok();
}
