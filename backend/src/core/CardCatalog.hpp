#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "Card.hpp"
#include "../utils/Status.hpp"

// The immutable card set read from cards.json.
class CardCatalog {
public:
    CardCatalog() = default;
    // Duplicate ids keep the first card.
    explicit CardCatalog(std::vector<Card> cards);

    // Missing file -> Configuration, unparsable or duplicate ids -> MalformedData.
    static Status loadFromFile(const std::string& filename, CardCatalog& out);
    static Status parse(const std::string& text, const std::string& origin, CardCatalog& out);

    const std::vector<Card>& cards() const { return all_cards; }
    const Card* find(const std::string& id) const;

    bool empty() const { return all_cards.empty(); }
    size_t size() const { return all_cards.size(); }

private:
    std::vector<Card> all_cards;
    std::unordered_map<std::string, size_t> index_by_id;
};
