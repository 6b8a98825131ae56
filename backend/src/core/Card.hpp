#pragma once
#include <string>
#include <vector>

// A flashcard from cards.json. Loaded once per invocation and never modified.
class Card {
public:
    Card() = default;
    Card(const std::string& id, const std::string& prompt, const std::string& solution)
        : id(id), prompt(prompt), solution(solution) {}

    std::string id;
    std::string language;
    std::vector<std::string> tags;
    std::string prompt;
    std::string solution;
};
