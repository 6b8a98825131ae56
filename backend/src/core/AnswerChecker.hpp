#pragma once
#include <ctime>
#include <string>
#include "CardCatalog.hpp"
#include "Progress.hpp"
#include "../utils/Status.hpp"

struct CheckResult {
    bool correct = false;
    int new_box = 1;
    std::string solution;
};

// Lowercases, drops every whitespace character and strips trailing ';'.
// Works on Unicode code points: "CAFÉ" matches "café", U+00A0 counts as space.
// "FOO = [];" and "foo=[]" normalize to the same string.
std::string normalizeAnswer(const std::string& text);

class AnswerChecker {
public:
    explicit AnswerChecker(const CardCatalog& catalog);

    // Grades the answer and applies the box transition to player:
    // correct -> box + 1 (uncapped), streak + 1, passed + 1
    // wrong   -> box 1, streak 0, failed + 1
    // Either way last_reviewed = now and a history event is appended.
    // Unknown card id -> NotFound, player untouched.
    Status check(PlayerRecord& player, const std::string& cardId, const std::string& answer,
        std::time_t now, CheckResult& result) const;

private:
    const CardCatalog& catalog;
};
