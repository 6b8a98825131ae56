#include "AnswerChecker.hpp"
#include <spdlog/spdlog.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

std::string normalizeAnswer(const std::string& text) {
    icu::UnicodeString in = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), (int)text.size()));
    icu::UnicodeString folded;
    for (int32_t i = 0; i < in.length(); i = in.moveIndex32(i, 1)) {
        UChar32 c = in.char32At(i);
        if (u_isUWhiteSpace(c)) continue;
        folded.append(u_tolower(c));
    }

    std::string out;
    folded.toUTF8String(out);
    while (!out.empty() && out.back() == ';') out.pop_back();
    return out;
}

AnswerChecker::AnswerChecker(const CardCatalog& catalog)
    : catalog(catalog)
{
}

Status AnswerChecker::check(PlayerRecord& player, const std::string& cardId, const std::string& answer,
    std::time_t now, CheckResult& result) const
{
    const Card* card = catalog.find(cardId);
    if (!card) {
        spdlog::warn("check: card '{}' not found", cardId);
        return Status::error(ErrorKind::NotFound, "Card with ID '" + cardId + "' not found.");
    }

    bool correct = normalizeAnswer(answer) == normalizeAnswer(card->solution);

    // operator[] creates the box-1 entry for a card never selected before
    ProgressEntry& entry = player.cards[cardId];
    int oldBox = entry.box;
    if (correct) {
        entry.box++;
        entry.streak++;
        entry.passed++;
    }
    else {
        entry.box = 1;
        entry.streak = 0;
        entry.failed++;
    }
    entry.last_reviewed = now;

    player.total_answered++;
    player.history.push_back(HistoryEvent{ cardId, now, correct });

    spdlog::info("Card '{}' answered {}: box {} -> {}, streak={}",
        cardId, correct ? "correctly" : "incorrectly", oldBox, entry.box, entry.streak);

    result.correct = correct;
    result.new_box = entry.box;
    result.solution = card->solution;
    return Status::ok();
}
