#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace pgnkit::domain::pgn {

struct PgnParseResult {
    bool ok{false};
    std::string error;
    std::vector<GameDocument> games;
};

struct PgnGameParseResult {
    bool ok{false};
    std::string error;
    GameDocument game;
};

// Parses up to maxGames games from a PGN text into move trees.
//
// Per game:
// - {...} comments before the first tag pair go to commentsAboveHeader,
//   comments between the tags and the first move go to comments
// - [Key "Value"] tag pairs keep their order of appearance
// - movetext: move numbers ("12.", "12..."), moves, {...} and ';' comments
//   (attached to the preceding move), (...) variations (nested, attached to
//   the preceding move, optionally ending with their own result marker),
//   NAGs ("$1") are skipped
// - a missing result marker reads as "*"
//
// Fails on an unterminated comment, unbalanced parentheses, a variation
// opened before any move of its sequence, or moves after a variation result.
PgnParseResult parsePgnText(const std::string& text, int maxGames = 1);

// First game of the text. An input without any game yields an empty
// document (no moves, result "*").
PgnGameParseResult parseGame(const std::string& text);

} // namespace pgnkit::domain::pgn
