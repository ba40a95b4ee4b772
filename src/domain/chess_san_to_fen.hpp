#pragma once

#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace pgnkit::domain::chess {

struct MoveApplyResult {
    bool ok{false};
    std::string error;
    std::string fenAfter;              // full FEN after the move (includes counters)
    std::string san;                   // canonical SAN of the move actually played
    std::string uci;                   // e2e4, e7e8q, ...
    Side sideToMove{Side::White};      // side to move after the move
};

// Plays one move against a FEN position.
//
// strict = true accepts canonical SAN only. Check/mate suffixes, annotation
// glyphs ("!", "?") and the promotion '=' are not significant: "e8Q+" matches
// "e8=Q".
//
// strict = false is the permissive pass (pragmatic subset):
// - leading move numbers: "12...Nf6"
// - capture markers that do not match the board: "Nxf3" for a quiet move
// - over-disambiguation and long algebraic: "Ng1f3", "Ng1-f3"
// - coordinate notation: "e2e4", "e7e8q"
// - castling written with zeros or lower case: "0-0", "o-o-o"
MoveApplyResult applyMove(const std::string& fen, const std::string& moveText, bool strict);

// Strict pass, then (if permissiveFallback) the permissive one.
MoveApplyResult playMove(const std::string& fen, const std::string& moveText, bool permissiveFallback = true);

// Side to move of a FEN position; nullopt if the FEN cannot be loaded.
std::optional<Side> sideToMove(const std::string& fen);

// Full-move counter of a FEN position; nullopt if the FEN cannot be loaded.
std::optional<int> fullmoveNumber(const std::string& fen);

// True if the rules engine can load the position: six fields, eight ranks of
// eight files and exactly one king per side.
bool isValidFen(const std::string& fen);

} // namespace pgnkit::domain::chess
