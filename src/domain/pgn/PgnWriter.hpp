#pragma once

#include <functional>
#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace pgnkit::domain::pgn {

// Side that played a move, as known to the caller (nullopt if unknown).
using MoverLookup = std::function<std::optional<Side>(MoveId)>;

// Renders a move tree back to PGN text. Lines are joined with '\n':
//   {comment above header}...  <blank>
//   [Tag "Value"]...           <blank>
//   {comment before moves}...  <blank>
//   1. e4 e5 2. Nf3 (2. f4 exf4) 2... Nc6 {comment}
//   *
// A numbered move played by Black is written "N...".
std::string renderPgn(const GameDocument& doc, const MoverLookup& moverOf);

// Only the movetext of one container, without result marker.
std::string renderMoves(const GameDocument& doc, VariationId container, const MoverLookup& moverOf);

} // namespace pgnkit::domain::pgn
