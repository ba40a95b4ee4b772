#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "app/MoveIndex.hpp"
#include "domain/domain_model.hpp"

namespace pgnkit::app {

struct PgnManagerCallbacks {
    std::function<void(const InvalidMoveReport&)> onInvalidMove;
    // FEN header (or configured start position) the rules engine cannot load.
    std::function<void(const std::string& fen, const std::string& error)> onInvalidStartPosition;
    std::function<void()> onTreeChanged;
};

// Square form of a candidate move ("e7", "e8", 'q').
struct CandidateMove {
    std::string         from;
    std::string         to;
    std::optional<char> promotion;
};

// Owns one game tree and keeps its derived caches (order index, positions,
// containers, anchors) and its rendering consistent across mutations.
//
// Overloads taking an int address moves by their 1-based position in the
// order index; 0 stands for "no move".
class PgnManager {
public:
    explicit PgnManager(domain::GameDocument doc,
                        domain::TreeOptions options = {},
                        PgnManagerCallbacks callbacks = {},
                        std::optional<std::string> rawPgn = std::nullopt);

    // Tokenizes the first game of the text. nullopt (and outError) on a
    // tokenizer failure.
    static std::optional<PgnManager> fromPgn(const std::string& text,
                                             domain::TreeOptions options = {},
                                             PgnManagerCallbacks callbacks = {},
                                             std::string* outError = nullptr);

    void setCallbacks(PgnManagerCallbacks callbacks);

    // --- Document -----------------------------------------------------------

    const std::string& pgn() const noexcept { return pgn_; }
    const domain::GameDocument& document() const noexcept { return doc_; }
    const std::vector<domain::Header>& headers() const noexcept { return doc_.headers; }
    std::optional<std::string> header(const std::string& name) const { return doc_.header(name); }
    const std::string& startFen() const noexcept { return startFen_; }
    const domain::TreeOptions& options() const noexcept { return options_; }
    std::size_t moveCount() const noexcept { return index_.size(); }
    const std::vector<InvalidMoveReport>& invalidMoves() const noexcept { return invalid_; }

    // nullptr for released or unknown ids.
    const domain::MoveNode*  move(domain::MoveId id) const;
    const domain::Variation* variation(domain::VariationId id) const;
    domain::MoveId anchorOf(domain::VariationId id) const { return index_.anchorOf(id); }

    // --- Navigation ---------------------------------------------------------

    domain::TreeResult<domain::MoveId> moveAt(int n) const;
    int orderOf(domain::MoveId move) const;

    domain::TreeResult<domain::MoveId> first() const;
    domain::TreeResult<domain::MoveId> last() const;

    // Returns move itself when there is no further move.
    domain::TreeResult<domain::MoveId> next(domain::MoveId move) const;
    domain::TreeResult<domain::MoveId> next(int order) const;

    domain::TreeResult<bool> hasNext(domain::MoveId move) const;
    domain::TreeResult<bool> hasNext(int order) const;

    // kNoMove for the first move of the game. At the start of a variation
    // the predecessor is the variation's anchor.
    domain::TreeResult<domain::MoveId> previous(domain::MoveId move) const;
    domain::TreeResult<domain::MoveId> previous(int order) const;

    domain::TreeResult<domain::VariationId> containerOf(domain::MoveId move) const;

    domain::TreeResult<domain::Side> colorOf(domain::MoveId move) const;
    domain::TreeResult<domain::Side> colorOf(int order) const;

    domain::TreeResult<std::string> fenOf(domain::MoveId move) const;
    domain::TreeResult<std::string> fenOf(int order) const;

    // Empty optional for mainline moves.
    domain::TreeResult<std::optional<domain::VariationId>> parentVariationOf(domain::MoveId move) const;
    domain::TreeResult<std::optional<domain::VariationId>> parentVariationOf(int order) const;

    // --- Mutation -----------------------------------------------------------

    // Plays moveText from the position after the move at anchorOrder (or the
    // start position for 0). Continues the anchor's container when the anchor
    // is its last move, otherwise opens a new variation holding only the new
    // move. The new variation ends with result (default: options.defaultResult).
    domain::TreeResult<domain::MoveId> insert(int anchorOrder,
                                              const std::string& moveText,
                                              std::optional<std::string> result = std::nullopt);
    domain::TreeResult<domain::MoveId> insert(int anchorOrder,
                                              const CandidateMove& candidate,
                                              std::optional<std::string> result = std::nullopt);

    // Removes the move at order and every later move of the same container,
    // together with all variations attached to them.
    domain::TreeResult<bool> remove(int order);

private:
    void resolveStartFen();
    void rebuild();
    void render();

    domain::MoveId resolve(int order) const { return index_.at(order); }
    int moveNumberAfter(domain::MoveId anchor) const;
    domain::VariationId attachVariation(domain::MoveId anchor, domain::MoveId first, std::string result);
    void releaseMove(domain::MoveId id);

    domain::GameDocument           doc_;
    domain::TreeOptions            options_;
    PgnManagerCallbacks            callbacks_;
    std::string                    startFen_;
    std::string                    pgn_;
    MoveIndex                      index_;
    std::vector<InvalidMoveReport> invalid_;
};

} // namespace pgnkit::app
