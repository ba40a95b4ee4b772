#include "app/MoveIndex.hpp"

#include "domain/chess_san_to_fen.hpp"

namespace pgnkit::app {

using namespace pgnkit::domain;

void MoveIndex::clear() {
    order_.clear();
    entries_.clear();
    anchors_.clear();
}

void MoveIndex::rebuild(const GameDocument& doc,
                        const std::string& startFen,
                        bool permissiveFallback,
                        std::vector<InvalidMoveReport>* invalid) {
    clear();
    entries_.resize(doc.moveArena.size());
    anchors_.resize(doc.variationArena.size(), kNoMove);
    walk(doc, kMainline, startFen, permissiveFallback, invalid);
}

void MoveIndex::walk(const GameDocument& doc,
                     VariationId container,
                     std::string fen,
                     bool permissiveFallback,
                     std::vector<InvalidMoveReport>* invalid) {
    const auto& moves = doc.container(container);
    for (std::size_t i = 0; i < moves.size(); ++i) {
        const MoveId id = moves[i];
        const MoveNode& node = doc.move(id);

        order_.push_back(id);
        MoveIndexEntry entry;
        entry.container = container;
        entry.indexInContainer = i;
        entry.order = static_cast<int>(order_.size());

        // Alternatives to this move start from the same position as the move.
        for (const VariationId v : node.variations) {
            anchors_[static_cast<std::size_t>(v.index)] = id;
            walk(doc, v, fen, permissiveFallback, invalid);
        }

        const auto played = chess::playMove(fen, node.san, permissiveFallback);
        if (played.ok) {
            fen = played.fenAfter;
            entry.sideToMove = played.sideToMove;
        } else {
            entry.sideToMove = chess::sideToMove(fen).value_or(Side::White);
            if (invalid) {
                invalid->push_back(InvalidMoveReport{id, node.san, fen, played.error});
            }
        }
        entry.fen = fen;
        entries_[static_cast<std::size_t>(id.index)] = std::move(entry);
    }
}

MoveId MoveIndex::at(int n) const {
    if (n < 1 || static_cast<std::size_t>(n) > order_.size()) return kNoMove;
    return order_[static_cast<std::size_t>(n - 1)];
}

const MoveIndexEntry* MoveIndex::find(MoveId id) const {
    if (!id.valid() || static_cast<std::size_t>(id.index) >= entries_.size()) return nullptr;
    const auto& slot = entries_[static_cast<std::size_t>(id.index)];
    return slot ? &*slot : nullptr;
}

MoveId MoveIndex::anchorOf(VariationId v) const {
    if (!v.valid() || static_cast<std::size_t>(v.index) >= anchors_.size()) return kNoMove;
    return anchors_[static_cast<std::size_t>(v.index)];
}

void MoveIndex::evict(MoveId id) {
    if (!id.valid() || static_cast<std::size_t>(id.index) >= entries_.size()) return;
    entries_[static_cast<std::size_t>(id.index)].reset();
}

void MoveIndex::evictAnchor(VariationId v) {
    if (!v.valid() || static_cast<std::size_t>(v.index) >= anchors_.size()) return;
    anchors_[static_cast<std::size_t>(v.index)] = kNoMove;
}

} // namespace pgnkit::app
