#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace pgnkit::app {

// A move of the input the rules engine refused during linearization.
struct InvalidMoveReport {
    domain::MoveId move;
    std::string    san;
    std::string    fenBefore;
    std::string    error;
};

struct MoveIndexEntry {
    std::string         fen;                                // position after the move
    domain::Side        sideToMove{domain::Side::White};    // side to move after the move
    domain::VariationId container{domain::kMainline};
    std::size_t         indexInContainer{0};
    int                 order{0};                           // 1-based position in the order index
};

// Linear view over a move tree: depth-first order, per-move positions,
// parent containers and variation anchors. Side tables are indexed by the
// arena slot of the move / variation.
class MoveIndex {
public:
    // Walks the whole tree from startFen and replaces every cache.
    // Each move's variations are walked (from the position before the move)
    // before the move itself is played. A move the rules engine refuses keeps
    // the position before it and is appended to invalid (if given).
    void rebuild(const domain::GameDocument& doc,
                 const std::string& startFen,
                 bool permissiveFallback,
                 std::vector<InvalidMoveReport>* invalid);

    void clear();

    std::size_t size() const noexcept { return order_.size(); }
    bool empty() const noexcept { return order_.empty(); }
    const std::vector<domain::MoveId>& order() const noexcept { return order_; }

    // 1-based; kNoMove when out of range.
    domain::MoveId at(int n) const;

    const MoveIndexEntry* find(domain::MoveId id) const;

    // kNoMove for unknown or evicted variations.
    domain::MoveId anchorOf(domain::VariationId v) const;

    void evict(domain::MoveId id);
    void evictAnchor(domain::VariationId v);

private:
    void walk(const domain::GameDocument& doc,
              domain::VariationId container,
              std::string fen,
              bool permissiveFallback,
              std::vector<InvalidMoveReport>* invalid);

    std::vector<domain::MoveId>                order_;
    std::vector<std::optional<MoveIndexEntry>> entries_;
    std::vector<domain::MoveId>                anchors_;
};

} // namespace pgnkit::app
