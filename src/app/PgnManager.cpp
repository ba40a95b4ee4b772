#include "app/PgnManager.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

#include "domain/chess_san_to_fen.hpp"
#include "domain/pgn/PgnParser.hpp"
#include "domain/pgn/PgnWriter.hpp"

namespace pgnkit::app {

using namespace pgnkit::domain;

namespace {

template <typename T>
TreeResult<T> success(T value) {
    TreeResult<T> r;
    r.ok = true;
    r.value = std::move(value);
    return r;
}

template <typename T>
TreeResult<T> failure(TreeError code, std::string error) {
    TreeResult<T> r;
    r.ok = false;
    r.code = code;
    r.error = std::move(error);
    return r;
}

std::string describe(MoveId id) {
    return "Unknown move #" + std::to_string(id.index);
}

std::string describeOrder(int order) {
    return "No move at position " + std::to_string(order);
}

} // namespace

PgnManager::PgnManager(GameDocument doc,
                       TreeOptions options,
                       PgnManagerCallbacks callbacks,
                       std::optional<std::string> rawPgn)
    : doc_(std::move(doc))
    , options_(std::move(options))
    , callbacks_(std::move(callbacks)) {
    resolveStartFen();
    rebuild();
    if (rawPgn) {
        pgn_ = std::move(*rawPgn);
    } else {
        render();
    }
}

std::optional<PgnManager> PgnManager::fromPgn(const std::string& text,
                                              TreeOptions options,
                                              PgnManagerCallbacks callbacks,
                                              std::string* outError) {
    auto parsed = pgn::parseGame(text);
    if (!parsed.ok) {
        if (outError) *outError = parsed.error;
        return std::nullopt;
    }
    return PgnManager(std::move(parsed.game), std::move(options), std::move(callbacks), text);
}

void PgnManager::setCallbacks(PgnManagerCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void PgnManager::resolveStartFen() {
    startFen_ = kFenStartPosition;

    std::optional<std::string> requested = doc_.header("FEN");
    if (!requested) requested = options_.startFen;
    if (!requested) return;

    if (chess::isValidFen(*requested)) {
        startFen_ = *requested;
        return;
    }
    if (callbacks_.onInvalidStartPosition) {
        callbacks_.onInvalidStartPosition(*requested, "Invalid FEN: '" + *requested + "'");
    }
}

void PgnManager::rebuild() {
    std::vector<InvalidMoveReport> reports;
    index_.rebuild(doc_, startFen_, options_.permissiveFallback, &reports);
    invalid_ = std::move(reports);

    if (options_.reportInvalidMoves && callbacks_.onInvalidMove) {
        for (const auto& r : invalid_) {
            callbacks_.onInvalidMove(r);
        }
    }
}

void PgnManager::render() {
    pgn_ = pgn::renderPgn(doc_, [this](MoveId id) -> std::optional<Side> {
        const auto c = colorOf(id);
        if (!c.ok) return std::nullopt;
        return c.value;
    });
}

const MoveNode* PgnManager::move(MoveId id) const {
    return doc_.isLive(id) ? &doc_.move(id) : nullptr;
}

const Variation* PgnManager::variation(VariationId id) const {
    return doc_.isLive(id) ? &doc_.variation(id) : nullptr;
}

// --- Navigation ---------------------------------------------------------------

TreeResult<MoveId> PgnManager::moveAt(int n) const {
    const MoveId id = resolve(n);
    if (!id.valid()) return failure<MoveId>(TreeError::NotFound, describeOrder(n));
    return success(id);
}

int PgnManager::orderOf(MoveId move) const {
    const auto* e = index_.find(move);
    return e ? e->order : 0;
}

TreeResult<MoveId> PgnManager::first() const {
    if (index_.empty()) return failure<MoveId>(TreeError::EmptyGame, "Game has no moves");
    return success(index_.order().front());
}

TreeResult<MoveId> PgnManager::last() const {
    if (index_.empty() || doc_.moves.empty()) {
        return failure<MoveId>(TreeError::EmptyGame, "Game has no moves");
    }
    return success(doc_.moves.back());
}

TreeResult<MoveId> PgnManager::next(MoveId move) const {
    if (index_.empty()) return failure<MoveId>(TreeError::EmptyGame, "Game has no moves");
    if (!move.valid()) return first();

    const auto* e = index_.find(move);
    if (!e) return failure<MoveId>(TreeError::InvalidMove, describe(move));

    if (move == doc_.moves.back() || move == index_.order().back()) return success(move);

    const auto& seq = doc_.container(e->container);
    if (e->indexInContainer + 1 < seq.size()) return success(seq[e->indexInContainer + 1]);

    if (e->container.valid()) return next(index_.anchorOf(e->container));

    // Top-level tail that is not the last top-level move; unreachable for
    // trees built by the parser or by insert.
    return success(index_.at(e->order + 1));
}

TreeResult<MoveId> PgnManager::next(int order) const {
    if (order == 0) return next(kNoMove);
    const MoveId id = resolve(order);
    if (!id.valid()) return failure<MoveId>(TreeError::InvalidMove, describeOrder(order));
    return next(id);
}

TreeResult<bool> PgnManager::hasNext(MoveId move) const {
    const auto n = next(move);
    if (!n.ok) return failure<bool>(n.code, n.error);
    return success(!move.valid() || n.value != move);
}

TreeResult<bool> PgnManager::hasNext(int order) const {
    if (order == 0) return hasNext(kNoMove);
    const MoveId id = resolve(order);
    if (!id.valid()) return failure<bool>(TreeError::InvalidMove, describeOrder(order));
    return hasNext(id);
}

TreeResult<MoveId> PgnManager::previous(MoveId move) const {
    if (!move.valid()) {
        if (index_.empty()) return failure<MoveId>(TreeError::EmptyGame, "Game has no moves");
        return failure<MoveId>(TreeError::InvalidMove, "No move given");
    }

    const auto* e = index_.find(move);
    if (!e) return failure<MoveId>(TreeError::InvalidMove, describe(move));
    if (e->order == 1) return success(kNoMove);

    if (e->indexInContainer > 0) {
        return success(doc_.container(e->container)[e->indexInContainer - 1]);
    }
    if (e->container.valid()) return success(index_.anchorOf(e->container));
    return success(index_.at(e->order - 1));
}

TreeResult<MoveId> PgnManager::previous(int order) const {
    if (order == 0) return previous(kNoMove);
    const MoveId id = resolve(order);
    if (!id.valid()) return failure<MoveId>(TreeError::InvalidMove, describeOrder(order));
    return previous(id);
}

TreeResult<VariationId> PgnManager::containerOf(MoveId move) const {
    const auto* e = index_.find(move);
    if (!e) return failure<VariationId>(TreeError::InvalidMove, describe(move));
    return success(e->container);
}

TreeResult<Side> PgnManager::colorOf(MoveId move) const {
    const auto* e = index_.find(move);
    if (!e) return failure<Side>(TreeError::InvalidMove, describe(move));
    return success(opposite(e->sideToMove));
}

TreeResult<Side> PgnManager::colorOf(int order) const {
    const MoveId id = resolve(order);
    if (!id.valid()) return failure<Side>(TreeError::InvalidMove, describeOrder(order));
    return colorOf(id);
}

TreeResult<std::string> PgnManager::fenOf(MoveId move) const {
    const auto* e = index_.find(move);
    if (!e) return failure<std::string>(TreeError::InvalidMove, describe(move));
    return success(e->fen);
}

TreeResult<std::string> PgnManager::fenOf(int order) const {
    const MoveId id = resolve(order);
    if (!id.valid()) return failure<std::string>(TreeError::InvalidMove, describeOrder(order));
    return fenOf(id);
}

TreeResult<std::optional<VariationId>> PgnManager::parentVariationOf(MoveId move) const {
    const auto* e = index_.find(move);
    if (!e) return failure<std::optional<VariationId>>(TreeError::InvalidMove, describe(move));
    if (!e->container.valid()) return success(std::optional<VariationId>{});
    return success(std::optional<VariationId>{e->container});
}

TreeResult<std::optional<VariationId>> PgnManager::parentVariationOf(int order) const {
    const MoveId id = resolve(order);
    if (!id.valid()) {
        return failure<std::optional<VariationId>>(TreeError::InvalidMove, describeOrder(order));
    }
    return parentVariationOf(id);
}

// --- Mutation -----------------------------------------------------------------

// Without an anchor the number comes from the start position, not a fixed 1,
// so games set up from a FEN keep their move count.
int PgnManager::moveNumberAfter(MoveId anchor) const {
    if (!anchor.valid()) return chess::fullmoveNumber(startFen_).value_or(1);

    const MoveNode& node = doc_.move(anchor);
    const auto* e = index_.find(anchor);
    if (node.moveNumber && e) {
        return opposite(e->sideToMove) == Side::White ? *node.moveNumber : *node.moveNumber + 1;
    }
    if (e) {
        if (auto n = chess::fullmoveNumber(e->fen)) return *n;
    }
    return 1;
}

VariationId PgnManager::attachVariation(MoveId anchor, MoveId first, std::string result) {
    Variation v;
    v.moves.push_back(first);
    v.result = std::move(result);
    const VariationId id = doc_.addVariation(std::move(v));
    doc_.move(anchor).variations.push_back(id);
    return id;
}

TreeResult<MoveId> PgnManager::insert(int anchorOrder,
                                      const std::string& moveText,
                                      std::optional<std::string> result) {
    MoveId cur = kNoMove;
    if (anchorOrder != 0) {
        cur = resolve(anchorOrder);
        if (!cur.valid()) return failure<MoveId>(TreeError::InvalidMove, describeOrder(anchorOrder));
    }
    const auto* anchorEntry = index_.find(cur);
    const std::string& fenBefore = anchorEntry ? anchorEntry->fen : startFen_;

    const auto played = chess::playMove(fenBefore, moveText, options_.permissiveFallback);
    if (!played.ok) return failure<MoveId>(TreeError::InvalidMove, played.error);

    // Everything the placement needs is read before the tree changes.
    MoveNode node;
    node.san = played.san;
    node.moveNumber = moveNumberAfter(cur);

    MoveId branchAt = kNoMove;
    VariationId appendTo = kMainline;
    bool append = false;
    if (!cur.valid()) {
        append = doc_.moves.empty();
        if (!append) branchAt = doc_.moves.front();
    } else {
        const auto& seq = doc_.container(anchorEntry->container);
        append = anchorEntry->indexInContainer + 1 == seq.size();
        if (append) {
            appendTo = anchorEntry->container;
        } else {
            const auto n = next(cur);
            if (!n.ok) return failure<MoveId>(n.code, n.error);
            branchAt = n.value;
        }
    }

    const MoveId id = doc_.addMove(std::move(node));
    if (append) {
        doc_.container(appendTo).push_back(id);
    } else {
        attachVariation(branchAt, id, result.value_or(options_.defaultResult));
    }

    rebuild();
    render();
    if (callbacks_.onTreeChanged) callbacks_.onTreeChanged();
    return success(id);
}

TreeResult<MoveId> PgnManager::insert(int anchorOrder,
                                      const CandidateMove& candidate,
                                      std::optional<std::string> result) {
    std::string text = candidate.from + candidate.to;
    if (candidate.promotion) {
        text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*candidate.promotion))));
    }
    return insert(anchorOrder, text, std::move(result));
}

void PgnManager::releaseMove(MoveId id) {
    MoveNode& node = doc_.move(id);
    std::vector<VariationId> variations = std::move(node.variations);
    node = MoveNode{};
    node.released = true;

    for (const VariationId v : variations) {
        std::vector<MoveId> moves = std::move(doc_.variation(v).moves);
        doc_.variation(v) = Variation{};
        doc_.variation(v).released = true;
        for (const MoveId m : moves) releaseMove(m);
    }
}

TreeResult<bool> PgnManager::remove(int order) {
    const MoveId target = resolve(order);
    const auto* e = index_.find(target);
    if (!e) return failure<bool>(TreeError::InvalidMove, describeOrder(order));

    auto& seq = doc_.container(e->container);
    const auto from = seq.begin() + static_cast<std::ptrdiff_t>(e->indexInContainer);
    std::vector<MoveId> removed(from, seq.end());
    seq.erase(from, seq.end());

    for (const MoveId id : removed) {
        index_.evict(id);
        for (const VariationId v : doc_.move(id).variations) index_.evictAnchor(v);
    }
    for (const MoveId id : removed) releaseMove(id);

    rebuild();
    render();
    if (callbacks_.onTreeChanged) callbacks_.onTreeChanged();
    return success(true);
}

} // namespace pgnkit::app
