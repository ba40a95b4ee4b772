#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pgnkit::domain {

inline constexpr const char* kFenStartPosition =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
inline constexpr const char* kFenEmptyPosition = "8/8/8/8/8/8/8/8";

// --- Sides ------------------------------------------------------------------

enum class Side {
    White = 0,
    Black = 1
};

inline Side opposite(Side s) {
    return (s == Side::White) ? Side::Black : Side::White;
}

// "w" / "b", as written in the side-to-move field of a FEN.
inline std::string to_string(Side s) {
    return (s == Side::White) ? "w" : "b";
}

// --- Handles ----------------------------------------------------------------

// Stable slot index into GameDocument::moveArena. Slots are never reused.
struct MoveId {
    std::int32_t index{-1};

    bool valid() const noexcept { return index >= 0; }

    friend bool operator==(MoveId a, MoveId b) noexcept { return a.index == b.index; }
    friend bool operator!=(MoveId a, MoveId b) noexcept { return a.index != b.index; }
};

// Stable slot index into GameDocument::variationArena. Slots are never reused.
struct VariationId {
    std::int32_t index{-1};

    bool valid() const noexcept { return index >= 0; }

    friend bool operator==(VariationId a, VariationId b) noexcept { return a.index == b.index; }
    friend bool operator!=(VariationId a, VariationId b) noexcept { return a.index != b.index; }
};

inline constexpr MoveId      kNoMove{};
inline constexpr VariationId kMainline{}; // the top-level container has no anchor

// --- Tree -------------------------------------------------------------------

struct Header {
    std::string name;
    std::string value;
};

struct MoveNode {
    std::optional<int>       moveNumber; // only on moves that start a numbering unit
    std::string              san;        // move text, verbatim from the input or canonical SAN
    std::vector<std::string> comments;
    std::vector<VariationId> variations; // alternatives to this move, in attachment order
    bool                     released{false};
};

// Alternative continuation (RAV) branching from the position before its anchor.
struct Variation {
    std::vector<MoveId>        moves;
    std::optional<std::string> result;
    bool                       released{false};
};

struct GameDocument {
    std::vector<std::string> commentsAboveHeader;
    std::vector<Header>      headers;
    std::vector<std::string> comments; // between headers and moves
    std::vector<MoveId>      moves;    // top-level container
    std::string              result{"*"};

    // Arenas owning every node of the tree.
    std::vector<MoveNode>  moveArena;
    std::vector<Variation> variationArena;

    MoveId addMove(MoveNode node) {
        moveArena.push_back(std::move(node));
        return MoveId{static_cast<std::int32_t>(moveArena.size() - 1)};
    }

    VariationId addVariation(Variation node) {
        variationArena.push_back(std::move(node));
        return VariationId{static_cast<std::int32_t>(variationArena.size() - 1)};
    }

    bool isLive(MoveId id) const noexcept {
        return id.valid() && static_cast<std::size_t>(id.index) < moveArena.size() &&
               !moveArena[static_cast<std::size_t>(id.index)].released;
    }

    bool isLive(VariationId id) const noexcept {
        return id.valid() && static_cast<std::size_t>(id.index) < variationArena.size() &&
               !variationArena[static_cast<std::size_t>(id.index)].released;
    }

    MoveNode&       move(MoveId id) { return moveArena[static_cast<std::size_t>(id.index)]; }
    const MoveNode& move(MoveId id) const { return moveArena[static_cast<std::size_t>(id.index)]; }

    Variation&       variation(VariationId id) { return variationArena[static_cast<std::size_t>(id.index)]; }
    const Variation& variation(VariationId id) const { return variationArena[static_cast<std::size_t>(id.index)]; }

    // Move sequence of a container (kMainline = top level).
    std::vector<MoveId>& container(VariationId id) {
        return id.valid() ? variation(id).moves : moves;
    }
    const std::vector<MoveId>& container(VariationId id) const {
        return id.valid() ? variation(id).moves : moves;
    }

    std::optional<std::string> header(const std::string& name) const {
        for (const auto& h : headers) {
            if (h.name == name) return h.value;
        }
        return std::nullopt;
    }

    // A repeated tag keeps its first position and takes the latest value.
    void setHeader(const std::string& name, std::string value) {
        for (auto& h : headers) {
            if (h.name == name) {
                h.value = std::move(value);
                return;
            }
        }
        headers.push_back(Header{name, std::move(value)});
    }
};

// --- Options ----------------------------------------------------------------

struct TreeOptions {
    std::string                defaultResult{"*"}; // result of variations created by insert
    bool                       permissiveFallback{true};
    bool                       reportInvalidMoves{true};
    std::optional<std::string> startFen; // used when the document has no FEN tag
};

// --- Results ----------------------------------------------------------------

enum class TreeError {
    None        = 0,
    EmptyGame   = 1,
    NotFound    = 2,
    InvalidMove = 3
};

template <typename T>
struct TreeResult {
    bool        ok{false};
    TreeError   code{TreeError::None};
    std::string error;
    T           value{};
};

inline std::string to_string(TreeError e) {
    switch (e) {
        case TreeError::None:        return "None";
        case TreeError::EmptyGame:   return "EmptyGame";
        case TreeError::NotFound:    return "NotFound";
        case TreeError::InvalidMove: return "InvalidMove";
    }
    return "Unknown";
}

} // namespace pgnkit::domain
