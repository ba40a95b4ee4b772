#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "domain/chess_san_to_fen.hpp"

using namespace pgnkit::domain;
using Catch::Matchers::Contains;

namespace {

std::string playAll(std::string fen, const std::vector<std::string>& moves, std::string* lastSan = nullptr) {
    for (const auto& m : moves) {
        const auto r = chess::playMove(fen, m);
        REQUIRE(r.ok);
        fen = r.fenAfter;
        if (lastSan) {
            *lastSan = r.san;
        }
    }
    return fen;
}

} // namespace

// ============================================================================
// Strict pass
// ============================================================================

TEST_CASE("Rules engine plays a pawn push from the start position", "[chess][strict]") {
    const auto r = chess::applyMove(kFenStartPosition, "e4", true);

    REQUIRE(r.ok);
    REQUIRE(r.san == "e4");
    REQUIRE(r.uci == "e2e4");
    REQUIRE(r.sideToMove == Side::Black);
    // No black pawn can capture en passant, so no target square is recorded.
    REQUIRE(r.fenAfter == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
}

TEST_CASE("Rules engine increments the full-move counter after Black moves", "[chess][strict]") {
    const auto fen = playAll(kFenStartPosition, {"e4", "e5"});

    REQUIRE(fen == "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 0 2");
    REQUIRE(chess::sideToMove(fen) == Side::White);
    REQUIRE(chess::fullmoveNumber(fen) == 2);
}

TEST_CASE("Strict pass rejects non-canonical notation", "[chess][strict]") {
    const auto coord = chess::applyMove(kFenStartPosition, "e2e4", true);
    REQUIRE_FALSE(coord.ok);
    REQUIRE_THAT(coord.error, Contains("Not a legal move in SAN"));

    const auto fakeCapture = chess::applyMove(kFenStartPosition, "Nxf3", true);
    REQUIRE_FALSE(fakeCapture.ok);
}

TEST_CASE("Strict pass ignores check marks, glyphs and the promotion sign", "[chess][strict]") {
    REQUIRE(chess::applyMove(kFenStartPosition, "Nf3!?", true).ok);

    const std::string fen = "8/4P3/8/8/8/8/8/k6K w - - 0 1";
    const auto r = chess::applyMove(fen, "e8Q", true);
    REQUIRE(r.ok);
    REQUIRE(r.san == "e8=Q");
    REQUIRE(r.fenAfter == "4Q3/8/8/8/8/8/8/k6K b - - 0 1");
}

// ============================================================================
// Permissive pass
// ============================================================================

TEST_CASE("Permissive pass accepts coordinate and long notation", "[chess][permissive]") {
    const auto coord = chess::playMove(kFenStartPosition, "e2e4");
    REQUIRE(coord.ok);
    REQUIRE(coord.san == "e4");

    const auto longAlg = chess::playMove(kFenStartPosition, "Ng1-f3");
    REQUIRE(longAlg.ok);
    REQUIRE(longAlg.san == "Nf3");

    const auto capture = chess::playMove(kFenStartPosition, "Nxf3");
    REQUIRE(capture.ok);
    REQUIRE(capture.san == "Nf3");

    const auto numbered = chess::playMove(kFenStartPosition, "1.d4");
    REQUIRE(numbered.ok);
    REQUIRE(numbered.san == "d4");
}

TEST_CASE("Permissive pass is skipped when the fallback is disabled", "[chess][permissive]") {
    const auto r = chess::playMove(kFenStartPosition, "e2e4", false);
    REQUIRE_FALSE(r.ok);
    REQUIRE_THAT(r.error, Contains("Not a legal move in SAN"));
}

TEST_CASE("Promotion must name its piece", "[chess][permissive]") {
    const std::string fen = "8/4P3/8/8/8/8/8/k6K w - - 0 1";

    const auto bare = chess::playMove(fen, "e8");
    REQUIRE_FALSE(bare.ok);
    REQUIRE_THAT(bare.error, Contains("No legal move matches"));

    const auto knight = chess::playMove(fen, "e7e8n");
    REQUIRE(knight.ok);
    REQUIRE(knight.san == "e8=N");
    REQUIRE(knight.uci == "e7e8n");
}

// ============================================================================
// Canonical SAN
// ============================================================================

TEST_CASE("Castling in both directions", "[chess][san]") {
    const std::string fen = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";

    const auto shortSide = chess::playMove(fen, "O-O");
    REQUIRE(shortSide.ok);
    REQUIRE(shortSide.san == "O-O");
    REQUIRE(shortSide.fenAfter == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

    const auto longSide = chess::playMove(fen, "0-0-0");
    REQUIRE(longSide.ok);
    REQUIRE(longSide.san == "O-O-O");
    REQUIRE(longSide.fenAfter == "r3k2r/8/8/8/8/8/8/2KR3R b kq - 1 1");
}

TEST_CASE("Disambiguation by file and by rank", "[chess][san]") {
    const std::string byFile = "4k3/8/8/8/8/8/4K3/R6R w - - 0 1";
    REQUIRE(chess::playMove(byFile, "Rad1").san == "Rad1");
    REQUIRE(chess::playMove(byFile, "h1d1").san == "Rhd1");

    const auto ambiguous = chess::playMove(byFile, "Rd1");
    REQUIRE_FALSE(ambiguous.ok);
    REQUIRE_THAT(ambiguous.error, Contains("Ambiguous"));

    const std::string byRank = "4k3/8/8/8/R7/8/4K3/R7 w - - 0 1";
    REQUIRE(chess::playMove(byRank, "a1a3").san == "R1a3");
    REQUIRE(chess::playMove(byRank, "a4a3").san == "R4a3");
}

TEST_CASE("Checkmate gets the mate suffix", "[chess][san]") {
    std::string last;
    const auto fen = playAll(kFenStartPosition, {"f3", "e5", "g4", "Qh4"}, &last);

    REQUIRE(last == "Qh4#");
    REQUIRE(chess::sideToMove(fen) == Side::White);
}

TEST_CASE("En passant capture", "[chess][san]") {
    const auto push = chess::playMove("4k3/3p4/8/4P3/8/8/8/4K3 b - - 0 1", "d5");
    REQUIRE(push.ok);
    REQUIRE(push.fenAfter == "4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 2");

    const auto capture = chess::playMove(push.fenAfter, "exd6");
    REQUIRE(capture.ok);
    REQUIRE(capture.san == "exd6");
    REQUIRE(capture.fenAfter == "4k3/8/3P4/8/8/8/8/4K3 b - - 0 2");
}

// ============================================================================
// Positions
// ============================================================================

TEST_CASE("FEN validation", "[chess][fen]") {
    REQUIRE(chess::isValidFen(kFenStartPosition));
    REQUIRE_FALSE(chess::isValidFen(kFenEmptyPosition));
    REQUIRE_FALSE(chess::isValidFen("8/8/8/8/8/8/8/8 w - - 0 1"));
    REQUIRE_FALSE(chess::isValidFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1"));

    REQUIRE_FALSE(chess::sideToMove("garbage").has_value());
    REQUIRE_FALSE(chess::fullmoveNumber("garbage").has_value());
}

TEST_CASE("Bad input is reported, not played", "[chess][errors]") {
    const auto badFen = chess::applyMove("garbage", "e4", true);
    REQUIRE_FALSE(badFen.ok);
    REQUIRE_THAT(badFen.error, Contains("Invalid FEN"));

    const auto empty = chess::playMove(kFenStartPosition, "   ");
    REQUIRE_FALSE(empty.ok);
    REQUIRE(empty.error == "Empty move");

    const auto junk = chess::playMove(kFenStartPosition, "Zz9");
    REQUIRE_FALSE(junk.ok);
    REQUIRE_THAT(junk.error, Contains("Cannot parse move"));
}
