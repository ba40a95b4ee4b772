#include <catch2/catch.hpp>
#include <string>
#include "domain/pgn/PgnParser.hpp"
#include "domain/pgn/PgnWriter.hpp"

using namespace pgnkit::domain;

namespace {

GameDocument parsed(const std::string& text) {
    auto r = pgn::parseGame(text);
    REQUIRE(r.ok);
    return std::move(r.game);
}

} // namespace

TEST_CASE("PgnWriter renders an empty document as its result", "[PgnWriter]") {
    GameDocument doc;
    REQUIRE(pgn::renderPgn(doc, nullptr) == "*");

    doc.result = "1-0";
    REQUIRE(pgn::renderPgn(doc, nullptr) == "1-0");
}

TEST_CASE("PgnWriter writes comment, header and movetext sections", "[PgnWriter]") {
    const auto doc = parsed("{c0}\n[Event \"E \\\"x\\\"\"]\n[Site \"S\"]\n{c1}\n1. e4 {good} e5 *");

    const std::string expected = "{c0}\n"
                                 "\n"
                                 "[Event \"E \\\"x\\\"\"]\n"
                                 "[Site \"S\"]\n"
                                 "\n"
                                 "{c1}\n"
                                 "\n"
                                 "1. e4 {good} e5\n"
                                 "*";
    REQUIRE(pgn::renderPgn(doc, nullptr) == expected);
}

TEST_CASE("PgnWriter marks numbered Black moves with an ellipsis", "[PgnWriter]") {
    const auto doc = parsed("1. e4 e5 2. Nf3 (2. f4 exf4) 2... Nc6 *");
    const MoveId nc6 = doc.moves[3];

    const pgn::MoverLookup mover = [nc6](MoveId id) -> std::optional<Side> {
        if (id == nc6) return Side::Black;
        return Side::White;
    };
    REQUIRE(pgn::renderMoves(doc, kMainline, mover) == "1. e4 e5 2. Nf3 (2. f4 exf4) 2... Nc6");

    // Without a lookup every number is written as a White one.
    REQUIRE(pgn::renderMoves(doc, kMainline, nullptr) == "1. e4 e5 2. Nf3 (2. f4 exf4) 2. Nc6");
}

TEST_CASE("PgnWriter writes variation results inside the parentheses", "[PgnWriter]") {
    const auto doc = parsed("1. e4 (1. d4 d5 1/2-1/2) e5 *");
    REQUIRE(pgn::renderMoves(doc, kMainline, nullptr) == "1. e4 (1. d4 d5 1/2-1/2) e5");

    const VariationId v = doc.move(doc.moves[0]).variations[0];
    REQUIRE(pgn::renderMoves(doc, v, nullptr) == "1. d4 d5");
}

TEST_CASE("PgnWriter output parses back to the same tree", "[PgnWriter]") {
    const auto doc = parsed("[Event \"x\"]\n\n1. e4 {a} (1. d4 (1. c4 c5) d5) e5 2. Nf3 *");
    const auto again = parsed(pgn::renderPgn(doc, nullptr));

    REQUIRE(again.headers.size() == 1);
    REQUIRE(again.moves.size() == 3);
    REQUIRE(pgn::renderPgn(again, nullptr) == pgn::renderPgn(doc, nullptr));
}
