#include <catch2/catch.hpp>
#include <string>
#include "domain/pgn/PgnParser.hpp"

using namespace pgnkit::domain;
using Catch::Matchers::Contains;

namespace {

const char* kSevenTags = "[Event \"Casual\"]\n"
                         "[Site \"Kyiv\"]\n"
                         "[Date \"2024.01.02\"]\n"
                         "[Round \"1\"]\n"
                         "[White \"Alpha\"]\n"
                         "[Black \"Beta\"]\n"
                         "[Result \"*\"]\n"
                         "\n"
                         "1. e4 e5 *\n";

const char* kBranching = "1. e4 e5 2. Nf3 (2. f4 exf4 3. Nf3) 2... Nc6 3. Bb5 *";

} // namespace

// ============================================================================
// Headers
// ============================================================================

TEST_CASE("PgnParser keeps header order", "[PgnParser][headers]") {
    const auto r = pgn::parseGame(kSevenTags);
    REQUIRE(r.ok);

    const auto& h = r.game.headers;
    REQUIRE(h.size() == 7);
    REQUIRE(h[0].name == "Event");
    REQUIRE(h[0].value == "Casual");
    REQUIRE(h[4].name == "White");
    REQUIRE(h[6].name == "Result");
    REQUIRE(r.game.header("Black") == std::string("Beta"));
    REQUIRE_FALSE(r.game.header("ECO").has_value());
}

TEST_CASE("PgnParser unescapes tag values and overwrites repeated tags in place", "[PgnParser][headers]") {
    const auto r = pgn::parseGame("[Event \"A \\\"quoted\\\" name\"]\n"
                                  "[Site \"x\"]\n"
                                  "[Event \"second\"]\n\n*");
    REQUIRE(r.ok);
    REQUIRE(r.game.headers.size() == 2);
    REQUIRE(r.game.headers[0].name == "Event");
    REQUIRE(r.game.headers[0].value == "second");

    const auto quoted = pgn::parseGame("[Event \"A \\\"quoted\\\" name\"]\n\n*");
    REQUIRE(quoted.ok);
    REQUIRE(quoted.game.headers[0].value == "A \"quoted\" name");
}

TEST_CASE("PgnParser reads a bare result as an empty game", "[PgnParser][headers]") {
    const auto r = pgn::parseGame("*");
    REQUIRE(r.ok);
    REQUIRE(r.game.headers.empty());
    REQUIRE(r.game.moves.empty());
    REQUIRE(r.game.result == "*");

    const auto empty = pgn::parseGame("");
    REQUIRE(empty.ok);
    REQUIRE(empty.game.moves.empty());
    REQUIRE(empty.game.result == "*");
}

// ============================================================================
// Comments
// ============================================================================

TEST_CASE("PgnParser places comments by position", "[PgnParser][comments]") {
    const auto r = pgn::parseGame("{above}\n[Event \"x\"]\n{before moves}\n1. e4 {after e4} e5 ; rest of line\n*");
    REQUIRE(r.ok);

    const auto& g = r.game;
    REQUIRE(g.commentsAboveHeader.size() == 1);
    REQUIRE(g.commentsAboveHeader[0] == "above");
    REQUIRE(g.comments.size() == 1);
    REQUIRE(g.comments[0] == "before moves");

    REQUIRE(g.moves.size() == 2);
    REQUIRE(g.move(g.moves[0]).comments.size() == 1);
    REQUIRE(g.move(g.moves[0]).comments[0] == "after e4");
    REQUIRE(g.move(g.moves[1]).comments[0] == "rest of line");
}

TEST_CASE("PgnParser attaches leading variation comments to the first move", "[PgnParser][comments]") {
    const auto r = pgn::parseGame("1. e4 ({sharper} 1. d4) e5 *");
    REQUIRE(r.ok);

    const auto& g = r.game;
    const auto& e4 = g.move(g.moves[0]);
    REQUIRE(e4.variations.size() == 1);
    const auto& v = g.variation(e4.variations[0]);
    REQUIRE(v.moves.size() == 1);
    REQUIRE(g.move(v.moves[0]).san == "d4");
    REQUIRE(g.move(v.moves[0]).comments[0] == "sharper");
}

// ============================================================================
// Movetext
// ============================================================================

TEST_CASE("PgnParser builds variations under the move they replace", "[PgnParser][movetext]") {
    const auto r = pgn::parseGame(kBranching);
    REQUIRE(r.ok);

    const auto& g = r.game;
    REQUIRE(g.moves.size() == 5);
    REQUIRE(g.move(g.moves[2]).san == "Nf3");
    REQUIRE(g.move(g.moves[2]).moveNumber == 2);
    REQUIRE(g.move(g.moves[1]).moveNumber == std::nullopt);
    REQUIRE(g.move(g.moves[3]).san == "Nc6");
    REQUIRE(g.move(g.moves[3]).moveNumber == 2);

    const auto& nf3 = g.move(g.moves[2]);
    REQUIRE(nf3.variations.size() == 1);
    const auto& v = g.variation(nf3.variations[0]);
    REQUIRE(v.moves.size() == 3);
    REQUIRE(g.move(v.moves[0]).san == "f4");
    REQUIRE(g.move(v.moves[2]).moveNumber == 3);
    REQUIRE_FALSE(v.result.has_value());
}

TEST_CASE("PgnParser reads nested variations and variation results", "[PgnParser][movetext]") {
    const auto r = pgn::parseGame("1. e4 (1. d4 d5 (1... Nf6 2. c4) 0-1) e5 1-0");
    REQUIRE(r.ok);

    const auto& g = r.game;
    REQUIRE(g.result == "1-0");
    REQUIRE(g.moves.size() == 2);

    const auto& outer = g.variation(g.move(g.moves[0]).variations[0]);
    REQUIRE(outer.result == std::string("0-1"));
    REQUIRE(outer.moves.size() == 2);

    const auto& d5 = g.move(outer.moves[1]);
    REQUIRE(d5.variations.size() == 1);
    const auto& inner = g.variation(d5.variations[0]);
    REQUIRE(inner.moves.size() == 2);
    REQUIRE(g.move(inner.moves[0]).san == "Nf6");
    REQUIRE(g.move(inner.moves[0]).moveNumber == 1);
}

TEST_CASE("PgnParser splits glued move numbers and skips NAGs", "[PgnParser][movetext]") {
    const auto r = pgn::parseGame("1.e4 $1 e5 2.Nf3 12...Nf6 *");
    REQUIRE(r.ok);

    const auto& g = r.game;
    REQUIRE(g.moves.size() == 4);
    REQUIRE(g.move(g.moves[0]).san == "e4");
    REQUIRE(g.move(g.moves[0]).moveNumber == 1);
    REQUIRE(g.move(g.moves[3]).san == "Nf6");
    REQUIRE(g.move(g.moves[3]).moveNumber == 12);
}

TEST_CASE("PgnParser keeps castling with zeros as a move", "[PgnParser][movetext]") {
    const auto r = pgn::parseGame("1. 0-0 *");
    REQUIRE(r.ok);
    REQUIRE(r.game.moves.size() == 1);
    REQUIRE(r.game.move(r.game.moves[0]).san == "0-0");
}

TEST_CASE("PgnParser reads several games", "[PgnParser][games]") {
    const std::string text = "[Event \"one\"]\n\n1. e4 *\n\n[Event \"two\"]\n\n1. d4 d5 1/2-1/2\n";

    const auto all = pgn::parsePgnText(text, 5);
    REQUIRE(all.ok);
    REQUIRE(all.games.size() == 2);
    REQUIRE(all.games[1].header("Event") == std::string("two"));
    REQUIRE(all.games[1].moves.size() == 2);
    REQUIRE(all.games[1].result == "1/2-1/2");

    const auto firstOnly = pgn::parsePgnText(text);
    REQUIRE(firstOnly.ok);
    REQUIRE(firstOnly.games.size() == 1);

    const auto none = pgn::parsePgnText("   \n");
    REQUIRE_FALSE(none.ok);
    REQUIRE(none.error == "No PGN games found");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("PgnParser rejects malformed movetext", "[PgnParser][errors]") {
    const auto comment = pgn::parseGame("1. e4 {never closed");
    REQUIRE_FALSE(comment.ok);
    REQUIRE_THAT(comment.error, Contains("Unterminated comment"));

    const auto open = pgn::parseGame("1. e4 (1. d4");
    REQUIRE_FALSE(open.ok);
    REQUIRE_THAT(open.error, Contains("Unterminated variation"));

    const auto close = pgn::parseGame("1. e4 ) e5");
    REQUIRE_FALSE(close.ok);
    REQUIRE_THAT(close.error, Contains("Unbalanced"));

    const auto early = pgn::parseGame("(1. d4) 1. e4 *");
    REQUIRE_FALSE(early.ok);
    REQUIRE_THAT(early.error, Contains("Variation before any move"));

    const auto trailing = pgn::parseGame("1. e4 (1. d4 * d5) *");
    REQUIRE_FALSE(trailing.ok);
    REQUIRE_THAT(trailing.error, Contains("Moves after a variation result"));
}
