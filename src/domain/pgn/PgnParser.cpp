#include "domain/pgn/PgnParser.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>

namespace pgnkit::domain::pgn {

namespace {

enum class TokenKind {
    Tag,
    Comment,
    Open,
    Close,
    Number,
    Move,
    Result,
    Nag
};

struct Token {
    TokenKind kind{TokenKind::Move};
    std::string text;
    size_t offset{0};
};

static inline std::string trim(std::string_view v) {
    size_t b = 0;
    while (b < v.size() && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    size_t e = v.size();
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return std::string(v.substr(b, e - b));
}

static inline bool isResultToken(std::string_view t) {
    return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
}

static inline bool isWordBreak(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '{' || c == '}' || c == '(' || c == ')' ||
           c == ';' || c == '[' || c == '$';
}

static inline std::string unescapePgnString(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
            const char n = v[i + 1];
            if (n == '\\' || n == '"') {
                out.push_back(n);
                ++i;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

// [Key "Value"], already cut at the closing bracket.
static bool parseTagPair(std::string_view tag, std::string& outKey, std::string& outVal) {
    if (tag.size() < 4 || tag.front() != '[' || tag.back() != ']') return false;

    const std::string_view mid = tag.substr(1, tag.size() - 2);
    size_t b = 0;
    while (b < mid.size() && std::isspace(static_cast<unsigned char>(mid[b]))) ++b;
    size_t sp = b;
    while (sp < mid.size() && !std::isspace(static_cast<unsigned char>(mid[sp])) && mid[sp] != '"') ++sp;
    if (sp == b || sp >= mid.size()) return false;
    outKey = std::string(mid.substr(b, sp - b));

    const size_t q1 = mid.find('"', sp);
    if (q1 == std::string_view::npos) return false;
    size_t q2 = q1 + 1;
    bool escaped = false;
    for (; q2 < mid.size(); ++q2) {
        const char c = mid[q2];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') break;
    }
    if (q2 >= mid.size()) return false;

    outVal = unescapePgnString(mid.substr(q1 + 1, q2 - (q1 + 1)));
    return true;
}

// Splits "12...Nf6" into a number token and a move token.
static void pushWord(std::vector<Token>& out, std::string_view word, size_t offset) {
    if (isResultToken(word)) {
        out.push_back(Token{TokenKind::Result, std::string(word), offset});
        return;
    }

    size_t i = 0;
    while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) ++i;
    size_t j = i;
    while (j < word.size() && word[j] == '.') ++j;

    if (i > 0 && (j > i || j == word.size())) {
        out.push_back(Token{TokenKind::Number, std::string(word.substr(0, i)), offset});
        if (j < word.size()) {
            out.push_back(Token{TokenKind::Move, std::string(word.substr(j)), offset + j});
        }
        return;
    }
    if (i == 0 && j == word.size()) {
        // stray "..." after a separated move number
        return;
    }
    out.push_back(Token{TokenKind::Move, std::string(word), offset});
}

static bool tokenize(const std::string& text, std::vector<Token>& out, std::string& err) {
    size_t i = 0;
    // UTF-8 BOM
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        i = 3;
    }

    bool lineStart = true;
    while (i < text.size()) {
        const char c = text[i];
        if (c == '\n' || c == '\r') {
            lineStart = true;
            ++i;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // "%" in the first column escapes the whole line.
        if (c == '%' && lineStart) {
            while (i < text.size() && text[i] != '\n' && text[i] != '\r') ++i;
            continue;
        }
        lineStart = false;

        const size_t start = i;
        if (c == '{') {
            const size_t close = text.find('}', i + 1);
            if (close == std::string::npos) {
                err = "Unterminated comment at offset " + std::to_string(start);
                return false;
            }
            out.push_back(Token{TokenKind::Comment, trim(std::string_view(text).substr(i + 1, close - i - 1)), start});
            i = close + 1;
            continue;
        }
        if (c == ';') {
            size_t e = i + 1;
            while (e < text.size() && text[e] != '\n' && text[e] != '\r') ++e;
            out.push_back(Token{TokenKind::Comment, trim(std::string_view(text).substr(i + 1, e - i - 1)), start});
            i = e;
            continue;
        }
        if (c == '[') {
            size_t e = i + 1;
            bool inQuotes = false;
            bool escaped = false;
            for (; e < text.size(); ++e) {
                const char t = text[e];
                if (escaped) {
                    escaped = false;
                } else if (t == '\\') {
                    escaped = true;
                } else if (t == '"') {
                    inQuotes = !inQuotes;
                } else if (t == ']' && !inQuotes) {
                    break;
                }
            }
            if (e >= text.size()) {
                err = "Unterminated tag pair at offset " + std::to_string(start);
                return false;
            }
            out.push_back(Token{TokenKind::Tag, text.substr(i, e - i + 1), start});
            i = e + 1;
            continue;
        }
        if (c == '(') {
            out.push_back(Token{TokenKind::Open, "(", start});
            ++i;
            continue;
        }
        if (c == ')') {
            out.push_back(Token{TokenKind::Close, ")", start});
            ++i;
            continue;
        }
        if (c == '}') {
            err = "Unexpected '}' at offset " + std::to_string(start);
            return false;
        }
        if (c == '$') {
            size_t e = i + 1;
            while (e < text.size() && std::isdigit(static_cast<unsigned char>(text[e]))) ++e;
            out.push_back(Token{TokenKind::Nag, text.substr(i, e - i), start});
            i = e;
            continue;
        }

        size_t e = i;
        while (e < text.size() && !isWordBreak(text[e])) ++e;
        pushWord(out, std::string_view(text).substr(i, e - i), start);
        i = e;
    }
    return true;
}

class GameBuilder {
public:
    GameBuilder(const std::vector<Token>& tokens, size_t& pos)
        : tokens_(tokens)
        , pos_(pos) {
    }

    // Returns false with err set on a malformed game.
    bool build(GameDocument& doc, std::string& err) {
        readHeaderSection(doc);
        return readSequence(doc, kMainline, 0, err);
    }

private:
    void readHeaderSection(GameDocument& doc) {
        std::vector<std::string> pending;
        bool seenTag = false;
        while (pos_ < tokens_.size()) {
            const Token& t = tokens_[pos_];
            if (t.kind == TokenKind::Comment) {
                (seenTag ? doc.comments : pending).push_back(t.text);
                ++pos_;
                continue;
            }
            if (t.kind != TokenKind::Tag) break;

            if (!seenTag) {
                doc.commentsAboveHeader = std::move(pending);
                pending.clear();
                seenTag = true;
            }
            std::string k, v;
            if (parseTagPair(t.text, k, v)) {
                doc.setHeader(k, std::move(v));
            }
            ++pos_;
        }
        // Without tags, leading comments belong to the movetext.
        for (auto& c : pending) doc.comments.push_back(std::move(c));
    }

    bool readSequence(GameDocument& doc, VariationId container, int depth, std::string& err) {
        std::optional<int> pendingNumber;
        std::vector<std::string> leadingComments;
        MoveId last = kNoMove;

        while (pos_ < tokens_.size()) {
            const Token& t = tokens_[pos_];
            switch (t.kind) {
                case TokenKind::Number: {
                    int n = 0;
                    const auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), n);
                    if (ec == std::errc() && ptr == t.text.data() + t.text.size()) pendingNumber = n;
                    ++pos_;
                    break;
                }
                case TokenKind::Move: {
                    MoveNode node;
                    node.moveNumber = pendingNumber;
                    node.san = t.text;
                    if (!last.valid()) node.comments = std::move(leadingComments);
                    pendingNumber.reset();
                    last = doc.addMove(std::move(node));
                    doc.container(container).push_back(last);
                    ++pos_;
                    break;
                }
                case TokenKind::Comment:
                    if (last.valid()) {
                        doc.move(last).comments.push_back(t.text);
                    } else if (depth == 0) {
                        doc.comments.push_back(t.text);
                    } else {
                        leadingComments.push_back(t.text);
                    }
                    ++pos_;
                    break;
                case TokenKind::Nag:
                    ++pos_;
                    break;
                case TokenKind::Open: {
                    if (!last.valid()) {
                        err = "Variation before any move at offset " + std::to_string(t.offset);
                        return false;
                    }
                    const size_t openedAt = t.offset;
                    const VariationId v = doc.addVariation(Variation{});
                    doc.move(last).variations.push_back(v);
                    ++pos_;
                    if (!readSequence(doc, v, depth + 1, err)) return false;
                    if (pos_ >= tokens_.size() || tokens_[pos_].kind != TokenKind::Close) {
                        err = "Unterminated variation opened at offset " + std::to_string(openedAt);
                        return false;
                    }
                    ++pos_;
                    break;
                }
                case TokenKind::Close:
                    if (depth == 0) {
                        err = "Unbalanced ')' at offset " + std::to_string(t.offset);
                        return false;
                    }
                    return true;
                case TokenKind::Result:
                    ++pos_;
                    if (depth == 0) {
                        doc.result = t.text;
                        return true;
                    }
                    doc.variation(container).result = t.text;
                    if (pos_ >= tokens_.size() || tokens_[pos_].kind != TokenKind::Close) {
                        err = "Moves after a variation result at offset " + std::to_string(t.offset);
                        return false;
                    }
                    return true;
                case TokenKind::Tag:
                    if (depth > 0) {
                        err = "Tag pair inside a variation at offset " + std::to_string(t.offset);
                        return false;
                    }
                    // Next game starts without a result marker on this one.
                    return true;
            }
        }
        return true;
    }

    const std::vector<Token>& tokens_;
    size_t& pos_;
};

static bool isEmptyGame(const GameDocument& g) {
    return g.headers.empty() && g.moves.empty() && g.comments.empty() && g.commentsAboveHeader.empty();
}

static bool parseGames(const std::string& text, int maxGames, std::vector<GameDocument>& out, std::string& err) {
    std::vector<Token> tokens;
    if (!tokenize(text, tokens, err)) return false;

    size_t pos = 0;
    while (pos < tokens.size() && static_cast<int>(out.size()) < maxGames) {
        const size_t before = pos;
        GameDocument game;
        GameBuilder builder(tokens, pos);
        if (!builder.build(game, err)) return false;
        if (pos == before) break;

        const bool terminated = tokens[pos - 1].kind == TokenKind::Result;
        if (!isEmptyGame(game) || terminated) {
            out.push_back(std::move(game));
        }
    }
    return true;
}

} // namespace

PgnParseResult parsePgnText(const std::string& text, int maxGames) {
    PgnParseResult res;
    if (maxGames <= 0) {
        res.ok = true;
        return res;
    }

    if (!parseGames(text, maxGames, res.games, res.error)) {
        res.ok = false;
        res.games.clear();
        return res;
    }

    if (res.games.empty()) {
        res.ok = false;
        res.error = "No PGN games found";
        return res;
    }

    res.ok = true;
    return res;
}

PgnGameParseResult parseGame(const std::string& text) {
    PgnGameParseResult res;

    std::vector<GameDocument> games;
    if (!parseGames(text, 1, games, res.error)) {
        res.ok = false;
        return res;
    }

    if (!games.empty()) {
        res.game = std::move(games.front());
    }
    res.ok = true;
    return res;
}

} // namespace pgnkit::domain::pgn
