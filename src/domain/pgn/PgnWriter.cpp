#include "domain/pgn/PgnWriter.hpp"

#include <vector>

namespace pgnkit::domain::pgn {

namespace {

static inline std::string escapePgnString(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static inline std::string wrapComment(const std::string& text) {
    return "{" + text + "}";
}

static std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

static void appendMoves(const GameDocument& doc, const std::vector<MoveId>& moves,
                        const MoverLookup& moverOf, std::vector<std::string>& parts) {
    for (const MoveId id : moves) {
        const MoveNode& m = doc.move(id);

        if (m.moveNumber) {
            std::string number = std::to_string(*m.moveNumber) + ".";
            const auto mover = moverOf ? moverOf(id) : std::nullopt;
            if (mover && *mover == Side::Black) number += "..";
            parts.push_back(std::move(number));
        }

        parts.push_back(m.san);

        for (const auto& c : m.comments) {
            parts.push_back(wrapComment(c));
        }

        for (const VariationId vid : m.variations) {
            const Variation& v = doc.variation(vid);
            std::vector<std::string> inner;
            appendMoves(doc, v.moves, moverOf, inner);
            std::string rav = "(" + join(inner, " ");
            if (v.result) rav += " " + *v.result;
            rav += ")";
            parts.push_back(std::move(rav));
        }
    }
}

} // namespace

std::string renderMoves(const GameDocument& doc, VariationId container, const MoverLookup& moverOf) {
    std::vector<std::string> parts;
    appendMoves(doc, doc.container(container), moverOf, parts);
    return join(parts, " ");
}

std::string renderPgn(const GameDocument& doc, const MoverLookup& moverOf) {
    std::vector<std::string> lines;

    if (!doc.commentsAboveHeader.empty()) {
        for (const auto& c : doc.commentsAboveHeader) lines.push_back(wrapComment(c));
        lines.emplace_back();
    }

    if (!doc.headers.empty()) {
        for (const auto& h : doc.headers) {
            lines.push_back("[" + h.name + " \"" + escapePgnString(h.value) + "\"]");
        }
        lines.emplace_back();
    }

    if (!doc.comments.empty()) {
        for (const auto& c : doc.comments) lines.push_back(wrapComment(c));
        lines.emplace_back();
    }

    const std::string movetext = renderMoves(doc, kMainline, moverOf);
    if (!movetext.empty()) lines.push_back(movetext);

    lines.push_back(doc.result);
    return join(lines, "\n");
}

} // namespace pgnkit::domain::pgn
