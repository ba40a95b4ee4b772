#include "domain/chess_san_to_fen.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace pgnkit::domain::chess {

namespace {

// --------------------------- Basic board model -----------------------------

enum class PieceType { None, Pawn, Knight, Bishop, Rook, Queen, King };

struct Piece {
    PieceType type{PieceType::None};
    Side side{Side::White};

    bool empty() const { return type == PieceType::None; }
    bool is(PieceType t, Side s) const { return type == t && side == s; }
};

inline int fileOf(int sq) { return sq & 7; }
inline int rankOf(int sq) { return sq >> 3; }
inline bool onBoard(int f, int r) { return f >= 0 && f < 8 && r >= 0 && r < 8; }
inline int sqOf(int f, int r) { return (r << 3) | f; }

inline char fileChar(int f) { return static_cast<char>('a' + f); }
inline char rankChar(int r) { return static_cast<char>('1' + r); }

inline std::string squareName(int sq) {
    std::string s;
    s.push_back(fileChar(fileOf(sq)));
    s.push_back(rankChar(rankOf(sq)));
    return s;
}

inline std::optional<int> parseSquare(std::string_view sv) {
    if (sv.size() != 2) return std::nullopt;
    const char f = sv[0];
    const char r = sv[1];
    if (f < 'a' || f > 'h') return std::nullopt;
    if (r < '1' || r > '8') return std::nullopt;
    return sqOf(f - 'a', r - '1');
}

// SAN piece letter; pawns have none.
inline char pieceLetter(PieceType t) {
    switch (t) {
        case PieceType::Knight: return 'N';
        case PieceType::Bishop: return 'B';
        case PieceType::Rook:   return 'R';
        case PieceType::Queen:  return 'Q';
        case PieceType::King:   return 'K';
        default:                return 0;
    }
}

inline std::optional<PieceType> pieceFromLetter(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'P': return PieceType::Pawn;
        case 'N': return PieceType::Knight;
        case 'B': return PieceType::Bishop;
        case 'R': return PieceType::Rook;
        case 'Q': return PieceType::Queen;
        case 'K': return PieceType::King;
        default:  return std::nullopt;
    }
}

inline char toFenChar(const Piece& p) {
    const char c = (p.type == PieceType::Pawn) ? 'P' : pieceLetter(p.type);
    if (!c) return 0;
    return (p.side == Side::White) ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline std::optional<Piece> fromFenChar(char c) {
    const auto type = pieceFromLetter(c);
    if (!type) return std::nullopt;
    const bool white = std::isupper(static_cast<unsigned char>(c)) != 0;
    return Piece{*type, white ? Side::White : Side::Black};
}

// ------------------------------ Move model --------------------------------

struct Move {
    int from{-1};
    int to{-1};
    PieceType promotion{PieceType::None};
    bool capture{false};
    bool enPassant{false};
    bool castleKing{false};
    bool castleQueen{false};

    bool isCastle() const { return castleKing || castleQueen; }
};

struct CastlingRights {
    bool whiteKing{false};
    bool whiteQueen{false};
    bool blackKing{false};
    bool blackQueen{false};

    bool kingSide(Side s) const { return s == Side::White ? whiteKing : blackKing; }
    bool queenSide(Side s) const { return s == Side::White ? whiteQueen : blackQueen; }
};

constexpr int kKnightDeltas[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kKingDeltas[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int kDiagonals[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kOrthogonals[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr PieceType kPromotions[4] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};

// ------------------------------ Position ----------------------------------

class Position {
public:
    static std::optional<Position> fromFen(const std::string& fen) {
        std::istringstream in(fen);
        std::string placement, active, castling, ep;
        int half = 0, full = 1;
        if (!(in >> placement >> active >> castling >> ep >> half >> full)) {
            return std::nullopt;
        }
        if (half < 0 || full < 1) return std::nullopt;

        Position p;
        int r = 7;
        int f = 0;
        int kings[2] = {0, 0};
        for (char c : placement) {
            if (c == '/') {
                if (f != 8 || r == 0) return std::nullopt;
                --r;
                f = 0;
                continue;
            }
            if (c >= '1' && c <= '8') {
                f += (c - '0');
                if (f > 8) return std::nullopt;
                continue;
            }
            const auto pc = fromFenChar(c);
            if (!pc || !onBoard(f, r)) return std::nullopt;
            if (pc->type == PieceType::King) ++kings[static_cast<int>(pc->side)];
            p.board_[sqOf(f, r)] = *pc;
            ++f;
        }
        if (r != 0 || f != 8) return std::nullopt;
        if (kings[0] != 1 || kings[1] != 1) return std::nullopt;

        if (active == "w") p.stm_ = Side::White;
        else if (active == "b") p.stm_ = Side::Black;
        else return std::nullopt;

        if (castling != "-") {
            for (char c : castling) {
                if (c == 'K') p.castling_.whiteKing = true;
                else if (c == 'Q') p.castling_.whiteQueen = true;
                else if (c == 'k') p.castling_.blackKing = true;
                else if (c == 'q') p.castling_.blackQueen = true;
                else return std::nullopt;
            }
        }

        if (ep != "-") {
            const auto sq = parseSquare(ep);
            if (!sq) return std::nullopt;
            p.ep_ = *sq;
        }

        p.halfmove_ = half;
        p.fullmove_ = full;
        return p;
    }

    std::string toFen() const {
        std::string placement;
        placement.reserve(80);
        for (int r = 7; r >= 0; --r) {
            int emptyRun = 0;
            for (int f = 0; f < 8; ++f) {
                const Piece& p = board_[sqOf(f, r)];
                if (p.empty()) {
                    ++emptyRun;
                    continue;
                }
                if (emptyRun > 0) {
                    placement.push_back(static_cast<char>('0' + emptyRun));
                    emptyRun = 0;
                }
                placement.push_back(toFenChar(p));
            }
            if (emptyRun > 0) placement.push_back(static_cast<char>('0' + emptyRun));
            if (r != 0) placement.push_back('/');
        }

        std::string cast;
        if (castling_.whiteKing) cast.push_back('K');
        if (castling_.whiteQueen) cast.push_back('Q');
        if (castling_.blackKing) cast.push_back('k');
        if (castling_.blackQueen) cast.push_back('q');
        if (cast.empty()) cast = "-";

        std::ostringstream out;
        out << placement << ' ' << to_string(stm_) << ' ' << cast << ' '
            << (ep_ ? squareName(*ep_) : std::string("-")) << ' '
            << halfmove_ << ' ' << fullmove_;
        return out.str();
    }

    Side sideToMove() const { return stm_; }
    int fullmove() const { return fullmove_; }
    const Piece& at(int sq) const { return board_[sq]; }

    bool inCheck(Side s) const {
        const auto ks = kingSquare(s);
        return ks && attacked(*ks, opposite(s));
    }

    std::vector<Move> legalMoves() const {
        std::vector<Move> pseudo;
        pseudo.reserve(64);
        generatePseudo(pseudo);

        std::vector<Move> out;
        out.reserve(pseudo.size());
        for (const auto& m : pseudo) {
            if (m.isCastle() && !castlePathSafe(stm_, m.castleKing)) continue;
            Position next = *this;
            next.play(m);
            if (next.inCheck(stm_)) continue;
            out.push_back(m);
        }
        return out;
    }

    // m must come from legalMoves() of this position.
    void play(const Move& m) {
        const Side us = stm_;
        const Piece moving = board_[m.from];
        ep_.reset();

        if (m.isCastle()) {
            const int home = (us == Side::White) ? 0 : 7;
            const int rookFrom = sqOf(m.castleKing ? 7 : 0, home);
            const int rookTo = sqOf(m.castleKing ? 5 : 3, home);
            board_[m.to] = moving;
            board_[m.from] = Piece{};
            board_[rookTo] = board_[rookFrom];
            board_[rookFrom] = Piece{};
            ++halfmove_;
        } else {
            if (m.enPassant) {
                board_[sqOf(fileOf(m.to), rankOf(m.from))] = Piece{};
            }
            board_[m.to] = (m.promotion != PieceType::None) ? Piece{m.promotion, us} : moving;
            board_[m.from] = Piece{};

            const bool pawnMove = moving.type == PieceType::Pawn;
            if (pawnMove && (rankOf(m.to) - rankOf(m.from) == 2 || rankOf(m.from) - rankOf(m.to) == 2)) {
                const int target = sqOf(fileOf(m.from), (rankOf(m.from) + rankOf(m.to)) / 2);
                if (epCapturePossible(opposite(us), target)) ep_ = target;
            }
            halfmove_ = (pawnMove || m.capture) ? 0 : halfmove_ + 1;
        }

        // Any move from or onto a king or rook home square drops the matching rights.
        for (int sq : {m.from, m.to}) {
            if (sq == sqOf(4, 0)) castling_.whiteKing = castling_.whiteQueen = false;
            if (sq == sqOf(4, 7)) castling_.blackKing = castling_.blackQueen = false;
            if (sq == sqOf(0, 0)) castling_.whiteQueen = false;
            if (sq == sqOf(7, 0)) castling_.whiteKing = false;
            if (sq == sqOf(0, 7)) castling_.blackQueen = false;
            if (sq == sqOf(7, 7)) castling_.blackKing = false;
        }

        if (us == Side::Black) ++fullmove_;
        stm_ = opposite(us);
    }

    // Canonical SAN. legal must be legalMoves() of this position.
    std::string toSan(const Move& m, const std::vector<Move>& legal, bool withSuffix) const {
        std::string san;
        if (m.isCastle()) {
            san = m.castleKing ? "O-O" : "O-O-O";
        } else {
            const Piece& p = board_[m.from];
            if (p.type == PieceType::Pawn) {
                if (m.capture) {
                    san.push_back(fileChar(fileOf(m.from)));
                    san.push_back('x');
                }
                san += squareName(m.to);
                if (m.promotion != PieceType::None) {
                    san.push_back('=');
                    san.push_back(pieceLetter(m.promotion));
                }
            } else {
                san.push_back(pieceLetter(p.type));
                bool ambiguous = false;
                bool sameFile = false;
                bool sameRank = false;
                for (const auto& o : legal) {
                    if (o.from == m.from || o.to != m.to || o.isCastle()) continue;
                    if (board_[o.from].type != p.type) continue;
                    ambiguous = true;
                    if (fileOf(o.from) == fileOf(m.from)) sameFile = true;
                    if (rankOf(o.from) == rankOf(m.from)) sameRank = true;
                }
                if (ambiguous) {
                    if (!sameFile) {
                        san.push_back(fileChar(fileOf(m.from)));
                    } else if (!sameRank) {
                        san.push_back(rankChar(rankOf(m.from)));
                    } else {
                        san += squareName(m.from);
                    }
                }
                if (m.capture) san.push_back('x');
                san += squareName(m.to);
            }
        }

        if (withSuffix) {
            Position next = *this;
            next.play(m);
            if (next.inCheck(next.stm_)) {
                san.push_back(next.legalMoves().empty() ? '#' : '+');
            }
        }
        return san;
    }

    std::string toUci(const Move& m) const {
        std::string uci = squareName(m.from) + squareName(m.to);
        if (m.promotion != PieceType::None) {
            uci.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(pieceLetter(m.promotion)))));
        }
        return uci;
    }

private:
    std::optional<int> kingSquare(Side s) const {
        for (int i = 0; i < 64; ++i) {
            if (board_[i].is(PieceType::King, s)) return i;
        }
        return std::nullopt;
    }

    bool attacked(int sq, Side by) const {
        const int f = fileOf(sq);
        const int r = rankOf(sq);

        // Pawns attack diagonally forward, so look one rank behind the target.
        const int pr = (by == Side::White) ? r - 1 : r + 1;
        for (int df : {-1, 1}) {
            if (onBoard(f + df, pr) && board_[sqOf(f + df, pr)].is(PieceType::Pawn, by)) return true;
        }

        for (const auto& d : kKnightDeltas) {
            if (onBoard(f + d[0], r + d[1]) && board_[sqOf(f + d[0], r + d[1])].is(PieceType::Knight, by)) return true;
        }
        for (const auto& d : kKingDeltas) {
            if (onBoard(f + d[0], r + d[1]) && board_[sqOf(f + d[0], r + d[1])].is(PieceType::King, by)) return true;
        }

        auto rayHits = [&](const int (&dirs)[4][2], PieceType slider) {
            for (const auto& d : dirs) {
                int nf = f + d[0];
                int nr = r + d[1];
                while (onBoard(nf, nr)) {
                    const Piece& p = board_[sqOf(nf, nr)];
                    if (!p.empty()) {
                        if (p.side == by && (p.type == slider || p.type == PieceType::Queen)) return true;
                        break;
                    }
                    nf += d[0];
                    nr += d[1];
                }
            }
            return false;
        };
        return rayHits(kDiagonals, PieceType::Bishop) || rayHits(kOrthogonals, PieceType::Rook);
    }

    // King not in check and the squares it crosses are not attacked.
    bool castlePathSafe(Side mover, bool kingSide) const {
        const int home = (mover == Side::White) ? 0 : 7;
        const Side them = opposite(mover);
        if (attacked(sqOf(4, home), them)) return false;
        const int step = kingSide ? 1 : -1;
        return !attacked(sqOf(4 + step, home), them) && !attacked(sqOf(4 + 2 * step, home), them);
    }

    bool epCapturePossible(Side capturer, int target) const {
        const int f = fileOf(target);
        const int pawnRank = (capturer == Side::White) ? rankOf(target) - 1 : rankOf(target) + 1;
        for (int df : {-1, 1}) {
            if (onBoard(f + df, pawnRank) && board_[sqOf(f + df, pawnRank)].is(PieceType::Pawn, capturer)) return true;
        }
        return false;
    }

    void addPawnMoves(int sq, std::vector<Move>& out) const {
        const int f = fileOf(sq);
        const int r = rankOf(sq);
        const int dir = (stm_ == Side::White) ? 1 : -1;
        const int startRank = (stm_ == Side::White) ? 1 : 6;
        const int promoRank = (stm_ == Side::White) ? 7 : 0;

        auto push = [&](int to, bool capture, bool enPassant) {
            if (rankOf(to) == promoRank) {
                for (PieceType pr : kPromotions) {
                    Move m;
                    m.from = sq;
                    m.to = to;
                    m.capture = capture;
                    m.promotion = pr;
                    out.push_back(m);
                }
                return;
            }
            Move m;
            m.from = sq;
            m.to = to;
            m.capture = capture;
            m.enPassant = enPassant;
            out.push_back(m);
        };

        if (onBoard(f, r + dir) && board_[sqOf(f, r + dir)].empty()) {
            push(sqOf(f, r + dir), false, false);
            if (r == startRank && board_[sqOf(f, r + 2 * dir)].empty()) {
                push(sqOf(f, r + 2 * dir), false, false);
            }
        }

        for (int df : {-1, 1}) {
            if (!onBoard(f + df, r + dir)) continue;
            const int to = sqOf(f + df, r + dir);
            const Piece& target = board_[to];
            if (!target.empty() && target.side != stm_) {
                push(to, true, false);
            } else if (target.empty() && ep_ && *ep_ == to) {
                push(to, true, true);
            }
        }
    }

    template <std::size_t N>
    void addStepMoves(int sq, const int (&deltas)[N][2], std::vector<Move>& out) const {
        for (const auto& d : deltas) {
            const int nf = fileOf(sq) + d[0];
            const int nr = rankOf(sq) + d[1];
            if (!onBoard(nf, nr)) continue;
            const Piece& target = board_[sqOf(nf, nr)];
            if (!target.empty() && target.side == stm_) continue;
            Move m;
            m.from = sq;
            m.to = sqOf(nf, nr);
            m.capture = !target.empty();
            out.push_back(m);
        }
    }

    void addSlideMoves(int sq, const int (&dirs)[4][2], std::vector<Move>& out) const {
        for (const auto& d : dirs) {
            int nf = fileOf(sq) + d[0];
            int nr = rankOf(sq) + d[1];
            while (onBoard(nf, nr)) {
                const Piece& target = board_[sqOf(nf, nr)];
                if (!target.empty() && target.side == stm_) break;
                Move m;
                m.from = sq;
                m.to = sqOf(nf, nr);
                m.capture = !target.empty();
                out.push_back(m);
                if (!target.empty()) break;
                nf += d[0];
                nr += d[1];
            }
        }
    }

    void addCastling(std::vector<Move>& out) const {
        const int home = (stm_ == Side::White) ? 0 : 7;
        if (!board_[sqOf(4, home)].is(PieceType::King, stm_)) return;

        if (castling_.kingSide(stm_) && board_[sqOf(7, home)].is(PieceType::Rook, stm_) &&
            board_[sqOf(5, home)].empty() && board_[sqOf(6, home)].empty()) {
            Move m;
            m.from = sqOf(4, home);
            m.to = sqOf(6, home);
            m.castleKing = true;
            out.push_back(m);
        }
        if (castling_.queenSide(stm_) && board_[sqOf(0, home)].is(PieceType::Rook, stm_) &&
            board_[sqOf(1, home)].empty() && board_[sqOf(2, home)].empty() && board_[sqOf(3, home)].empty()) {
            Move m;
            m.from = sqOf(4, home);
            m.to = sqOf(2, home);
            m.castleQueen = true;
            out.push_back(m);
        }
    }

    void generatePseudo(std::vector<Move>& out) const {
        for (int sq = 0; sq < 64; ++sq) {
            const Piece& p = board_[sq];
            if (p.empty() || p.side != stm_) continue;
            switch (p.type) {
                case PieceType::Pawn:   addPawnMoves(sq, out); break;
                case PieceType::Knight: addStepMoves(sq, kKnightDeltas, out); break;
                case PieceType::Bishop: addSlideMoves(sq, kDiagonals, out); break;
                case PieceType::Rook:   addSlideMoves(sq, kOrthogonals, out); break;
                case PieceType::Queen:
                    addSlideMoves(sq, kDiagonals, out);
                    addSlideMoves(sq, kOrthogonals, out);
                    break;
                case PieceType::King:
                    addStepMoves(sq, kKingDeltas, out);
                    addCastling(out);
                    break;
                default: break;
            }
        }
    }

    std::array<Piece, 64> board_{};
    Side stm_{Side::White};
    CastlingRights castling_;
    std::optional<int> ep_;
    int halfmove_{0};
    int fullmove_{1};
};

// ------------------------------ Notation ----------------------------------

inline std::string trim(std::string_view v) {
    size_t b = 0;
    while (b < v.size() && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    size_t e = v.size();
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return std::string(v.substr(b, e - b));
}

std::string stripDecorations(std::string s) {
    // Trailing check/mate and annotation marks.
    while (!s.empty()) {
        const char c = s.back();
        if (c == '+' || c == '#' || c == '!' || c == '?') {
            s.pop_back();
        } else {
            break;
        }
    }
    return s;
}

// Comparison key for the strict pass: no decorations, no promotion '='.
std::string strictKey(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : stripDecorations(s)) {
        if (c != '=') out.push_back(c);
    }
    return out;
}

std::string stripLeadingMoveNumber(std::string s) {
    // "1.d4", "12...Nf6"
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0 || i >= s.size() || s[i] != '.') return s;
    while (i < s.size() && s[i] == '.') ++i;
    return s.substr(i);
}

enum class SpecKind { Piece, CastleKing, CastleQueen, Coordinate };

struct MoveSpec {
    SpecKind kind{SpecKind::Piece};
    PieceType piece{PieceType::Pawn};
    int to{-1};
    std::optional<int> from;     // coordinate notation only
    std::optional<int> disFile;  // 0..7
    std::optional<int> disRank;  // 0..7
    std::optional<PieceType> promo;
};

std::optional<MoveSpec> parseCoordinate(const std::string& token) {
    // e2e4, e2-e4, e7e8q, e7e8=Q
    std::string t;
    for (char c : token) {
        if (c != '-' && c != '=') t.push_back(c);
    }
    if (t.size() != 4 && t.size() != 5) return std::nullopt;
    const auto from = parseSquare(std::string_view(t).substr(0, 2));
    const auto to = parseSquare(std::string_view(t).substr(2, 2));
    if (!from || !to) return std::nullopt;

    MoveSpec spec;
    spec.kind = SpecKind::Coordinate;
    spec.from = *from;
    spec.to = *to;
    if (t.size() == 5) {
        const auto pr = pieceFromLetter(t[4]);
        if (!pr || *pr == PieceType::Pawn || *pr == PieceType::King) return std::nullopt;
        spec.promo = *pr;
    }
    return spec;
}

std::optional<MoveSpec> parseSanToken(const std::string& token) {
    if (token.empty()) return std::nullopt;

    MoveSpec spec;
    if (token == "O-O" || token == "0-0" || token == "o-o") {
        spec.kind = SpecKind::CastleKing;
        return spec;
    }
    if (token == "O-O-O" || token == "0-0-0" || token == "o-o-o") {
        spec.kind = SpecKind::CastleQueen;
        return spec;
    }

    std::string t;
    for (char c : token) {
        if (c != '-') t.push_back(c);
    }
    if (t.empty()) return std::nullopt;

    size_t i = 0;
    const char c0 = t[0];
    if (c0 == 'N' || c0 == 'B' || c0 == 'R' || c0 == 'Q' || c0 == 'K' || c0 == 'P') {
        spec.piece = *pieceFromLetter(c0);
        i = 1;
    }

    std::string_view core = t;
    const size_t promoPos = t.find('=');
    if (promoPos != std::string::npos) {
        if (promoPos + 2 != t.size()) return std::nullopt;
        const auto pr = pieceFromLetter(t[promoPos + 1]);
        if (!pr || *pr == PieceType::Pawn || *pr == PieceType::King) return std::nullopt;
        spec.promo = *pr;
        core = std::string_view(t.data(), promoPos);
    } else if (spec.piece == PieceType::Pawn && t.size() >= 3 &&
               std::isupper(static_cast<unsigned char>(t.back()))) {
        // "e8Q"
        const auto pr = pieceFromLetter(t.back());
        if (!pr || *pr == PieceType::Pawn || *pr == PieceType::King) return std::nullopt;
        spec.promo = *pr;
        core = std::string_view(t.data(), t.size() - 1);
    }

    if (core.size() < i + 2) return std::nullopt;
    const auto toSq = parseSquare(core.substr(core.size() - 2));
    if (!toSq) return std::nullopt;
    spec.to = *toSq;

    std::string mods;
    for (char c : core.substr(i, core.size() - 2 - i)) {
        if (c != 'x' && c != ':') mods.push_back(c);
    }

    if (spec.piece == PieceType::Pawn) {
        if (mods.empty()) return spec;
        if (mods.size() == 1 && mods[0] >= 'a' && mods[0] <= 'h') {
            spec.disFile = mods[0] - 'a';
            return spec;
        }
        return std::nullopt;
    }

    for (char d : mods) {
        if (d >= 'a' && d <= 'h' && !spec.disFile) spec.disFile = d - 'a';
        else if (d >= '1' && d <= '8' && !spec.disRank) spec.disRank = d - '1';
        else return std::nullopt;
    }
    return spec;
}

std::optional<Move> matchStrict(const Position& pos, const std::vector<Move>& legal,
                                const std::string& text) {
    const std::string wanted = strictKey(text);
    for (const auto& m : legal) {
        if (strictKey(pos.toSan(m, legal, false)) == wanted) return m;
    }
    return std::nullopt;
}

std::optional<Move> matchPermissive(const Position& pos, const std::vector<Move>& legal,
                                    const std::string& text, std::string& err) {
    const std::string token = stripDecorations(stripLeadingMoveNumber(text));

    auto spec = parseSanToken(token);
    if (!spec) spec = parseCoordinate(token);
    if (!spec) {
        err = "Cannot parse move";
        return std::nullopt;
    }

    std::vector<Move> matches;
    for (const auto& m : legal) {
        switch (spec->kind) {
            case SpecKind::CastleKing:
                if (m.castleKing) matches.push_back(m);
                continue;
            case SpecKind::CastleQueen:
                if (m.castleQueen) matches.push_back(m);
                continue;
            case SpecKind::Coordinate:
                if (m.from != *spec->from || m.to != spec->to) continue;
                break;
            case SpecKind::Piece:
                if (m.isCastle() || m.to != spec->to) continue;
                if (pos.at(m.from).type != spec->piece) continue;
                if (spec->disFile && fileOf(m.from) != *spec->disFile) continue;
                if (spec->disRank && rankOf(m.from) != *spec->disRank) continue;
                break;
        }
        // A promotion must name its piece; a non-promotion must not.
        if (spec->promo.value_or(PieceType::None) != m.promotion) continue;
        matches.push_back(m);
    }

    if (matches.empty()) {
        err = "No legal move matches";
        return std::nullopt;
    }
    if (matches.size() > 1) {
        err = "Ambiguous move (multiple legal moves match)";
        return std::nullopt;
    }
    return matches.front();
}

} // namespace

MoveApplyResult applyMove(const std::string& fen, const std::string& moveText, bool strict) {
    MoveApplyResult res;

    auto pos = Position::fromFen(fen);
    if (!pos) {
        res.error = "Invalid FEN: '" + fen + "'";
        return res;
    }

    const std::string text = trim(moveText);
    if (text.empty()) {
        res.error = "Empty move";
        return res;
    }

    const auto legal = pos->legalMoves();
    std::optional<Move> mv;
    if (strict) {
        mv = matchStrict(*pos, legal, text);
        if (!mv) {
            res.error = "Not a legal move in SAN: '" + text + "'";
            return res;
        }
    } else {
        std::string err;
        mv = matchPermissive(*pos, legal, text, err);
        if (!mv) {
            res.error = err + ": '" + text + "'";
            return res;
        }
    }

    res.san = pos->toSan(*mv, legal, true);
    res.uci = pos->toUci(*mv);
    pos->play(*mv);
    res.fenAfter = pos->toFen();
    res.sideToMove = pos->sideToMove();
    res.ok = true;
    return res;
}

MoveApplyResult playMove(const std::string& fen, const std::string& moveText, bool permissiveFallback) {
    auto res = applyMove(fen, moveText, true);
    if (res.ok || !permissiveFallback) return res;

    return applyMove(fen, moveText, false);
}

std::optional<Side> sideToMove(const std::string& fen) {
    const auto pos = Position::fromFen(fen);
    if (!pos) return std::nullopt;
    return pos->sideToMove();
}

std::optional<int> fullmoveNumber(const std::string& fen) {
    const auto pos = Position::fromFen(fen);
    if (!pos) return std::nullopt;
    return pos->fullmove();
}

bool isValidFen(const std::string& fen) {
    return Position::fromFen(fen).has_value();
}

} // namespace pgnkit::domain::chess
