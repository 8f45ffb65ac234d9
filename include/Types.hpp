#pragma once

#include <cstdint>
#include <optional>
#include <string>


enum class Colour : uint8_t { White, Black, None };
enum class PieceType : uint8_t { Pawn, Knight, Bishop, Rook, Queen, King, None };

constexpr Colour opposite(Colour c) {
    if (c == Colour::None) return Colour::None;
    return (c == Colour::White) ? Colour::Black : Colour::White;
}

// Rank 0 is Black's back rank (top of the screen), rank 7 is White's.
struct Square {
    int rank{0};
    int file{0};

    constexpr Square() = default;
    constexpr Square(int r, int f) : rank(r), file(f) {}

    [[nodiscard]] constexpr bool on_board() const {
        return rank >= 0 && rank < 8 && file >= 0 && file < 8;
    }

    // Row-major index, only meaningful when on_board()
    [[nodiscard]] constexpr int index() const {
        return rank * 8 + file;
    }

    [[nodiscard]] constexpr Square offset(int dr, int df) const {
        return Square(rank + dr, file + df);
    }

    bool operator==(const Square& other) const = default;
};

struct Piece {
    Colour colour{Colour::None};
    PieceType type{PieceType::None};

    constexpr Piece() = default;
    constexpr Piece(Colour c, PieceType t) : colour(c), type(t) {}

    // FEN letter: upper case for White, lower case for Black
    [[nodiscard]] constexpr char to_char() const {
        constexpr char letters[] = {'p', 'n', 'b', 'r', 'q', 'k', '?'};
        char c = letters[static_cast<int>(type)];
        return (colour == Colour::White && c != '?') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    bool operator==(const Piece& other) const = default;
};

struct Move {
    Square src;
    Square dst;
    std::optional<PieceType> promo;

    constexpr Move() = default;

    constexpr Move(Square from, Square to, std::optional<PieceType> promotion = std::nullopt)
        : src(from), dst(to), promo(promotion) {}

    [[nodiscard]] constexpr Square from() const { return src; }

    [[nodiscard]] constexpr Square to() const { return dst; }

    [[nodiscard]] constexpr std::optional<PieceType> promotion() const { return promo; }

    [[nodiscard]] constexpr bool same_squares(const Move& other) const {
        return src == other.src && dst == other.dst;
    }

    bool operator==(const Move& other) const = default;
};

// Algebraic name, "a8" for (0,0) and "h1" for (7,7)
inline std::string square_name(Square sq) {
    if (!sq.on_board()) return "-";
    return std::string{static_cast<char>('a' + sq.file), static_cast<char>('8' - sq.rank)};
}

inline std::string move_name(const Move& m) {
    std::string s = square_name(m.from()) + square_name(m.to());
    if (m.promotion()) s += static_cast<char>(Piece(Colour::Black, *m.promotion()).to_char());
    return s;
}
