#pragma once

#include "Types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

// 8x8 mailbox board. Holds only piece placement: no side to move,
// castling rights, en passant square or move counters.
struct BoardState {
    std::array<std::optional<Piece>, 64> squares;

    BoardState() {
        reset();
    }

    // Standard start position: Black on ranks 0-1, White on ranks 6-7
    void reset();

    void clear() {
        squares.fill(std::nullopt);
    }

    // Absent for empty and off-board squares
    [[nodiscard]] std::optional<Piece> get(Square sq) const {
        if (!sq.on_board()) return std::nullopt;
        return squares[sq.index()];
    }

    void set(Square sq, std::optional<Piece> piece) {
        if (!sq.on_board()) return;
        squares[sq.index()] = piece;
    }

    // Moves the piece on from() to to(), replacing any occupant. A pawn reaching
    // the far rank becomes move.promotion(), or a queen when none is given.
    void apply_move(const Move& move);

    [[nodiscard]] BoardState clone() const {
        return *this;
    }

    // Own material minus opponent material
    [[nodiscard]] int material_score(Colour side) const;

    // Reads the placement field of a FEN string ("startpos" for the start position).
    // Returns false and leaves the board untouched on malformed input.
    bool load_placement(std::string_view fen);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const BoardState& other) const = default;
};
