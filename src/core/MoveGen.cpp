#include "MoveGen.hpp"

#include <array>
#include <utility>
#include <vector>


namespace MoveGen {

namespace {
    using Offset = std::pair<int, int>;

    constexpr std::array<Offset, 8> KNIGHT_OFFSETS = {{
        {-2, -1}, {-2, 1}, {2, -1}, {2, 1},
        {-1, -2}, {-1, 2}, {1, -2}, {1, 2}
    }};

    constexpr std::array<Offset, 4> DIAGONALS = {{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
    constexpr std::array<Offset, 4> ORTHOGONALS = {{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

    bool is_enemy(const std::optional<Piece>& target, Colour us) {
        return target && target->colour != us;
    }

    void pawn_moves(const BoardState& board, Square from, Colour us, std::vector<Move>& list) {
        const int forward = (us == Colour::White) ? -1 : 1;
        const int start_rank = (us == Colour::White) ? 6 : 1;

        Square one = from.offset(forward, 0);
        if (one.on_board() && !board.get(one)) {
            list.emplace_back(from, one);

            Square two = one.offset(forward, 0);
            if (from.rank == start_rank && two.on_board() && !board.get(two)) {
                list.emplace_back(from, two);
            }
        }

        // Captures only onto enemy pieces, there is no en passant
        for (int df : {-1, 1}) {
            Square cap = from.offset(forward, df);
            if (cap.on_board() && is_enemy(board.get(cap), us)) {
                list.emplace_back(from, cap);
            }
        }
    }

    template <size_t N>
    void jump_moves(const BoardState& board, Square from, Colour us,
                    const std::array<Offset, N>& offsets, std::vector<Move>& list) {
        for (const auto& [dr, df] : offsets) {
            Square to = from.offset(dr, df);
            if (!to.on_board()) continue;
            std::optional<Piece> target = board.get(to);
            if (!target || target->colour != us) {
                list.emplace_back(from, to);
            }
        }
    }

    template <size_t N>
    void sliding_moves(const BoardState& board, Square from, Colour us,
                       const std::array<Offset, N>& directions, std::vector<Move>& list) {
        for (const auto& [dr, df] : directions) {
            Square to = from.offset(dr, df);
            while (to.on_board()) {
                std::optional<Piece> target = board.get(to);
                if (!target) {
                    list.emplace_back(from, to);
                } else {
                    if (target->colour != us) list.emplace_back(from, to);
                    break;
                }
                to = to.offset(dr, df);
            }
        }
    }

    void king_moves(const BoardState& board, Square from, Colour us, std::vector<Move>& list) {
        for (int dr = -1; dr <= 1; ++dr) {
            for (int df = -1; df <= 1; ++df) {
                if (dr == 0 && df == 0) continue;
                Square to = from.offset(dr, df);
                if (!to.on_board()) continue;
                if (!board.get(to) || is_enemy(board.get(to), us)) {
                    list.emplace_back(from, to);
                }
            }
        }
        // No castling
    }
}

void generate_moves_from(const BoardState& board, Colour side, Square from, std::vector<Move>& move_list) {
    std::optional<Piece> piece = board.get(from);
    if (!piece || piece->colour != side) return;

    switch (piece->type) {
        case PieceType::Pawn:
            pawn_moves(board, from, side, move_list);
            break;
        case PieceType::Knight:
            jump_moves(board, from, side, KNIGHT_OFFSETS, move_list);
            break;
        case PieceType::Bishop:
            sliding_moves(board, from, side, DIAGONALS, move_list);
            break;
        case PieceType::Rook:
            sliding_moves(board, from, side, ORTHOGONALS, move_list);
            break;
        case PieceType::Queen:
            sliding_moves(board, from, side, DIAGONALS, move_list);
            sliding_moves(board, from, side, ORTHOGONALS, move_list);
            break;
        case PieceType::King:
            king_moves(board, from, side, move_list);
            break;
        default: break;
    }
}

void generate_moves(const BoardState& board, Colour side, std::vector<Move>& move_list) {
    for (int rank = 0; rank < 8; ++rank) {
        for (int file = 0; file < 8; ++file) {
            generate_moves_from(board, side, Square(rank, file), move_list);
        }
    }
}

std::vector<Move> generate_moves(const BoardState& board, Colour side) {
    std::vector<Move> moves;
    moves.reserve(64);
    generate_moves(board, side, moves);
    return moves;
}

}
