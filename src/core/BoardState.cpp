#include "BoardState.hpp"
#include "Evaluation.hpp"

#include <cctype>
#include <sstream>


namespace {
    constexpr std::array<PieceType, 8> BACK_RANK = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook
    };

    std::optional<Piece> piece_from_char(char c) {
        Colour colour = std::isupper(static_cast<unsigned char>(c)) ? Colour::White : Colour::Black;
        switch (std::tolower(static_cast<unsigned char>(c))) {
            case 'p': return Piece(colour, PieceType::Pawn);
            case 'n': return Piece(colour, PieceType::Knight);
            case 'b': return Piece(colour, PieceType::Bishop);
            case 'r': return Piece(colour, PieceType::Rook);
            case 'q': return Piece(colour, PieceType::Queen);
            case 'k': return Piece(colour, PieceType::King);
            default: return std::nullopt;
        }
    }
}

void BoardState::reset() {
    clear();
    for (int file = 0; file < 8; ++file) {
        set(Square(0, file), Piece(Colour::Black, BACK_RANK[file]));
        set(Square(1, file), Piece(Colour::Black, PieceType::Pawn));
        set(Square(6, file), Piece(Colour::White, PieceType::Pawn));
        set(Square(7, file), Piece(Colour::White, BACK_RANK[file]));
    }
}

void BoardState::apply_move(const Move& move) {
    std::optional<Piece> moving = get(move.from());
    if (!moving) return;

    Piece placed = *moving;

    // Promotion kind is taken as given, no check that it is a sensible piece
    if (placed.type == PieceType::Pawn) {
        int last_rank = (placed.colour == Colour::White) ? 0 : 7;
        if (move.to().rank == last_rank) {
            placed.type = move.promotion().value_or(PieceType::Queen);
        }
    }

    set(move.to(), placed);
    set(move.from(), std::nullopt);
}

int BoardState::material_score(Colour side) const {
    int score = 0;
    for (const auto& sq : squares) {
        if (!sq) continue;
        int value = Evaluation::material_value(sq->type);
        score += (sq->colour == side) ? value : -value;
    }
    return score;
}

bool BoardState::load_placement(std::string_view fen) {
    if (fen == "startpos") {
        reset();
        return true;
    }

    std::string_view placement = fen.substr(0, fen.find(' '));

    BoardState parsed;
    parsed.clear();

    int rank = 0;
    int file = 0;
    for (char c : placement) {
        if (c == '/') {
            if (file != 8) return false;
            rank++;
            file = 0;
            if (rank > 7) return false;
        } else if (c >= '1' && c <= '8') {
            file += (c - '0');
            if (file > 8) return false;
        } else {
            std::optional<Piece> piece = piece_from_char(c);
            if (!piece || file > 7) return false;
            parsed.set(Square(rank, file), piece);
            file++;
        }
    }

    if (rank != 7 || file != 8) return false;

    squares = parsed.squares;
    return true;
}

std::string BoardState::to_string() const {
    std::ostringstream ss;
    for (int rank = 0; rank < 8; ++rank) {
        for (int file = 0; file < 8; ++file) {
            std::optional<Piece> p = get(Square(rank, file));
            ss << (p ? p->to_char() : '.');
            if (file < 7) ss << ' ';
        }
        ss << '\n';
    }
    return ss.str();
}
