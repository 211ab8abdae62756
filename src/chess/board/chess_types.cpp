#include "csync/chess/chess_types.hpp"

namespace csync::chess {

std::optional<PieceKind> parsePieceKindName(std::string_view name) {
    for (auto kind : {PieceKind::Pawn, PieceKind::Knight, PieceKind::Bishop,
                      PieceKind::Rook, PieceKind::Queen, PieceKind::King}) {
        if (pieceKindName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<PieceKind> parsePieceKindLetter(char letter) {
    switch (letter) {
        case 'P': return PieceKind::Pawn;
        case 'N': return PieceKind::Knight;
        case 'B': return PieceKind::Bishop;
        case 'R': return PieceKind::Rook;
        case 'Q': return PieceKind::Queen;
        case 'K': return PieceKind::King;
        default:  return std::nullopt;
    }
}

std::optional<Owner> parseOwnerName(std::string_view name) {
    if (name == "White") {
        return Owner::White;
    }
    if (name == "Black") {
        return Owner::Black;
    }
    return std::nullopt;
}

std::optional<Owner> parseOwnerLetter(char letter) {
    switch (letter) {
        case 'w': return Owner::White;
        case 'b': return Owner::Black;
        default:  return std::nullopt;
    }
}

std::optional<Square> Square::fromAlgebraic(std::string_view text) {
    if (text.size() != 2) {
        return std::nullopt;
    }
    char f = text[0];
    char r = text[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8') {
        return std::nullopt;
    }
    return Square{static_cast<uint8_t>(f - 'a' + 1),
                  static_cast<uint8_t>(r - '1' + 1)};
}

std::string Square::toAlgebraic() const {
    std::string out(2, '?');
    if (isValid()) {
        out[0] = static_cast<char>('a' + file - 1);
        out[1] = static_cast<char>('1' + rank - 1);
    }
    return out;
}

} // namespace csync::chess
