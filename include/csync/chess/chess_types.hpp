#pragma once

/// @file chess_types.hpp
/// @brief Value types describing piece placement: kinds, owners, squares,
///        piece records and snapshots.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csync::chess {

/// Piece kinds.
enum class PieceKind : uint8_t {
    Pawn,
    Knight,
    Bishop,
    Rook,
    Queen,
    King
};

/// Side owning a piece.
enum class Owner : uint8_t {
    White,
    Black
};

/// Capitalized kind name used in persistence documents ("Pawn").
constexpr std::string_view pieceKindName(PieceKind kind) {
    switch (kind) {
        case PieceKind::Pawn:   return "Pawn";
        case PieceKind::Knight: return "Knight";
        case PieceKind::Bishop: return "Bishop";
        case PieceKind::Rook:   return "Rook";
        case PieceKind::Queen:  return "Queen";
        case PieceKind::King:   return "King";
    }
    return "Unknown";
}

/// Wire letter for a kind: P N B R Q K.
constexpr char pieceKindLetter(PieceKind kind) {
    switch (kind) {
        case PieceKind::Pawn:   return 'P';
        case PieceKind::Knight: return 'N';
        case PieceKind::Bishop: return 'B';
        case PieceKind::Rook:   return 'R';
        case PieceKind::Queen:  return 'Q';
        case PieceKind::King:   return 'K';
    }
    return '?';
}

constexpr std::string_view ownerName(Owner owner) {
    return owner == Owner::White ? "White" : "Black";
}

/// Wire letter for an owner: w or b.
constexpr char ownerLetter(Owner owner) {
    return owner == Owner::White ? 'w' : 'b';
}

[[nodiscard]] std::optional<PieceKind> parsePieceKindName(std::string_view name);
[[nodiscard]] std::optional<PieceKind> parsePieceKindLetter(char letter);
[[nodiscard]] std::optional<Owner> parseOwnerName(std::string_view name);
[[nodiscard]] std::optional<Owner> parseOwnerLetter(char letter);

/// A board square. file and rank are 1-based (a1 = {1, 1}, h8 = {8, 8}).
///
/// Ordering is file-major, rank-minor: the board scan order used by
/// snapshots.
struct Square {
    static constexpr uint8_t kMin = 1;
    static constexpr uint8_t kMax = 8;

    uint8_t file = 0;
    uint8_t rank = 0;

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return file >= kMin && file <= kMax && rank >= kMin && rank <= kMax;
    }

    /// Parse "e4". Returns nullopt for anything else.
    [[nodiscard]] static std::optional<Square> fromAlgebraic(std::string_view text);

    /// "e4". Only meaningful for valid squares.
    [[nodiscard]] std::string toAlgebraic() const;

    constexpr auto operator<=>(const Square&) const = default;
};

/// One occupied square: which piece, whose, where.
struct PieceRecord {
    PieceKind kind = PieceKind::Pawn;
    Owner owner = Owner::White;
    Square square;

    bool operator==(const PieceRecord&) const = default;
};

/// Complete placement of pieces in board scan order.
struct Snapshot {
    std::vector<PieceRecord> pieces;

    [[nodiscard]] bool empty() const noexcept { return pieces.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return pieces.size(); }

    bool operator==(const Snapshot&) const = default;
};

} // namespace csync::chess
