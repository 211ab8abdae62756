#include "csync/chess/board.hpp"

#include <string>

namespace csync::chess {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

Board Board::standard() {
    Board board;
    constexpr std::array<PieceKind, 8> backRank = {
        PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
        PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook
    };
    for (uint8_t file = 1; file <= 8; ++file) {
        auto kind = backRank[file - 1];
        board.cells_[index({file, 1})] = Cell{kind, Owner::White};
        board.cells_[index({file, 2})] = Cell{PieceKind::Pawn, Owner::White};
        board.cells_[index({file, 7})] = Cell{PieceKind::Pawn, Owner::Black};
        board.cells_[index({file, 8})] = Cell{kind, Owner::Black};
    }
    return board;
}

GameResult<void> Board::place(Square square, PieceKind kind, Owner owner) {
    if (!square.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "square off the board"));
    }
    cells_[index(square)] = Cell{kind, owner};
    return GameResult<void>::ok();
}

std::optional<PieceRecord> Board::remove(Square square) {
    auto removed = at(square);
    if (removed) {
        cells_[index(square)].reset();
    }
    return removed;
}

std::optional<PieceRecord> Board::at(Square square) const {
    if (!square.isValid()) {
        return std::nullopt;
    }
    const auto& cell = cells_[index(square)];
    if (!cell) {
        return std::nullopt;
    }
    return PieceRecord{cell->kind, cell->owner, square};
}

GameResult<void> Board::move(Square from, Square to) {
    if (!from.isValid() || !to.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "square off the board"));
    }
    auto& source = cells_[index(from)];
    if (!source) {
        return GameResult<void>::err(
            GameError(ErrorCode::NotFound, "no piece on " + from.toAlgebraic()));
    }
    if (from == to) {
        return GameResult<void>::ok();
    }
    cells_[index(to)] = source;
    source.reset();
    return GameResult<void>::ok();
}

void Board::clear() {
    cells_.fill(std::nullopt);
}

std::size_t Board::pieceCount() const {
    std::size_t count = 0;
    for (const auto& cell : cells_) {
        if (cell) {
            ++count;
        }
    }
    return count;
}

void Board::forEachOccupiedSquare(const SquareVisitor& visitor) const {
    for (uint8_t rank = 8; rank >= 1; --rank) {
        for (uint8_t file = 1; file <= 8; ++file) {
            const auto& cell = cells_[index({file, rank})];
            if (cell) {
                visitor(PieceRecord{cell->kind, cell->owner, Square{file, rank}});
            }
        }
    }
}

void Board::applySnapshot(const Snapshot& snapshot) {
    clear();
    for (const auto& piece : snapshot.pieces) {
        if (piece.square.isValid()) {
            cells_[index(piece.square)] = Cell{piece.kind, piece.owner};
        }
    }
}

} // namespace csync::chess
