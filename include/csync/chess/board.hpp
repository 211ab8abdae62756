#pragma once

/// @file board.hpp
/// @brief Board collaborator interface and an 8x8 piece-placement board.

#include <array>
#include <cstddef>
#include <functional>
#include <optional>

#include "csync/chess/chess_types.hpp"
#include "csync/foundation/game_result.hpp"

namespace csync::chess {

/// What the session layer needs from a board.
///
/// The snapshot codec reads every occupied square through
/// forEachOccupiedSquare(); a load hands the decoded snapshot back through
/// applySnapshot(). Implementations may report squares in any order.
class IBoardModel {
public:
    using SquareVisitor = std::function<void(const PieceRecord&)>;

    virtual ~IBoardModel() = default;

    virtual void forEachOccupiedSquare(const SquareVisitor& visitor) const = 0;

    /// Replace the whole placement. The snapshot has already been validated.
    virtual void applySnapshot(const Snapshot& snapshot) = 0;
};

/// Plain 8x8 placement board. No move legality, turn order or check
/// detection: pieces go where they are told.
///
/// Example:
/// @code
///   auto board = Board::standard();
///   board.move(*Square::fromAlgebraic("e2"), *Square::fromAlgebraic("e4"));
/// @endcode
class Board final : public IBoardModel {
public:
    Board() = default;

    /// Board in the standard starting position.
    [[nodiscard]] static Board standard();

    /// Put a piece on a square, replacing whatever stood there.
    /// @return InvalidArgument for an off-board square.
    foundation::GameResult<void> place(Square square, PieceKind kind, Owner owner);

    /// Empty a square. Returns the piece that stood there, if any.
    std::optional<PieceRecord> remove(Square square);

    /// Piece on a square, if any.
    [[nodiscard]] std::optional<PieceRecord> at(Square square) const;

    /// Move the piece on @p from to @p to, capturing anything on @p to.
    /// @return InvalidArgument for off-board squares, NotFound if @p from
    ///         is empty.
    foundation::GameResult<void> move(Square from, Square to);

    void clear();

    [[nodiscard]] std::size_t pieceCount() const;

    // IBoardModel
    /// Reports squares rank 8 down to rank 1, a to h within a rank.
    void forEachOccupiedSquare(const SquareVisitor& visitor) const override;
    void applySnapshot(const Snapshot& snapshot) override;

private:
    struct Cell {
        PieceKind kind;
        Owner owner;
    };

    static constexpr std::size_t index(Square sq) {
        return static_cast<std::size_t>(sq.rank - 1) * 8 +
               static_cast<std::size_t>(sq.file - 1);
    }

    std::array<std::optional<Cell>, 64> cells_{};
};

} // namespace csync::chess
