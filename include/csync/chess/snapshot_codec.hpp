#pragma once

/// @file snapshot_codec.hpp
/// @brief Board <-> Snapshot conversion plus the two textual forms of a
///        snapshot: the compact wire form and the persistence document.

#include <cstddef>
#include <string>
#include <string_view>

#include "csync/chess/board.hpp"
#include "csync/chess/chess_types.hpp"
#include "csync/foundation/game_result.hpp"

namespace csync::chess {

/// Pure, synchronous snapshot conversions. No I/O, no state.
///
/// Wire form: comma-separated `<kind><owner>@<square>` tokens, e.g.
/// `Rw@a1,Pw@a2,Pb@a7,Rb@a8`. The empty snapshot is the empty string.
///
/// Document form (what the persistence store holds):
/// @code
///   {"pieces":[{"pieceType":"Rook","color":"White","position":"a1"}, ...]}
/// @endcode
///
/// Every decoding entry point rejects out-of-range squares and duplicate
/// squares with MalformedSnapshot and yields pieces in scan order
/// (file a..h, rank 1..8 within a file).
class SnapshotCodec {
public:
    /// Documents larger than this are rejected before parsing.
    static constexpr std::size_t kMaxDocumentSize = 64 * 1024;

    /// Deepest object/array nesting accepted inside a document.
    static constexpr int kMaxDocumentDepth = 32;

    /// Capture the board. Total: result is in scan order whatever order the
    /// board reports its squares in.
    [[nodiscard]] static Snapshot encode(const IBoardModel& board);

    /// Validate a snapshot and return it in scan order, ready to apply.
    [[nodiscard]] static foundation::GameResult<Snapshot> decode(const Snapshot& snapshot);

    [[nodiscard]] static std::string toWire(const Snapshot& snapshot);
    [[nodiscard]] static foundation::GameResult<Snapshot> fromWire(std::string_view wire);

    [[nodiscard]] static std::string toDocument(const Snapshot& snapshot);

    /// Parse a persistence document. Whitespace is tolerated and unknown
    /// keys are skipped; a missing field, an unknown piece type, color or
    /// square, broken structure, a document over kMaxDocumentSize bytes or
    /// nesting over kMaxDocumentDepth is MalformedSnapshot.
    [[nodiscard]] static foundation::GameResult<Snapshot> fromDocument(std::string_view document);
};

} // namespace csync::chess
