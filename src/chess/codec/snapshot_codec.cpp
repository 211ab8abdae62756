/// @file snapshot_codec.cpp
/// @brief SnapshotCodec implementation, including a small reader for the
///        persistence document.

#include "csync/chess/snapshot_codec.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace csync::chess {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<Snapshot> malformed(std::string message) {
    return GameResult<Snapshot>::err(
        GameError(ErrorCode::MalformedSnapshot, std::move(message)));
}

void sortScanOrder(std::vector<PieceRecord>& pieces) {
    std::sort(pieces.begin(), pieces.end(),
              [](const PieceRecord& a, const PieceRecord& b) {
                  return a.square < b.square;
              });
}

// ── Document reader ─────────────────────────────────────────────────────

struct DocumentReader {
    std::string_view data;
    std::size_t pos = 0;

    void skipWhitespace() {
        while (pos < data.size() &&
               (data[pos] == ' ' || data[pos] == '\t' ||
                data[pos] == '\n' || data[pos] == '\r')) {
            ++pos;
        }
    }

    bool atEnd() {
        skipWhitespace();
        return pos >= data.size();
    }

    bool peek(char c) {
        skipWhitespace();
        return pos < data.size() && data[pos] == c;
    }

    bool expect(char c) {
        if (peek(c)) {
            ++pos;
            return true;
        }
        return false;
    }

    bool readQuotedString(std::string& out) {
        skipWhitespace();
        if (pos >= data.size() || data[pos] != '"') return false;
        ++pos;
        out.clear();
        while (pos < data.size() && data[pos] != '"') {
            if (data[pos] == '\\') {
                ++pos;
                if (pos >= data.size()) return false;
                switch (data[pos]) {
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    default:   out += data[pos]; break;
                }
            } else {
                out += data[pos];
            }
            ++pos;
        }
        if (pos >= data.size()) return false;
        ++pos;  // closing quote
        return true;
    }

    /// Skip any value, including nested objects and arrays. Containers are
    /// tracked on an explicit stack; nesting beyond kMaxDocumentDepth fails.
    bool skipValue() {
        std::string closers;
        do {
            skipWhitespace();
            if (pos >= data.size()) return false;
            char c = data[pos];
            if (c == '{' || c == '[') {
                if (closers.size() >= static_cast<std::size_t>(SnapshotCodec::kMaxDocumentDepth)) {
                    return false;
                }
                ++pos;
                closers.push_back(c == '{' ? '}' : ']');
                if (expect(closers.back())) {
                    closers.pop_back();
                } else {
                    if (c == '{' && !readKey()) return false;
                    continue;
                }
            } else if (!skipScalar()) {
                return false;
            }

            // Close finished containers, then step to the next element.
            while (!closers.empty()) {
                if (expect(closers.back())) {
                    closers.pop_back();
                    continue;
                }
                if (!expect(',')) return false;
                if (closers.back() == '}' && !readKey()) return false;
                break;
            }
        } while (!closers.empty());
        return true;
    }

private:
    bool readKey() {
        std::string key;
        return readQuotedString(key) && expect(':');
    }

    bool skipScalar() {
        if (data[pos] == '"') {
            std::string dummy;
            return readQuotedString(dummy);
        }
        std::size_t start = pos;
        while (pos < data.size() && data[pos] != ',' && data[pos] != '}' &&
               data[pos] != ']' && data[pos] != ' ' && data[pos] != '\t' &&
               data[pos] != '\n' && data[pos] != '\r') {
            ++pos;
        }
        return pos > start;
    }
};

GameResult<PieceRecord> readPiece(DocumentReader& reader) {
    auto fail = [](std::string message) {
        return GameResult<PieceRecord>::err(
            GameError(ErrorCode::MalformedSnapshot, std::move(message)));
    };

    if (!reader.expect('{')) {
        return fail("expected '{' for piece");
    }

    std::optional<std::string> type;
    std::optional<std::string> color;
    std::optional<std::string> position;

    bool first = true;
    while (!reader.expect('}')) {
        if (!first && !reader.expect(',')) {
            return fail("expected ',' in piece");
        }
        first = false;

        std::string key;
        if (!reader.readQuotedString(key) || !reader.expect(':')) {
            return fail("expected key in piece");
        }

        std::optional<std::string>* slot = nullptr;
        if (key == "pieceType") {
            slot = &type;
        } else if (key == "color") {
            slot = &color;
        } else if (key == "position") {
            slot = &position;
        }

        if (slot == nullptr) {
            if (!reader.skipValue()) {
                return fail("bad value for key '" + key + "'");
            }
            continue;
        }
        std::string value;
        if (!reader.readQuotedString(value)) {
            return fail("'" + key + "' must be a string");
        }
        *slot = std::move(value);
    }

    if (!type || !color || !position) {
        return fail("piece is missing pieceType, color or position");
    }

    auto kind = parsePieceKindName(*type);
    if (!kind) {
        return fail("unknown piece type '" + *type + "'");
    }
    auto owner = parseOwnerName(*color);
    if (!owner) {
        return fail("unknown color '" + *color + "'");
    }
    auto square = Square::fromAlgebraic(*position);
    if (!square) {
        return fail("bad position '" + *position + "'");
    }
    return GameResult<PieceRecord>::ok(PieceRecord{*kind, *owner, *square});
}

GameResult<Snapshot> readPieces(DocumentReader& reader) {
    if (!reader.expect('[')) {
        return malformed("'pieces' must be an array");
    }
    Snapshot snapshot;
    if (reader.expect(']')) {
        return GameResult<Snapshot>::ok(std::move(snapshot));
    }
    while (true) {
        auto piece = readPiece(reader);
        if (!piece) {
            return GameResult<Snapshot>::err(piece.error());
        }
        snapshot.pieces.push_back(piece.value());
        if (reader.expect(']')) {
            break;
        }
        if (!reader.expect(',')) {
            return malformed("expected ',' or ']' in pieces");
        }
    }
    return GameResult<Snapshot>::ok(std::move(snapshot));
}

}  // namespace

// ---------------------------------------------------------------------------
// encode() / decode()
// ---------------------------------------------------------------------------

Snapshot SnapshotCodec::encode(const IBoardModel& board) {
    Snapshot snapshot;
    board.forEachOccupiedSquare([&snapshot](const PieceRecord& piece) {
        snapshot.pieces.push_back(piece);
    });
    sortScanOrder(snapshot.pieces);
    return snapshot;
}

GameResult<Snapshot> SnapshotCodec::decode(const Snapshot& snapshot) {
    std::array<bool, 64> occupied{};
    for (const auto& piece : snapshot.pieces) {
        if (!piece.square.isValid()) {
            return malformed("square (" + std::to_string(piece.square.file) + "," +
                             std::to_string(piece.square.rank) + ") off the board");
        }
        auto idx = static_cast<std::size_t>(piece.square.file - 1) * 8 +
                   static_cast<std::size_t>(piece.square.rank - 1);
        if (occupied[idx]) {
            return malformed("duplicate square " + piece.square.toAlgebraic());
        }
        occupied[idx] = true;
    }

    Snapshot ordered = snapshot;
    sortScanOrder(ordered.pieces);
    return GameResult<Snapshot>::ok(std::move(ordered));
}

// ---------------------------------------------------------------------------
// Wire form
// ---------------------------------------------------------------------------

std::string SnapshotCodec::toWire(const Snapshot& snapshot) {
    std::string out;
    out.reserve(snapshot.size() * 6);
    for (const auto& piece : snapshot.pieces) {
        if (!out.empty()) {
            out += ',';
        }
        out += pieceKindLetter(piece.kind);
        out += ownerLetter(piece.owner);
        out += '@';
        out += piece.square.toAlgebraic();
    }
    return out;
}

GameResult<Snapshot> SnapshotCodec::fromWire(std::string_view wire) {
    Snapshot snapshot;
    if (wire.empty()) {
        return GameResult<Snapshot>::ok(std::move(snapshot));
    }

    std::size_t start = 0;
    while (start <= wire.size()) {
        auto end = wire.find(',', start);
        if (end == std::string_view::npos) {
            end = wire.size();
        }
        auto token = wire.substr(start, end - start);
        if (token.size() != 5 || token[2] != '@') {
            return malformed("bad token '" + std::string(token) + "'");
        }
        auto kind = parsePieceKindLetter(token[0]);
        auto owner = parseOwnerLetter(token[1]);
        auto square = Square::fromAlgebraic(token.substr(3));
        if (!kind || !owner || !square) {
            return malformed("bad token '" + std::string(token) + "'");
        }
        snapshot.pieces.push_back(PieceRecord{*kind, *owner, *square});
        start = end + 1;
    }

    return decode(snapshot);
}

// ---------------------------------------------------------------------------
// Document form
// ---------------------------------------------------------------------------

std::string SnapshotCodec::toDocument(const Snapshot& snapshot) {
    std::ostringstream out;
    out << "{\"pieces\":[";
    bool first = true;
    for (const auto& piece : snapshot.pieces) {
        if (!first) {
            out << ',';
        }
        first = false;
        out << "{\"pieceType\":\"" << pieceKindName(piece.kind)
            << "\",\"color\":\"" << ownerName(piece.owner)
            << "\",\"position\":\"" << piece.square.toAlgebraic() << "\"}";
    }
    out << "]}";
    return out.str();
}

GameResult<Snapshot> SnapshotCodec::fromDocument(std::string_view document) {
    if (document.size() > kMaxDocumentSize) {
        return malformed("document of " + std::to_string(document.size()) +
                         " bytes exceeds the limit");
    }
    DocumentReader reader{document};

    if (!reader.expect('{')) {
        return malformed("expected '{'");
    }

    std::optional<Snapshot> snapshot;
    bool first = true;
    while (!reader.expect('}')) {
        if (reader.atEnd()) {
            return malformed("unexpected end of document");
        }
        if (!first && !reader.expect(',')) {
            return malformed("expected ','");
        }
        first = false;

        std::string key;
        if (!reader.readQuotedString(key) || !reader.expect(':')) {
            return malformed("expected key string");
        }
        if (key == "pieces") {
            auto pieces = readPieces(reader);
            if (!pieces) {
                return pieces;
            }
            snapshot = std::move(pieces.value());
        } else if (!reader.skipValue()) {
            return malformed("bad value for key '" + key + "'");
        }
    }

    if (!reader.atEnd()) {
        return malformed("trailing data after document");
    }
    if (!snapshot) {
        return malformed("document has no 'pieces'");
    }
    return decode(*snapshot);
}

} // namespace csync::chess
