#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared across the framework.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace csync::foundation {

/// Tag-based strong typedef for type-safe numeric ID values.
///
/// Prevents accidental mixing of different ID types at compile time
/// while keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PeerIdTag {};

/// Identifier of a connected peer (one network connection on the host).
using PeerId = StrongId<PeerIdTag>;

/// Identifier of one game session (the match id).
///
/// Host-generated ids are kLength lowercase hex characters. Ids coming from
/// outside (a load request) are opaque: any non-empty string is accepted
/// and the persistence store decides whether it exists.
class SessionId {
public:
    static constexpr std::size_t kLength = 8;

    SessionId() = default;
    explicit SessionId(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool isValid() const noexcept { return !value_.empty(); }

    /// True for ids of the shape the host generates (8 hex characters).
    [[nodiscard]] bool isCanonical() const noexcept {
        if (value_.size() != kLength) {
            return false;
        }
        for (char c : value_) {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex) {
                return false;
            }
        }
        return true;
    }

    auto operator<=>(const SessionId&) const = default;

private:
    std::string value_;
};

} // namespace csync::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<csync::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const csync::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};

template <>
struct std::hash<csync::foundation::SessionId> {
    std::size_t operator()(const csync::foundation::SessionId& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};
