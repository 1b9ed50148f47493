#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared by the auth components.

#include <cstdint>
#include <functional>

namespace cas::foundation {

/// Tag-based strong typedef for identifier values.
///
/// Keeps user ids from being mixed with counters, ttl values or other
/// integers while sharing the same underlying representation.
///
/// @tparam Tag A unique tag type per identifier kind.
/// @tparam T   The underlying integral type.
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

struct UserIdTag {};

/// Opaque, unique identifier of a registered identity. Zero is never assigned.
using UserId = StrongId<UserIdTag>;

} // namespace cas::foundation

template <typename Tag, typename T>
struct std::hash<cas::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cas::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
