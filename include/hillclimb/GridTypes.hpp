#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>

namespace hillclimb {

using Elevation = std::uint8_t;
using NodeId    = std::uint32_t;
using Distance  = std::uint32_t;

inline constexpr Elevation kLowestElevation  = 0;   // 'a'
inline constexpr Elevation kHighestElevation = 25;  // 'z'
inline constexpr NodeId    kInvalidNode      = std::numeric_limits<NodeId>::max();

struct Coord {
    std::int32_t row = 0, col = 0;
    constexpr bool operator==(const Coord&) const = default;
};

struct CoordHash {
    std::size_t operator()(const Coord& c) const noexcept {
        const std::uint64_t ur = static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.row));
        const std::uint64_t uc = static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.col));
        std::uint64_t k = (ur << 32) | uc;
        // SplitMix64 finalizer
        k += 0x9e3779b97f4a7c15ull;
        k = (k ^ (k >> 30)) * 0xbf58476d1ce4e5b9ull;
        k = (k ^ (k >> 27)) * 0x94d049bb133111ebull;
        k ^= (k >> 31);
        if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
            return static_cast<std::size_t>(k ^ (k >> 32));
        } else {
            return static_cast<std::size_t>(k);
        }
    }
};

// A step from `from` to `to` is allowed when it climbs at most one unit.
[[nodiscard]] constexpr bool CanClimb(Elevation from, Elevation to) noexcept {
    return static_cast<int>(to) <= static_cast<int>(from) + 1;
}

// Encode/decode (row,col) <-> NodeId (row-major)
[[nodiscard]] constexpr NodeId ToId(Coord c, std::int32_t cols) noexcept {
    return static_cast<NodeId>(c.row * cols + c.col);
}
[[nodiscard]] constexpr Coord FromId(NodeId id, std::int32_t cols) noexcept {
    return { static_cast<std::int32_t>(id / static_cast<NodeId>(cols)),
             static_cast<std::int32_t>(id % static_cast<NodeId>(cols)) };
}

} // namespace hillclimb
