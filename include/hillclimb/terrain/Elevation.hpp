#pragma once
#include "hillclimb/Errors.hpp"

#include <array>
#include <expected>
#include <variant>

namespace hillclimb::terrain {

struct StartCell {
    constexpr bool operator==(const StartCell&) const = default;
};
struct EndCell {
    constexpr bool operator==(const EndCell&) const = default;
};
struct PlainCell {
    Elevation elevation = kLowestElevation;
    constexpr bool operator==(const PlainCell&) const = default;
};

// Closed set of roles a grid cell can take.
using CellRole = std::variant<StartCell, EndCell, PlainCell>;

[[nodiscard]] constexpr Elevation ElevationOf(const CellRole& role) noexcept {
    if (const auto* p = std::get_if<PlainCell>(&role)) return p->elevation;
    if (std::holds_alternative<StartCell>(role)) return kLowestElevation;
    return kHighestElevation;
}

[[nodiscard]] constexpr bool IsStart(const CellRole& role) noexcept { return std::holds_alternative<StartCell>(role); }
[[nodiscard]] constexpr bool IsEnd(const CellRole& role) noexcept   { return std::holds_alternative<EndCell>(role); }

[[nodiscard]] const char* RoleName(const CellRole& role) noexcept;

// Symbol -> role lookup; 256 entries built at compile time.
class ElevationTable {
public:
    enum class Kind : std::uint8_t { Invalid, Start, End, Plain };

    struct Entry {
        Kind      kind = Kind::Invalid;
        Elevation elevation = 0;
    };

    constexpr ElevationTable() {
        for (char c = 'a'; c <= 'z'; ++c)
            _entries[static_cast<unsigned char>(c)] = { Kind::Plain, static_cast<Elevation>(c - 'a') };
        _entries[static_cast<unsigned char>('S')] = { Kind::Start, kLowestElevation };
        _entries[static_cast<unsigned char>('E')] = { Kind::End, kHighestElevation };
    }

    [[nodiscard]] constexpr const Entry& lookup(char c) const noexcept {
        return _entries[static_cast<unsigned char>(c)];
    }

    [[nodiscard]] static const ElevationTable& Default() noexcept;

private:
    std::array<Entry, 256> _entries{};
};

// 'S' -> StartCell, 'E' -> EndCell, 'a'..'z' -> PlainCell{0..25}.
// `at` is only used to locate the failure in the returned error.
[[nodiscard]] std::expected<CellRole, Error> DecodeElevation(char symbol,
                                                             const ElevationTable& table = ElevationTable::Default(),
                                                             Coord at = {});

} // namespace hillclimb::terrain
