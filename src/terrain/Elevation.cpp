#include "hillclimb/terrain/Elevation.hpp"

namespace hillclimb::terrain {

namespace {
constexpr ElevationTable kTable{};
} // namespace

const ElevationTable& ElevationTable::Default() noexcept
{
    return kTable;
}

const char* RoleName(const CellRole& role) noexcept
{
    struct Visitor {
        const char* operator()(const StartCell&) const noexcept { return "Start"; }
        const char* operator()(const EndCell&) const noexcept   { return "End"; }
        const char* operator()(const PlainCell&) const noexcept { return "Plain"; }
    };
    return std::visit(Visitor{}, role);
}

std::expected<CellRole, Error> DecodeElevation(char symbol, const ElevationTable& table, Coord at)
{
    const auto& e = table.lookup(symbol);
    switch (e.kind)
    {
    case ElevationTable::Kind::Start: return CellRole{ StartCell{} };
    case ElevationTable::Kind::End:   return CellRole{ EndCell{} };
    case ElevationTable::Kind::Plain: return CellRole{ PlainCell{ e.elevation } };
    case ElevationTable::Kind::Invalid:
        break;
    }
    return std::unexpected(UnknownSymbolError(symbol, at));
}

} // namespace hillclimb::terrain
