#pragma once
#include "hillclimb/terrain/HeightMap.hpp"

#include <compare>
#include <span>
#include <utility>
#include <vector>

namespace hillclimb::graph {

struct Edge {
    NodeId from = kInvalidNode;
    NodeId to   = kInvalidNode;
    constexpr bool operator==(const Edge&) const = default;
    constexpr auto operator<=>(const Edge&) const = default;
};

// Directed, unweighted adjacency over grid cells.
// Node ids are row-major cell indices; adjacency is stored CSR-style
// (offsets + targets). Immutable after construction.
class ClimbGraph {
public:
    ClimbGraph() = default;

    // One edge per 4-neighbour pair that satisfies CanClimb; the End cell has no out-edges.
    [[nodiscard]] static ClimbGraph Build(const terrain::HeightMap& map);

    // Same nodes, every edge flipped. Leaves *this untouched.
    [[nodiscard]] ClimbGraph Reversed() const;

    [[nodiscard]] std::size_t node_count() const noexcept { return _elevation.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return _targets.size(); }
    [[nodiscard]] std::int32_t cols() const noexcept { return _cols; }
    [[nodiscard]] bool reversed() const noexcept { return _reversed; }

    [[nodiscard]] NodeId node(Coord c) const noexcept { return ToId(c, _cols); }
    [[nodiscard]] Coord  coord(NodeId id) const noexcept { return FromId(id, _cols); }
    [[nodiscard]] Elevation elevation(NodeId id) const { return _elevation[id]; }

    [[nodiscard]] std::span<const NodeId> neighbors(NodeId id) const {
        return { _targets.data() + _offsets[id], _targets.data() + _offsets[id + 1] };
    }

    [[nodiscard]] bool has_edge(NodeId from, NodeId to) const;

    // Sorted (from, to) list; equal graphs produce equal lists.
    [[nodiscard]] std::vector<Edge> Edges() const;

private:
    ClimbGraph(std::int32_t cols, std::vector<Elevation> elevation, std::vector<Edge> edges, bool reversed);

    std::int32_t           _cols = 0;
    bool                   _reversed = false;
    std::vector<Elevation> _elevation;
    std::vector<NodeId>    _offsets;   // node_count() + 1
    std::vector<NodeId>    _targets;
};

} // namespace hillclimb::graph
