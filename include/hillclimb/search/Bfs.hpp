#pragma once
#include "hillclimb/graph/ClimbGraph.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <vector>

namespace hillclimb::search {

struct SearchOptions {
    bool recordRoute = false;   // fill SearchResult::route
};

struct SearchResult {
    Distance           distance = 0;       // edge count from source to target
    NodeId             target   = kInvalidNode;
    std::vector<Coord> route;              // source .. target, only when recorded
    std::size_t        expanded = 0;       // nodes dequeued
};

using NodePredicate = std::function<bool(const graph::ClimbGraph&, NodeId)>;

// Breadth-first search from `start`, stopping when `goal` is dequeued.
[[nodiscard]] std::expected<SearchResult, Error> FindForward(const graph::ClimbGraph& g,
                                                             NodeId start, NodeId goal,
                                                             const SearchOptions& opt = {});

// One breadth-first pass from `source`; returns the closest node accepted by `accept`.
// Ties keep the node reached first.
[[nodiscard]] std::expected<SearchResult, Error> FindNearest(const graph::ClimbGraph& g,
                                                             NodeId source,
                                                             const NodePredicate& accept,
                                                             SearchMode mode,
                                                             const SearchOptions& opt = {});

// `reversed` must be the edge-flipped graph; searches from End towards any elevation-0 cell.
[[nodiscard]] std::expected<SearchResult, Error> FindReverse(const graph::ClimbGraph& reversed,
                                                             NodeId end,
                                                             const SearchOptions& opt = {});

[[nodiscard]] inline bool IsLowest(const graph::ClimbGraph& g, NodeId id) {
    return g.elevation(id) == kLowestElevation;
}

} // namespace hillclimb::search
