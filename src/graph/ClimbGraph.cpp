#include "hillclimb/graph/ClimbGraph.hpp"
#include "core/Log.h"

#include <algorithm>

namespace hillclimb::graph {

ClimbGraph::ClimbGraph(std::int32_t cols, std::vector<Elevation> elevation, std::vector<Edge> edges, bool reversed)
    : _cols(cols), _reversed(reversed), _elevation(std::move(elevation))
{
    const std::size_t n = _elevation.size();
    _offsets.assign(n + 1, 0);
    for (const Edge& e : edges)
        ++_offsets[e.from + 1];
    for (std::size_t i = 0; i < n; ++i)
        _offsets[i + 1] += _offsets[i];

    _targets.resize(edges.size());
    std::vector<NodeId> fill(_offsets.begin(), _offsets.end() - 1);
    for (const Edge& e : edges)
        _targets[fill[e.from]++] = e.to;
}

ClimbGraph ClimbGraph::Build(const terrain::HeightMap& map)
{
    const std::int32_t rows = map.rows(), cols = map.cols();

    std::vector<Elevation> elevation;
    elevation.reserve(map.size());
    for (const auto& role : map.cells())
        elevation.push_back(terrain::ElevationOf(role));

    static constexpr int dr[4] = { 1, -1, 0, 0 };
    static constexpr int dc[4] = { 0, 0, 1, -1 };

    std::vector<Edge> edges;
    edges.reserve(map.size() * 4);

    for (std::int32_t r = 0; r < rows; ++r)
    {
        for (std::int32_t c = 0; c < cols; ++c)
        {
            const Coord at{ r, c };
            if (terrain::IsEnd(map.role(at)))
                continue;

            const NodeId from = ToId(at, cols);
            for (int dir = 0; dir < 4; ++dir)
            {
                const Coord nb{ r + dr[dir], c + dc[dir] };
                if (!map.contains(nb))
                    continue;

                const NodeId to = ToId(nb, cols);
                if (CanClimb(elevation[from], elevation[to]))
                    edges.push_back({ from, to });
            }
        }
    }

    HILLCLIMB_LOG_DEBUG("Built climb graph: %zu nodes, %zu edges", elevation.size(), edges.size());
    return ClimbGraph(cols, std::move(elevation), std::move(edges), false);
}

ClimbGraph ClimbGraph::Reversed() const
{
    std::vector<Edge> flipped;
    flipped.reserve(_targets.size());
    for (NodeId from = 0; from < static_cast<NodeId>(node_count()); ++from)
        for (NodeId to : neighbors(from))
            flipped.push_back({ to, from });

    return ClimbGraph(_cols, _elevation, std::move(flipped), !_reversed);
}

bool ClimbGraph::has_edge(NodeId from, NodeId to) const
{
    if (from >= node_count())
        return false;
    const auto nb = neighbors(from);
    return std::find(nb.begin(), nb.end(), to) != nb.end();
}

std::vector<Edge> ClimbGraph::Edges() const
{
    std::vector<Edge> out;
    out.reserve(_targets.size());
    for (NodeId from = 0; from < static_cast<NodeId>(node_count()); ++from)
        for (NodeId to : neighbors(from))
            out.push_back({ from, to });
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace hillclimb::graph
