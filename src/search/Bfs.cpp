#include "hillclimb/search/Bfs.hpp"
#include "core/Log.h"

#include <algorithm>
#include <deque>
#include <limits>

namespace hillclimb::search {

namespace {

enum class VisitState : std::uint8_t { Unvisited, Frontier, Visited };

constexpr Distance kUnreached = std::numeric_limits<Distance>::max();

// Shared BFS state for one traversal. `stop` is checked on dequeue.
struct Traversal {
    explicit Traversal(const graph::ClimbGraph& graph)
        : g(graph),
          state(graph.node_count(), VisitState::Unvisited),
          dist(graph.node_count(), kUnreached),
          parent(graph.node_count(), kInvalidNode) {}

    template <typename OnVisit>
    void run(NodeId source, OnVisit&& onVisit) {
        std::deque<NodeId> frontier;
        state[source] = VisitState::Frontier;
        dist[source] = 0;
        frontier.push_back(source);

        while (!frontier.empty()) {
            const NodeId cur = frontier.front();
            frontier.pop_front();
            state[cur] = VisitState::Visited;
            ++expanded;

            if (onVisit(cur))
                return;

            for (NodeId nxt : g.neighbors(cur)) {
                if (state[nxt] != VisitState::Unvisited)
                    continue;
                state[nxt] = VisitState::Frontier;
                dist[nxt] = dist[cur] + 1;
                parent[nxt] = cur;
                frontier.push_back(nxt);
            }
        }
    }

    std::vector<Coord> route_to(NodeId target) const {
        std::vector<Coord> out;
        for (NodeId cur = target; cur != kInvalidNode; cur = parent[cur])
            out.push_back(g.coord(cur));
        std::reverse(out.begin(), out.end());
        return out;
    }

    const graph::ClimbGraph& g;
    std::vector<VisitState>  state;
    std::vector<Distance>    dist;
    std::vector<NodeId>      parent;
    std::size_t              expanded = 0;
};

} // namespace

std::expected<SearchResult, Error> FindForward(const graph::ClimbGraph& g, NodeId start, NodeId goal,
                                               const SearchOptions& opt)
{
    if (start >= g.node_count() || goal >= g.node_count())
        return std::unexpected(NoPathError(SearchMode::Forward));

    Traversal t(g);
    bool found = false;
    t.run(start, [&](NodeId cur) {
        found = (cur == goal);
        return found;
    });

    HILLCLIMB_LOG_DEBUG("Forward search expanded %zu of %zu nodes", t.expanded, g.node_count());
    if (!found)
        return std::unexpected(NoPathError(SearchMode::Forward));

    SearchResult res;
    res.distance = t.dist[goal];
    res.target = goal;
    res.expanded = t.expanded;
    if (opt.recordRoute)
        res.route = t.route_to(goal);
    return res;
}

std::expected<SearchResult, Error> FindNearest(const graph::ClimbGraph& g, NodeId source,
                                               const NodePredicate& accept, SearchMode mode,
                                               const SearchOptions& opt)
{
    if (source >= g.node_count())
        return std::unexpected(NoPathError(mode));

    // Distances are non-decreasing in dequeue order, so the first accepted
    // node is already a minimum; the full pass still records every candidate.
    Traversal t(g);
    NodeId best = kInvalidNode;
    std::size_t candidates = 0;
    t.run(source, [&](NodeId cur) {
        if (accept(g, cur)) {
            ++candidates;
            if (best == kInvalidNode || t.dist[cur] < t.dist[best])
                best = cur;
        }
        return false;
    });

    HILLCLIMB_LOG_DEBUG("%s search reached %zu candidate(s), expanded %zu of %zu nodes",
                        ModeName(mode), candidates, t.expanded, g.node_count());
    if (best == kInvalidNode)
        return std::unexpected(NoPathError(mode));

    SearchResult res;
    res.distance = t.dist[best];
    res.target = best;
    res.expanded = t.expanded;
    if (opt.recordRoute)
        res.route = t.route_to(best);
    return res;
}

std::expected<SearchResult, Error> FindReverse(const graph::ClimbGraph& reversed, NodeId end,
                                               const SearchOptions& opt)
{
    if (!reversed.reversed())
        HILLCLIMB_LOG_WARN("FindReverse called with a forward graph");
    return FindNearest(reversed, end, &IsLowest, SearchMode::Reverse, opt);
}

} // namespace hillclimb::search
