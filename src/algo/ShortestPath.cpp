#include "algo/ShortestPath.hpp"
#include <algorithm>                      // std::reverse
#include <functional>                     // std::greater for the min-heap
#include <queue>                          // std::priority_queue
#include <sstream>                        // error messages
#include <utility>                        // std::pair

namespace {

using Vertex = Graph::Vertex;
using Weight = Graph::Weight;

void require_vertex(const Graph& g, Vertex u, const char* role) {
    if (!g.hasVertex(u)) {
        std::ostringstream oss;
        oss << role << " vertex " << u << " does not exist";
        throw GraphError(ErrorKind::UnknownVertex, oss.str());
    }
}

// Dijkstra is only correct for non-negative weights, so refuse up front
void require_non_negative(const Graph& g) {
    for (const auto& e : g.edges()) {
        if (e.weight < 0) {
            std::ostringstream oss;
            oss << "edge " << e.from << (g.directed() ? " -> " : " - ") << e.to
                << " has negative weight " << e.weight;
            throw GraphError(ErrorKind::NegativeWeight, oss.str());
        }
    }
}

// Core loop shared by shortestPath() and distances().
// `stopAt` is settled-and-stop; pass no value to run to completion.
DistanceMap dijkstra(const Graph& g, Vertex source, std::optional<Vertex> stopAt) {
    using Entry = std::pair<Weight, Vertex>;                       // (tentative distance, vertex)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;

    DistanceMap dist;
    dist[source] = Reach{0.0, std::nullopt};
    heap.push({0.0, source});

    while (!heap.empty()) {
        const Entry top = heap.top(); heap.pop();
        const Vertex u = top.second;

        if (top.first > dist[u].distance) continue;               // stale entry, u settled earlier
        if (stopAt && u == *stopAt) break;                        // target settled

        for (const auto& a : g.adj(u)) {                          // relax in adjacency order
            const Weight nd = top.first + a.weight;
            auto it = dist.find(a.to);
            if (it == dist.end() || nd < it->second.distance) {   // strict improvement only
                dist[a.to] = Reach{nd, u};
                heap.push({nd, a.to});
            }
        }
    }
    return dist;
}

} // namespace

Path shortestPath(const Graph& g, Vertex source, Vertex target) {
    require_vertex(g, source, "source");
    require_vertex(g, target, "target");
    require_non_negative(g);

    if (source == target) return Path{{source}, 0.0};

    const DistanceMap dist = dijkstra(g, source, target);
    if (!dist.count(target)) {
        std::ostringstream oss;
        oss << "vertex " << target << " is unreachable from " << source;
        throw GraphError(ErrorKind::NoPath, oss.str());
    }
    return pathTo(dist, target);
}

DistanceMap distances(const Graph& g, Vertex source) {
    require_vertex(g, source, "source");
    require_non_negative(g);
    return dijkstra(g, source, std::nullopt);
}

Path pathTo(const DistanceMap& dist, Vertex target) {
    auto it = dist.find(target);
    if (it == dist.end()) {
        throw GraphError(ErrorKind::NoPath,
                         "vertex " + std::to_string(target) + " is unreachable");
    }

    Path p;
    p.totalWeight = it->second.distance;
    for (;;) {                                                    // walk predecessors back to the source
        p.vertices.push_back(it->first);
        if (!it->second.predecessor) break;
        it = dist.find(*it->second.predecessor);
        if (it == dist.end()) {
            throw GraphError(ErrorKind::NoPath,
                             "predecessor chain to " + std::to_string(target) + " is broken");
        }
    }
    std::reverse(p.vertices.begin(), p.vertices.end());
    return p;
}
