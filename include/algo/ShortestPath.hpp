#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // Graph, Vertex, Weight
#include <map>                            // DistanceMap
#include <optional>                       // predecessor of the source is empty
#include <vector>                         // path vertices

// Minimum-weight route, source and target included
struct Path {
    std::vector<Graph::Vertex> vertices;
    Graph::Weight totalWeight = 0.0;
};

// Settled distance of one reachable vertex
struct Reach {
    Graph::Weight distance = 0.0;
    std::optional<Graph::Vertex> predecessor;   // empty for the source itself
};

// Only reachable vertices appear; an absent key means "unreachable"
using DistanceMap = std::map<Graph::Vertex, Reach>;

/**
 * @brief Dijkstra from `source`, stopping once `target` is settled.
 *        Among equally short paths the first one discovered wins: distances are
 *        only replaced on a strict improvement, neighbors are relaxed in
 *        adjacency order, and heap ties go to the smaller vertex id.
 * @throws GraphError UnknownVertex, NegativeWeight (any edge < 0), NoPath
 */
Path shortestPath(const Graph& g, Graph::Vertex source, Graph::Vertex target);

/**
 * @brief Dijkstra from `source` run to completion.
 * @throws GraphError UnknownVertex, NegativeWeight
 */
DistanceMap distances(const Graph& g, Graph::Vertex source);

/**
 * @brief Rebuild the path to `target` from a distances() result.
 * @throws GraphError NoPath if `target` is not in the map
 */
Path pathTo(const DistanceMap& dist, Graph::Vertex target);
