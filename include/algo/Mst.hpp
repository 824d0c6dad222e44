#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // Graph, Edge, Weight
#include <vector>                         // tree edges

struct MstResult {
    std::vector<Graph::Edge> edges;       // in the order Prim added them, oriented tree -> new vertex
    Graph::Weight totalWeight = 0.0;
};

/**
 * @brief Minimum spanning tree by Prim's algorithm rooted at `start`.
 *        Candidate edges are taken by (weight, edge-listing position), so equal
 *        weights resolve to the edge that was listed first.
 * @throws GraphError NotUndirected, UnknownVertex, Disconnected
 */
MstResult mst(const Graph& g, Graph::Vertex start);
