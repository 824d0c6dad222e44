// ===============================================
// Mst.cpp
// Prim's algorithm over a binary heap of candidate edges.
// Undirected graphs only; a disconnected graph has no spanning tree.
// ===============================================

#include "algo/Mst.hpp"
#include <functional>                     // std::greater for the min-heap
#include <queue>                          // std::priority_queue
#include <set>                            // tree membership over sparse ids
#include <sstream>                        // error messages
#include <tuple>                          // heap entries

MstResult mst(const Graph& g, Graph::Vertex start) {
    if (g.directed())
        throw GraphError(ErrorKind::NotUndirected, "MST is undefined for directed graphs");
    if (!g.hasVertex(start))
        throw GraphError(ErrorKind::UnknownVertex,
                         "start vertex " + std::to_string(start) + " does not exist");

    // (weight, edge-listing position, tree endpoint, outside endpoint)
    using Candidate = std::tuple<Graph::Weight, std::size_t, Graph::Vertex, Graph::Vertex>;
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> heap;

    std::set<Graph::Vertex> inTree;
    MstResult result;

    auto grow = [&](Graph::Vertex u) {                           // take u into the tree
        inTree.insert(u);
        for (const auto& a : g.adj(u)) {
            if (!inTree.count(a.to)) heap.emplace(a.weight, a.order, u, a.to);
        }
    };

    grow(start);
    while (!heap.empty() && inTree.size() < g.n()) {
        const Candidate c = heap.top(); heap.pop();
        const Graph::Vertex v = std::get<3>(c);
        if (inTree.count(v)) continue;                           // both ends already in the tree

        result.edges.push_back(Graph::Edge{std::get<2>(c), v, std::get<0>(c)});
        result.totalWeight += std::get<0>(c);
        grow(v);
    }

    if (inTree.size() != g.n()) {
        std::ostringstream oss;
        oss << "graph is disconnected: only " << inTree.size() << " of " << g.n()
            << " vertices are reachable from " << start;
        throw GraphError(ErrorKind::Disconnected, oss.str());
    }
    return result;
}
