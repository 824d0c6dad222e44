// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line methods of the Graph class:
// construction/load, lookups, the four mutations, and label().
// ==========================

#include "graph/Graph.hpp"   // include the Graph class declaration
#include <algorithm>         // std::find_if, std::remove_if
#include <cmath>             // std::isfinite for weight validation
#include <sstream>           // used for building strings in label() and messages

namespace {

std::string pairText(Graph::Vertex u, Graph::Vertex v, bool directed) {
    std::ostringstream oss;
    oss << u << (directed ? " -> " : " - ") << v;
    return oss.str();
}

} // namespace

// --------------------------
// constructors / load
// --------------------------
Graph::Graph(std::size_t n, Kind kind, Options opts)
    : m_kind(kind), m_opts(opts) {
    if (n > kMaxVertexCount) {                    // refuse before allocating anything
        throw GraphError(ErrorKind::MalformedInput,
                         "vertex count " + std::to_string(n) + " exceeds the limit of "
                         + std::to_string(kMaxVertexCount));
    }
    for (Vertex u = 0; u < n; ++u) {
        m_adj.emplace_hint(m_adj.end(), u, std::vector<Arc>{}); // ids arrive ascending
    }
}

// --------------------------
// load
// --------------------------
// Purpose:
//   Build a fresh graph from a declared vertex count and an edge list.
//   Endpoints outside 0..vertexCount-1 are rejected rather than silently
//   growing the vertex range.
// Returns:
//   The populated Graph. Any failure throws and no graph is produced,
//   so a caller that assigns the result replaces its old graph atomically.
Graph Graph::load(std::size_t vertexCount,
                  const std::vector<EdgeInput>& edges,
                  Kind kind,
                  Options opts) {
    Graph g(vertexCount, kind, opts);                     // vertices 0..n-1

    for (std::size_t i = 0; i < edges.size(); ++i) {      // consume edges in order
        const EdgeInput& e = edges[i];
        if (e.u >= vertexCount || e.v >= vertexCount) {   // bounded vertex range
            std::ostringstream oss;
            oss << "edge #" << (i + 1) << " (" << e.u << ", " << e.v
                << ") references a vertex outside 0.." << vertexCount
                << " (exclusive)";
            throw GraphError(ErrorKind::MalformedInput, oss.str());
        }
        g.addEdge(e.u, e.v, e.weight.value_or(kDefaultWeight)); // last definition wins
    }
    return g;
}

// --------------------------
// lookups
// --------------------------
bool Graph::hasEdge(Vertex u, Vertex v) const {
    if (!hasVertex(u) || !hasVertex(v)) return false;
    return findEdge(u, v) != m_edges.end();
}

Graph::Weight Graph::weight(Vertex u, Vertex v) const {
    auto it = hasVertex(u) && hasVertex(v) ? findEdge(u, v) : m_edges.end();
    if (it == m_edges.end()) {
        throw GraphError(ErrorKind::UnknownEdge, "no edge " + pairText(u, v, directed()));
    }
    return it->second.weight;
}

const std::vector<Graph::Arc>& Graph::adj(Vertex u) const {
    checkVertex(u);
    return m_adj.find(u)->second;
}

std::vector<Graph::Vertex> Graph::vertices() const {
    std::vector<Vertex> out;
    out.reserve(m_adj.size());
    for (const auto& kv : m_adj) out.push_back(kv.first);    // std::map keeps ids ascending
    return out;
}

std::vector<Graph::Edge> Graph::edges() const {
    std::vector<Edge> out;
    out.reserve(m_edges.size());
    for (const auto& kv : m_edges) out.push_back(kv.second); // ascending stamp
    return out;
}

std::vector<Graph::Edge> Graph::incidentEdges(Vertex u) const {
    std::vector<Edge> out;
    for (const Arc& a : adj(u)) out.push_back(Edge{u, a.to, a.weight});
    return out;
}

// --------------------------
// label
// --------------------------
// Format:
//   "DirectedGraph(VV,EE)" or "UndirectedGraph(VV,EE)"
//   where VV = number of vertices, EE = number of edges.
std::string Graph::label() const {
    std::ostringstream oss;                         // create a string stream
    oss << (directed() ? "Directed" : "Undirected");// write graph type
    oss << "Graph(" << n() << "V," << m() << "E)";  // add vertex and edge counts
    return oss.str();                               // return composed string
}

// --------------------------
// addVertex
// --------------------------
void Graph::addVertex(Vertex u) {
    if (hasVertex(u)) {
        throw GraphError(ErrorKind::DuplicateVertex,
                         "vertex " + std::to_string(u) + " already exists");
    }
    m_adj.emplace(u, std::vector<Arc>{});
}

// --------------------------
// addEdge
// --------------------------
// Purpose:
//   Insert u->v (u-v if undirected) or overwrite the weight of the
//   existing edge of that pair. The overwritten edge keeps its place
//   in edges() and in every adjacency list.
// Arguments:
//   u, v = endpoints (must exist)
//   w    = finite weight
void Graph::addEdge(Vertex u, Vertex v, Weight w) {
    checkVertex(u);                               // validate both endpoints first
    checkVertex(v);

    if (!std::isfinite(w)) {
        throw GraphError(ErrorKind::MalformedInput,
                         "weight of " + pairText(u, v, directed()) + " is not a finite number");
    }
    if (u == v && !m_opts.allowSelfLoops) {
        throw GraphError(ErrorKind::SelfLoop,
                         "self-loop on vertex " + std::to_string(u) + " is disabled in this graph");
    }

    auto it = findEdge(u, v);
    if (it != m_edges.end()) {                    // pair already present: last definition wins
        Edge& e = it->second;
        e.weight = w;
        setArcWeight(e.from, e.to, w);
        if (!directed() && u != v) setArcWeight(e.to, e.from, w);
        return;
    }

    // Grow the arc lists up front and insert the record last among the
    // throwing steps, so the push_backs below cannot throw and a failed
    // allocation leaves the graph untouched.
    std::vector<Arc>& fromList = m_adj.find(u)->second;
    std::vector<Arc>& toList   = m_adj.find(v)->second;
    fromList.reserve(fromList.size() + 1);
    if (!directed() && u != v) toList.reserve(toList.size() + 1);

    const std::size_t order = m_nextOrder;
    m_edges.emplace_hint(m_edges.end(), order, Edge{u, v, w}); // stamps only grow
    ++m_nextOrder;
    fromList.push_back(Arc{v, w, order});
    if (!directed() && u != v) {                  // mirror arc, a self-loop keeps a single one
        toList.push_back(Arc{u, w, order});
    }
}

// --------------------------
// removeVertex
// --------------------------
// Purpose:
//   Remove `u` together with every edge that has it as an endpoint.
//   In a directed graph that covers both outgoing and incoming arcs.
void Graph::removeVertex(Vertex u) {
    checkVertex(u);

    for (const Arc& a : m_adj.find(u)->second) {  // outgoing (undirected: all) edges
        m_edges.erase(a.order);
    }

    for (auto& kv : m_adj) {                      // drop arcs pointing at u
        auto& lst = kv.second;
        for (const Arc& a : lst) {
            if (a.to == u) m_edges.erase(a.order); // incoming edges of a directed graph
        }
        lst.erase(std::remove_if(lst.begin(), lst.end(),
                                 [u](const Arc& a) { return a.to == u; }),
                  lst.end());
    }
    m_adj.erase(u);                               // and u's own list
}

// --------------------------
// removeEdge
// --------------------------
// Purpose:
//   Remove the logical edge between u and v.
//   - For directed graphs: removes arc u->v only.
//   - For undirected graphs: removes both u->v and v->u.
void Graph::removeEdge(Vertex u, Vertex v) {
    auto it = hasVertex(u) && hasVertex(v) ? findEdge(u, v) : m_edges.end();
    if (it == m_edges.end()) {
        throw GraphError(ErrorKind::UnknownEdge, "no edge " + pairText(u, v, directed()));
    }

    const Edge e = it->second;
    m_edges.erase(it);
    removeOneArc(e.from, e.to);
    if (!directed() && e.from != e.to) removeOneArc(e.to, e.from);
}

// --------------------------
// private helpers
// --------------------------
void Graph::checkVertex(Vertex u) const {
    if (!hasVertex(u)) {
        throw GraphError(ErrorKind::UnknownVertex,
                         "vertex " + std::to_string(u) + " does not exist");
    }
}

Graph::EdgeMap::iterator Graph::findEdge(Vertex u, Vertex v) {
    // An undirected pair has an arc in u's list whichever way it was inserted
    for (const Arc& a : m_adj.find(u)->second) {
        if (a.to == v) return m_edges.find(a.order);
    }
    return m_edges.end();
}

Graph::EdgeMap::const_iterator Graph::findEdge(Vertex u, Vertex v) const {
    for (const Arc& a : m_adj.find(u)->second) {
        if (a.to == v) return m_edges.find(a.order);
    }
    return m_edges.end();
}

void Graph::setArcWeight(Vertex u, Vertex v, Weight w) {
    for (Arc& a : m_adj.find(u)->second) {
        if (a.to == v) {
            a.weight = w;
            return;
        }
    }
}

void Graph::removeOneArc(Vertex u, Vertex v) {
    auto& lst = m_adj.find(u)->second;
    auto it = std::find_if(lst.begin(), lst.end(),
                           [v](const Arc& a){ return a.to == v; });
    if (it != lst.end()) lst.erase(it);
}
