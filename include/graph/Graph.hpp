#pragma once                              // ensure this header is included only once per translation unit

#include <vector>        // adjacency lists and edge listing
#include <map>           // ordered vertex -> adjacency map (ids may be sparse)
#include <optional>      // optional weight in load input
#include <cstddef>       // defines std::size_t type
#include <string>        // used for std::string in label()

#include "graph/GraphError.hpp"   // typed errors thrown by every mutation

// ==========================
// Weighted graph store
// ==========================
// This class supports:
// - Directed and undirected graphs (mode fixed at construction)
// - Sparse vertex ids: removing a vertex never renumbers the others
// - Real-valued weights, default 1.0
// - One edge per ordered (directed) / unordered (undirected) pair:
//   redefining a pair overwrites its weight in place
// - Self-loops rejected unless Options::allowSelfLoops is set
// Every failing mutation throws GraphError and leaves the graph unchanged.
// ==========================

class Graph {
public:
    // Enumeration to specify whether the graph is Undirected or Directed
    enum class Kind { Undirected, Directed };

    // Options fixed at construction
    struct Options {
        bool allowSelfLoops = false; // if false, edges u->u are rejected with SelfLoop
    };

    // Type aliases for readability
    using Vertex = std::size_t;             // vertex id type
    using Weight = double;                  // edge weight type

    // One adjacency entry. An undirected edge u-v owns two arcs (one for u==v).
    struct Arc {
        Vertex to;                          // neighbor
        Weight weight;                      // weight of the logical edge
        std::size_t order;                  // position key of the logical edge in edges()
    };

    // One logical edge as listed by edges()
    struct Edge {
        Vertex from;
        Vertex to;
        Weight weight;
    };

    // One edge of a bulk load; a missing weight means 1.0
    struct EdgeInput {
        Vertex u;
        Vertex v;
        std::optional<Weight> weight;
    };

    static constexpr Weight kDefaultWeight = 1.0;

    // Largest vertex count accepted by the sized constructor and load()
    static constexpr std::size_t kMaxVertexCount = 10000000;

    // ---- Constructors ----

    // Empty graph of the requested mode
    explicit Graph(Kind kind = Kind::Undirected)
        : m_kind(kind), m_opts(Options()) {}

    Graph(Kind kind, Options opts)
        : m_kind(kind), m_opts(opts) {}

    // Graph with vertices 0..n-1 and no edges; n > kMaxVertexCount throws MalformedInput
    Graph(std::size_t n, Kind kind)
        : Graph(n, kind, Options()) {}

    Graph(std::size_t n, Kind kind, Options opts);

    // Bulk load: vertices 0..vertexCount-1, then every edge in sequence
    // (last definition of a pair wins). An endpoint >= vertexCount, or a
    // vertexCount above kMaxVertexCount, throws MalformedInput; nothing is
    // returned on failure.
    static Graph load(std::size_t vertexCount,
                      const std::vector<EdgeInput>& edges,
                      Kind kind,
                      Options opts);

    static Graph load(std::size_t vertexCount,
                      const std::vector<EdgeInput>& edges,
                      Kind kind) {
        return load(vertexCount, edges, kind, Options());
    }

    // ---- Queries ----

    // Return the number of vertices
    std::size_t n() const noexcept { return m_adj.size(); }

    // Return the number of logical edges
    std::size_t m() const noexcept { return m_edges.size(); }

    // Return whether the graph is Undirected or Directed
    Kind kind() const noexcept { return m_kind; }

    // Convenience: return true if the graph is Directed
    bool directed() const noexcept { return m_kind == Kind::Directed; }

    const Options& options() const noexcept { return m_opts; }

    bool hasVertex(Vertex u) const { return m_adj.count(u) != 0; }

    // True if the pair has an edge (undirected: either orientation).
    // Absent endpoints simply yield false.
    bool hasEdge(Vertex u, Vertex v) const;

    // Weight of the edge u->v (undirected: u-v); throws UnknownEdge if absent
    Weight weight(Vertex u, Vertex v) const;

    // Arcs leaving `u`, in insertion order of their edges; throws UnknownVertex
    const std::vector<Arc>& adj(Vertex u) const;

    // All vertex ids, ascending
    std::vector<Vertex> vertices() const;

    // All logical edges, in insertion order
    std::vector<Edge> edges() const;

    // Edges leaving `u` (undirected: every edge touching u, oriented away from u)
    std::vector<Edge> incidentEdges(Vertex u) const;

    // Human-readable summary: "DirectedGraph(5V,7E)"
    std::string label() const;

    // ---- Mutations ----

    // Throws DuplicateVertex if `u` is already present
    void addVertex(Vertex u);

    // Insert u->v, or overwrite the weight of an existing pair.
    // Throws UnknownVertex, SelfLoop, or MalformedInput (non-finite weight).
    void addEdge(Vertex u, Vertex v, Weight w = kDefaultWeight);

    // Remove `u` and all edges incident to it; throws UnknownVertex
    void removeVertex(Vertex u);

    // Remove the edge of the pair (and its mirror arc if undirected); throws UnknownEdge
    void removeEdge(Vertex u, Vertex v);

private:
    using EdgeMap = std::map<std::size_t, Edge>;  // insertion stamp -> logical edge

    Kind m_kind;                                  // directed or undirected
    Options m_opts;                               // self-loop policy
    std::map<Vertex, std::vector<Arc>> m_adj;     // key set is the vertex set
    EdgeMap m_edges;                              // logical edges, ascending stamp = insertion order
    std::size_t m_nextOrder = 0;                  // stamp for the next new edge

    // Helper: throw UnknownVertex if `u` is absent
    void checkVertex(Vertex u) const;

    // Helper: locate the logical edge of the pair through u's arcs (respecting the mode).
    // Both endpoints must exist.
    EdgeMap::iterator findEdge(Vertex u, Vertex v);
    EdgeMap::const_iterator findEdge(Vertex u, Vertex v) const;

    // Helper: overwrite the weight of arc u->v
    void setArcWeight(Vertex u, Vertex v, Weight w);

    // Helper: remove arc u->v from adjacency list of u
    void removeOneArc(Vertex u, Vertex v);
}; // end class Graph
