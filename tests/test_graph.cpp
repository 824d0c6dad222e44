// ==========================
// tests/test_graph.cpp
// ==========================
// Unit tests for the Graph store: construction, load, the four
// mutations, listings and the error kinds they raise.
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"         // doctest framework header

#include "graph/Graph.hpp"   // Graph class declaration

#include <limits>            // quiet_NaN
#include <vector>

// Small helper: error kind raised by a callable, or nothing
template <typename F>
static ErrorKind kind_of(F&& f) {
    try {
        f();
    } catch (const GraphError& e) {
        return e.kind();
    }
    FAIL("expected a GraphError");
    return ErrorKind::MalformedInput;
}

// Every edge endpoint must be a current vertex
static bool no_dangling_edges(const Graph& g) {
    for (const auto& e : g.edges())
        if (!g.hasVertex(e.from) || !g.hasVertex(e.to)) return false;
    for (auto u : g.vertices())
        for (const auto& a : g.adj(u))
            if (!g.hasVertex(a.to)) return false;
    return true;
}

// ---------------------------
// Construction
// ---------------------------
TEST_CASE("Empty graph has no vertices and keeps its mode") {
    Graph u(Graph::Kind::Undirected);
    Graph d(Graph::Kind::Directed);
    CHECK(u.n() == 0);
    CHECK(u.m() == 0);
    CHECK_FALSE(u.directed());
    CHECK(d.directed());
    CHECK(d.label() == "DirectedGraph(0V,0E)");
}

TEST_CASE("Sized graph has vertices 0..n-1 and no edges") {
    Graph g(4, Graph::Kind::Undirected);
    CHECK(g.vertices() == std::vector<Graph::Vertex>{0, 1, 2, 3});
    CHECK(g.edges().empty());
    CHECK(g.label() == "UndirectedGraph(4V,0E)");
}

// ---------------------------
// addVertex / addEdge
// ---------------------------
TEST_CASE("addVertex rejects duplicates and keeps ids sorted") {
    Graph g(Graph::Kind::Undirected);
    g.addVertex(7);
    g.addVertex(2);
    CHECK(kind_of([&] { g.addVertex(7); }) == ErrorKind::DuplicateVertex);
    CHECK(g.vertices() == std::vector<Graph::Vertex>{2, 7});
}

TEST_CASE("addEdge to an unknown vertex inserts nothing") {
    Graph g(2, Graph::Kind::Undirected);
    CHECK(kind_of([&] { g.addEdge(0, 5, 2.0); }) == ErrorKind::UnknownVertex);
    CHECK(kind_of([&] { g.addEdge(9, 1); }) == ErrorKind::UnknownVertex);
    CHECK(g.m() == 0);
    CHECK(g.adj(0).empty());
    CHECK(g.adj(1).empty());
}

TEST_CASE("addEdge defaults the weight to 1.0") {
    Graph g(2, Graph::Kind::Directed);
    g.addEdge(0, 1);
    CHECK(g.weight(0, 1) == doctest::Approx(1.0));
}

TEST_CASE("addEdge rejects non-finite weights") {
    Graph g(2, Graph::Kind::Undirected);
    CHECK(kind_of([&] { g.addEdge(0, 1, std::numeric_limits<double>::quiet_NaN()); })
          == ErrorKind::MalformedInput);
    CHECK(kind_of([&] { g.addEdge(0, 1, std::numeric_limits<double>::infinity()); })
          == ErrorKind::MalformedInput);
    CHECK(g.m() == 0);
}

TEST_CASE("Undirected: redefining a pair in either orientation overwrites the weight") {
    Graph g(3, Graph::Kind::Undirected);
    g.addEdge(0, 1, 4);
    g.addEdge(1, 2, 1);
    g.addEdge(1, 0, 9);                                 // same unordered pair

    REQUIRE(g.m() == 2);
    auto es = g.edges();
    CHECK(es[0].from == 0);                             // original orientation and position kept
    CHECK(es[0].to == 1);
    CHECK(es[0].weight == doctest::Approx(9));
    CHECK(g.weight(1, 0) == doctest::Approx(9));
    CHECK(g.adj(0).size() == 1);                        // no parallel arcs
    CHECK(g.adj(1).size() == 2);
    CHECK(g.adj(1)[0].weight == doctest::Approx(9));    // mirror arc updated too
}

TEST_CASE("Directed: (u,v) and (v,u) are distinct edges") {
    Graph g(2, Graph::Kind::Directed);
    g.addEdge(0, 1, 3);
    g.addEdge(1, 0, 5);
    g.addEdge(0, 1, 7);                                 // overwrite 0->1 only

    CHECK(g.m() == 2);
    CHECK(g.weight(0, 1) == doctest::Approx(7));
    CHECK(g.weight(1, 0) == doctest::Approx(5));
    CHECK(g.adj(0).size() == 1);
}

// ---------------------------
// Self-loop policy
// ---------------------------
TEST_CASE("Self-loops are rejected by default") {
    Graph g(2, Graph::Kind::Undirected);
    CHECK(kind_of([&] { g.addEdge(1, 1); }) == ErrorKind::SelfLoop);
    CHECK(g.m() == 0);
}

TEST_CASE("Self-loops are stored once when allowed") {
    Graph::Options o; o.allowSelfLoops = true;
    Graph g(2, Graph::Kind::Undirected, o);
    g.addEdge(1, 1, 2.5);
    CHECK(g.m() == 1);
    CHECK(g.adj(1).size() == 1);                        // a single arc, not mirrored
    CHECK(g.hasEdge(1, 1));

    g.removeEdge(1, 1);
    CHECK(g.m() == 0);
    CHECK(g.adj(1).empty());
}

// ---------------------------
// removeVertex / removeEdge
// ---------------------------
TEST_CASE("removeVertex drops incoming and outgoing arcs of a directed graph") {
    Graph g(4, Graph::Kind::Directed);
    g.addEdge(0, 1); g.addEdge(1, 2); g.addEdge(2, 1); g.addEdge(3, 1); g.addEdge(2, 3);

    g.removeVertex(1);

    CHECK(g.vertices() == std::vector<Graph::Vertex>{0, 2, 3});   // no renumbering
    CHECK(g.m() == 1);
    CHECK(g.hasEdge(2, 3));
    CHECK(no_dangling_edges(g));
    CHECK(kind_of([&] { g.removeVertex(1); }) == ErrorKind::UnknownVertex);
}

TEST_CASE("removeEdge twice fails the second time and changes nothing") {
    Graph g(3, Graph::Kind::Undirected);
    g.addEdge(0, 1); g.addEdge(1, 2, 2);

    g.removeEdge(1, 0);                                 // reversed orientation is the same edge
    CHECK(g.m() == 1);
    CHECK_FALSE(g.hasEdge(0, 1));
    CHECK(g.adj(0).empty());

    CHECK(kind_of([&] { g.removeEdge(0, 1); }) == ErrorKind::UnknownEdge);
    CHECK(g.m() == 1);
    CHECK(g.weight(1, 2) == doctest::Approx(2));
}

TEST_CASE("removeEdge on a directed graph removes only that direction") {
    Graph g(2, Graph::Kind::Directed);
    g.addEdge(0, 1); g.addEdge(1, 0);
    g.removeEdge(0, 1);
    CHECK_FALSE(g.hasEdge(0, 1));
    CHECK(g.hasEdge(1, 0));
    CHECK(kind_of([&] { g.removeEdge(0, 1); }) == ErrorKind::UnknownEdge);
    CHECK(kind_of([&] { g.removeEdge(0, 42); }) == ErrorKind::UnknownEdge);
}

TEST_CASE("Mixed mutations never leave dangling edges") {
    Graph g(6, Graph::Kind::Undirected);
    g.addEdge(0, 1); g.addEdge(1, 2); g.addEdge(2, 3); g.addEdge(3, 4); g.addEdge(4, 5); g.addEdge(5, 0);
    g.removeVertex(2);
    g.addVertex(10);
    g.addEdge(10, 3, 4);
    g.removeEdge(4, 5);
    g.removeVertex(0);

    CHECK(no_dangling_edges(g));
    CHECK(g.vertices() == std::vector<Graph::Vertex>{1, 3, 4, 5, 10});
    CHECK(g.m() == 2);                                  // 3-4 and 10-3
}

// ---------------------------
// Listings
// ---------------------------
TEST_CASE("edges() is insertion ordered, incidentEdges() follows adjacency") {
    Graph g(4, Graph::Kind::Undirected);
    g.addEdge(2, 3, 1); g.addEdge(0, 2, 5); g.addEdge(1, 2, 7);

    auto es = g.edges();
    REQUIRE(es.size() == 3);
    CHECK(es[0].from == 2); CHECK(es[1].from == 0); CHECK(es[2].from == 1);

    auto inc = g.incidentEdges(2);
    REQUIRE(inc.size() == 3);
    CHECK(inc[0].from == 2);
    CHECK(inc[0].to == 3);
    CHECK(inc[1].to == 0);
    CHECK(inc[2].to == 1);
    CHECK(inc[2].weight == doctest::Approx(7));

    CHECK(kind_of([&] { g.incidentEdges(9); }) == ErrorKind::UnknownVertex);
    CHECK(kind_of([&] { g.weight(0, 1); }) == ErrorKind::UnknownEdge);
}

// ---------------------------
// load
// ---------------------------
TEST_CASE("load deduplicates with last definition wins") {
    std::vector<Graph::EdgeInput> in = {
        {0, 1, 4.0}, {1, 2, std::nullopt}, {1, 0, 6.0}, {2, 3, 2.0}, {1, 2, 3.0}};
    Graph g = Graph::load(4, in, Graph::Kind::Undirected);

    CHECK(g.n() == 4);
    CHECK(g.m() == 3);
    CHECK(g.weight(0, 1) == doctest::Approx(6));
    CHECK(g.weight(2, 1) == doctest::Approx(3));
    CHECK(g.weight(2, 3) == doctest::Approx(2));
}

TEST_CASE("load keeps opposite arcs apart in a directed graph") {
    std::vector<Graph::EdgeInput> in = {{0, 1, 4.0}, {1, 0, 6.0}};
    Graph g = Graph::load(2, in, Graph::Kind::Directed);
    CHECK(g.m() == 2);
    CHECK(g.weight(0, 1) == doctest::Approx(4));
}

TEST_CASE("load rejects endpoints outside the declared range") {
    std::vector<Graph::EdgeInput> in = {{0, 1, std::nullopt}, {1, 3, std::nullopt}};
    CHECK(kind_of([&] { Graph::load(3, in, Graph::Kind::Undirected); }) == ErrorKind::MalformedInput);
}

TEST_CASE("load applies the self-loop policy") {
    std::vector<Graph::EdgeInput> in = {{1, 1, 2.0}};
    CHECK(kind_of([&] { Graph::load(2, in, Graph::Kind::Directed); }) == ErrorKind::SelfLoop);

    Graph::Options o; o.allowSelfLoops = true;
    Graph g = Graph::load(2, in, Graph::Kind::Directed, o);
    CHECK(g.m() == 1);
}

TEST_CASE("Loading the same input twice gives identical graphs") {
    std::vector<Graph::EdgeInput> in = {{0, 1, 1.5}, {2, 1, std::nullopt}, {0, 1, 2.5}, {3, 0, 4.0}};
    Graph a = Graph::load(5, in, Graph::Kind::Undirected);
    Graph b = Graph::load(5, in, Graph::Kind::Undirected);

    CHECK(a.vertices() == b.vertices());
    auto ea = a.edges(), eb = b.edges();
    REQUIRE(ea.size() == eb.size());
    for (std::size_t i = 0; i < ea.size(); ++i) {
        CHECK(ea[i].from == eb[i].from);
        CHECK(ea[i].to == eb[i].to);
        CHECK(ea[i].weight == eb[i].weight);
    }
}

TEST_CASE("Listings right after load reproduce the deduplicated input") {
    std::vector<Graph::EdgeInput> in = {{0, 1, 2.0}, {1, 2, 3.0}, {0, 1, 5.0}};
    Graph g = Graph::load(3, in, Graph::Kind::Directed);

    CHECK(g.vertices().size() == 3);
    auto es = g.edges();
    REQUIRE(es.size() == 2);
    CHECK(es[0].from == 0); CHECK(es[0].to == 1); CHECK(es[0].weight == doctest::Approx(5));
    CHECK(es[1].from == 1); CHECK(es[1].to == 2); CHECK(es[1].weight == doctest::Approx(3));
}

TEST_CASE("Vertex counts above the limit are refused before allocating") {
    CHECK(kind_of([] { Graph g(Graph::kMaxVertexCount + 1, Graph::Kind::Undirected); })
          == ErrorKind::MalformedInput);
    std::vector<Graph::EdgeInput> none;
    CHECK(kind_of([&] { Graph::load(4000000000ULL, none, Graph::Kind::Directed); })
          == ErrorKind::MalformedInput);
}

// ---------------------------
// Large inputs
// ---------------------------
TEST_CASE("Loading a long chain stays fast and keeps every edge" * doctest::timeout(20)) {
    const std::size_t m = 200000;
    std::vector<Graph::EdgeInput> in;
    in.reserve(m + 1);
    for (std::size_t i = 0; i < m; ++i) in.push_back({i, i + 1, static_cast<double>(i % 7)});
    in.push_back({m - 1, m, 42.0});                     // redefine the last pair

    Graph g = Graph::load(m + 1, in, Graph::Kind::Undirected);
    CHECK(g.n() == m + 1);
    CHECK(g.m() == m);
    CHECK(g.weight(1, 0) == doctest::Approx(0));
    CHECK(g.weight(100, 101) == doctest::Approx(100 % 7));
    CHECK(g.weight(m, m - 1) == doctest::Approx(42));
    CHECK(g.edges().back().to == m);                    // overwrite kept its place

    g.removeVertex(100);
    CHECK(g.m() == m - 2);
    CHECK_FALSE(g.hasEdge(99, 100));
    CHECK(no_dangling_edges(g));
}

TEST_CASE("removeVertex after overwrites and removals keeps the edge count exact") {
    Graph g(4, Graph::Kind::Directed);
    g.addEdge(0, 1); g.addEdge(1, 0); g.addEdge(2, 1); g.addEdge(1, 3);
    g.addEdge(2, 1, 8);                                 // overwrite, same edge
    g.removeEdge(1, 0);
    g.addEdge(1, 0, 5);                                 // re-added, now listed last

    auto es = g.edges();
    REQUIRE(es.size() == 4);
    CHECK(es.back().from == 1);
    CHECK(es.back().to == 0);

    g.removeVertex(1);
    CHECK(g.m() == 0);
    CHECK(g.edges().empty());
    CHECK(no_dangling_edges(g));
}
