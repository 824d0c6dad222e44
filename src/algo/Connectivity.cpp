#include "algo/Connectivity.hpp"          // include our header so the compiler sees the declarations
#include <algorithm>                      // std::sort for strong components
#include <map>                            // neighbor maps keyed by (sparse) vertex id
#include <queue>                          // BFS frontier
#include <set>                            // visited set over sparse ids
#include <stack>                          // explicit DFS stacks for strong components
#include <utility>                        // std::move

// -----------------------------
// Helper: neighbor lists that ignore arc direction
// Built from the edge listing so neighbors come in edge-listing order.
// -----------------------------
static std::map<Graph::Vertex, std::vector<Graph::Vertex>> undirected_neighbors(const Graph& g) {
    std::map<Graph::Vertex, std::vector<Graph::Vertex>> nb;
    for (Graph::Vertex u : g.vertices()) nb[u];                   // isolated vertices too
    for (const auto& e : g.edges()) {
        nb[e.from].push_back(e.to);
        if (e.from != e.to) nb[e.to].push_back(e.from);           // self-loop listed once
    }
    return nb;
}

// -----------------------------
// Weak components (also plain components of an undirected graph)
// -----------------------------
static std::vector<Component> weak_components(const Graph& g) {
    const auto nb = undirected_neighbors(g);
    std::set<Graph::Vertex> seen;                                 // visited flags
    std::vector<Component> out;

    for (const auto& kv : nb) {                                   // roots in ascending id order
        if (seen.count(kv.first)) continue;

        Component comp;
        std::queue<Graph::Vertex> q;
        q.push(kv.first);
        seen.insert(kv.first);
        while (!q.empty()) {
            Graph::Vertex u = q.front(); q.pop();
            comp.push_back(u);                                    // discovery order
            for (Graph::Vertex v : nb.at(u)) {
                if (seen.insert(v).second) q.push(v);             // first time we see v
            }
        }
        out.push_back(std::move(comp));
    }
    return out;
}

// -----------------------------
// Strong components (Kosaraju): DFS finish order on G, then DFS on G^R
// -----------------------------
static std::vector<Component> strong_components(const Graph& g) {
    std::set<Graph::Vertex> seen;                                 // visited flags for first DFS
    std::vector<Graph::Vertex> order; order.reserve(g.n());       // finish order list

    // First pass on g, iterative: each frame is (vertex, index of its next arc)
    std::stack<std::pair<Graph::Vertex, std::size_t>> st;
    for (Graph::Vertex root : g.vertices()) {
        if (!seen.insert(root).second) continue;
        st.push({root, 0});
        while (!st.empty()) {
            auto& top = st.top();
            const auto& arcs = g.adj(top.first);
            if (top.second < arcs.size()) {
                Graph::Vertex v = arcs[top.second++].to;          // advance before descending
                if (seen.insert(v).second) st.push({v, 0});
            } else {
                order.push_back(top.first);                       // record vertex by finish time
                st.pop();
            }
        }
    }

    std::map<Graph::Vertex, std::vector<Graph::Vertex>> radj;     // reversed arcs
    for (const auto& e : g.edges()) radj[e.to].push_back(e.from);

    seen.clear();
    std::vector<Component> out;

    // Second pass on G^R in reverse finish order; one tree per component
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (!seen.insert(*it).second) continue;
        Component comp;
        std::stack<Graph::Vertex> todo;
        todo.push(*it);
        while (!todo.empty()) {
            Graph::Vertex u = todo.top(); todo.pop();
            comp.push_back(u);
            auto r = radj.find(u);
            if (r == radj.end()) continue;
            for (Graph::Vertex v : r->second) {
                if (seen.insert(v).second) todo.push(v);          // mark on push
            }
        }
        std::sort(comp.begin(), comp.end());
        out.push_back(std::move(comp));
    }

    std::sort(out.begin(), out.end(),                             // groups by smallest member
              [](const Component& a, const Component& b) { return a.front() < b.front(); });
    return out;
}

std::vector<Component> components(const Graph& g, Connectivity policy) {
    if (g.directed() && policy == Connectivity::Strong) {
        return strong_components(g);
    }
    return weak_components(g);
}

bool isConnected(const Graph& g, Connectivity policy) {
    return components(g, policy).size() <= 1;                     // 0 groups: empty graph
}
