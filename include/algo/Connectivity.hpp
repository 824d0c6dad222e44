#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // Graph, Graph::Vertex
#include <vector>                         // component lists

/**
 * @brief Meaning of "connected" for a directed graph.
 *        Weak:   direction is ignored (the default).
 *        Strong: every pair of vertices is mutually reachable.
 *        Undirected graphs ignore the policy.
 */
enum class Connectivity { Weak, Strong };

using Component = std::vector<Graph::Vertex>;

/**
 * @brief Partition all vertices into maximal connected groups.
 *        Weak / undirected: BFS from every unvisited vertex in ascending id order,
 *        members listed in discovery order, groups in order of their root.
 *        Strong: Kosaraju; members ascending, groups ordered by smallest member.
 */
std::vector<Component> components(const Graph& g, Connectivity policy = Connectivity::Weak);

/**
 * @brief True iff the graph has at most one component under `policy`.
 *        The empty graph is connected.
 */
bool isConnected(const Graph& g, Connectivity policy = Connectivity::Weak);
