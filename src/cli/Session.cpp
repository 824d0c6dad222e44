// ===============================================
// Session.cpp
// Text command dispatch for the interactive tool.
// Each cmd* method parses its arguments, calls into the engine and
// renders the structured result as plain text.
// ===============================================

#include "cli/Session.hpp"
#include "algo/Mst.hpp"                   // mst()
#include "algo/ShortestPath.hpp"          // shortestPath(), distances(), pathTo()
#include "io/GraphReader.hpp"             // loadGraphFile()

#include <cctype>                         // std::tolower, std::isdigit
#include <cmath>                          // std::isfinite
#include <iomanip>                        // std::setw, std::setprecision
#include <sstream>                        // std::(i/o)stringstream
#include <stdexcept>                      // std::logic_error, stoull/stod exceptions

namespace {

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

struct CommandInfo {
    const char* name;
    const char* usage;
    const char* description;
};

const CommandInfo kCommands[] = {
    {"create",        "create <n> [directed]",      "Create a graph with vertices 0..n-1 and no edges"},
    {"load",          "load <path> [directed]",     "Load a graph from a file"},
    {"add_vertex",    "add_vertex <v>",             "Add a vertex"},
    {"add_edge",      "add_edge <u> <v> [weight]",  "Add an edge or overwrite its weight"},
    {"remove_vertex", "remove_vertex <v>",          "Remove a vertex and its edges"},
    {"remove_edge",   "remove_edge <u> <v>",        "Remove an edge"},
    {"list_vertices", "list_vertices",              "List all vertices"},
    {"list_edges",    "list_edges [v]",             "List all edges, or the edges leaving v"},
    {"connected",     "connected",                  "Check whether the graph is connected"},
    {"components",    "components",                 "List the connected components"},
    {"shortest_path", "shortest_path <s> <t>",      "Shortest path between two vertices"},
    {"distances",     "distances <s>",              "Distances from a vertex to all others"},
    {"mst",           "mst [start]",                "Minimum spanning tree (Prim)"},
    {"info",          "info",                       "Graph summary"},
    {"help",          "help",                       "Show this help"},
    {"exit",          "exit",                       "Leave the program"},
};

std::string usage(const char* name) {
    for (const auto& c : kCommands) {
        if (std::string(c.name) == name) return std::string("Usage: ") + c.usage;
    }
    return "Usage: help";
}

Graph::Vertex parse_vertex(const std::string& tok) {
    bool digits = !tok.empty();
    for (char c : tok) digits = digits && std::isdigit(static_cast<unsigned char>(c));
    if (digits) {
        try {
            return static_cast<Graph::Vertex>(std::stoull(tok));
        } catch (const std::out_of_range&) {
            // falls through to the error below
        }
    }
    throw GraphError(ErrorKind::MalformedInput, "'" + tok + "' is not a vertex id");
}

Graph::Weight parse_weight(const std::string& tok) {
    std::size_t used = 0;
    double w = 0.0;
    try {
        w = std::stod(tok, &used);
    } catch (const std::invalid_argument&) {
        used = 0;
    } catch (const std::out_of_range&) {
        used = 0;
    }
    if (used == 0 || used != tok.size() || !std::isfinite(w))
        throw GraphError(ErrorKind::MalformedInput, "'" + tok + "' is not a finite weight");
    return w;
}

// Trailing "directed"/"undirected" keyword; true if it was understood
bool parse_kind(const std::string& tok, Graph::Kind& kind) {
    const auto t = to_lower(tok);
    if (t == "directed")   { kind = Graph::Kind::Directed;   return true; }
    if (t == "undirected") { kind = Graph::Kind::Undirected; return true; }
    return false;
}

std::string weight_text(Graph::Weight w) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << w;
    return oss.str();
}

const char* link(const Graph& g) { return g.directed() ? " -> " : " - "; }

std::string join(const std::vector<Graph::Vertex>& vs, const char* sep) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < vs.size(); ++i) {
        if (i) oss << sep;
        oss << vs[i];
    }
    return oss.str();
}

std::string edge_table(const std::vector<Graph::Edge>& edges) {
    std::ostringstream oss;
    oss << std::setw(4) << "#" << std::setw(8) << "from" << std::setw(8) << "to"
        << std::setw(12) << "weight" << "\n";
    for (std::size_t i = 0; i < edges.size(); ++i) {
        oss << std::setw(4) << (i + 1) << std::setw(8) << edges[i].from
            << std::setw(8) << edges[i].to << std::setw(12) << weight_text(edges[i].weight) << "\n";
    }
    oss << "Total edges: " << edges.size();
    return oss.str();
}

} // namespace

// --------------------------
// public API
// --------------------------
const Graph& Session::graph() const {
    if (!m_graph) throw std::logic_error("no graph has been created or loaded");
    return *m_graph;
}

std::string Session::help() {
    std::ostringstream oss;
    oss << "Available commands:\n";
    for (const auto& c : kCommands) {
        oss << "  " << std::left << std::setw(28) << c.usage << c.description << "\n";
    }
    return oss.str();
}

std::string Session::execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) return "";                                 // blank line
    Args args;
    for (std::string t; iss >> t; ) args.push_back(t);

    try {
        return dispatch(to_lower(cmd), args);
    } catch (const GraphError& e) {                               // engine failures are rendered
        return std::string("Error [") + errorKindName(e.kind()) + "]: " + e.what();
    }
}

std::string Session::dispatch(const std::string& cmd, const Args& args) {
    if (cmd == "help")                   return help();
    if (cmd == "exit" || cmd == "quit")  { m_finished = true; return "Bye"; }
    if (cmd == "create")                 return cmdCreate(args);
    if (cmd == "load")                   return cmdLoad(args);

    bool known = false;
    for (const auto& c : kCommands) known = known || cmd == c.name;
    if (!known) return "Unknown command '" + cmd + "'. Type 'help' for the list of commands.";
    if (!m_graph) return "No graph yet. Use 'create' or 'load' first.";

    if (cmd == "add_vertex")    return cmdAddVertex(args);
    if (cmd == "add_edge")      return cmdAddEdge(args);
    if (cmd == "remove_vertex") return cmdRemoveVertex(args);
    if (cmd == "remove_edge")   return cmdRemoveEdge(args);
    if (cmd == "list_vertices") return args.empty() ? cmdListVertices() : usage("list_vertices");
    if (cmd == "list_edges")    return cmdListEdges(args);
    if (cmd == "connected")     return args.empty() ? cmdConnected() : usage("connected");
    if (cmd == "components")    return args.empty() ? cmdComponents() : usage("components");
    if (cmd == "shortest_path") return cmdShortestPath(args);
    if (cmd == "distances")     return cmdDistances(args);
    if (cmd == "mst")           return cmdMst(args);
    return args.empty() ? cmdInfo() : usage("info");             // "info"
}

// --------------------------
// graph lifecycle
// --------------------------
std::string Session::cmdCreate(const Args& args) {
    Graph::Kind kind = Graph::Kind::Undirected;
    if (args.empty() || args.size() > 2) return usage("create");
    if (args.size() == 2 && !parse_kind(args[1], kind)) return usage("create");

    m_graph = Graph(parse_vertex(args[0]), kind, m_cfg.graphOptions);
    return "Created " + m_graph->label();
}

std::string Session::cmdLoad(const Args& args) {
    Graph::Kind kind = Graph::Kind::Undirected;
    if (args.empty() || args.size() > 2) return usage("load");
    if (args.size() == 2 && !parse_kind(args[1], kind)) return usage("load");

    Graph loaded = loadGraphFile(args[0], kind, m_cfg.graphOptions); // old graph kept if this throws
    m_graph = std::move(loaded);
    return "Loaded " + m_graph->label() + " from " + args[0];
}

// --------------------------
// mutations
// --------------------------
std::string Session::cmdAddVertex(const Args& args) {
    if (args.size() != 1) return usage("add_vertex");
    const Graph::Vertex v = parse_vertex(args[0]);
    m_graph->addVertex(v);
    return "Vertex " + std::to_string(v) + " added";
}

std::string Session::cmdAddEdge(const Args& args) {
    if (args.size() < 2 || args.size() > 3) return usage("add_edge");
    const Graph::Vertex u = parse_vertex(args[0]);
    const Graph::Vertex v = parse_vertex(args[1]);
    const Graph::Weight w = args.size() == 3 ? parse_weight(args[2]) : Graph::kDefaultWeight;

    m_graph->addEdge(u, v, w);
    return "Edge " + std::to_string(u) + link(*m_graph) + std::to_string(v)
         + " (weight " + weight_text(w) + ") set";
}

std::string Session::cmdRemoveVertex(const Args& args) {
    if (args.size() != 1) return usage("remove_vertex");
    const Graph::Vertex v = parse_vertex(args[0]);
    m_graph->removeVertex(v);
    return "Vertex " + std::to_string(v) + " removed";
}

std::string Session::cmdRemoveEdge(const Args& args) {
    if (args.size() != 2) return usage("remove_edge");
    const Graph::Vertex u = parse_vertex(args[0]);
    const Graph::Vertex v = parse_vertex(args[1]);
    m_graph->removeEdge(u, v);
    return "Edge " + std::to_string(u) + link(*m_graph) + std::to_string(v) + " removed";
}

// --------------------------
// listings
// --------------------------
std::string Session::cmdListVertices() const {
    const auto vs = m_graph->vertices();
    return "Vertices: " + join(vs, ", ") + "\nTotal vertices: " + std::to_string(vs.size());
}

std::string Session::cmdListEdges(const Args& args) const {
    if (args.size() > 1) return usage("list_edges");
    const auto edges = args.empty() ? m_graph->edges()
                                    : m_graph->incidentEdges(parse_vertex(args[0]));
    if (edges.empty()) return "No edges";
    return edge_table(edges);
}

// --------------------------
// queries
// --------------------------
std::string Session::cmdConnected() const {
    const bool ok = isConnected(*m_graph, m_cfg.connectivity);
    std::string qualifier;
    if (m_graph->directed())
        qualifier = m_cfg.connectivity == Connectivity::Strong ? "strongly " : "weakly ";
    return ok ? "Graph is " + qualifier + "connected"
              : "Graph is not " + qualifier + "connected";
}

std::string Session::cmdComponents() const {
    const auto comps = components(*m_graph, m_cfg.connectivity);
    std::ostringstream oss;
    for (std::size_t i = 0; i < comps.size(); ++i) {
        oss << "Component " << (i + 1) << ": " << join(comps[i], ", ")
            << " (size " << comps[i].size() << ")\n";
    }
    oss << "Total components: " << comps.size();
    return oss.str();
}

std::string Session::cmdShortestPath(const Args& args) const {
    if (args.size() != 2) return usage("shortest_path");
    const Path p = shortestPath(*m_graph, parse_vertex(args[0]), parse_vertex(args[1]));
    return "Path: " + join(p.vertices, link(*m_graph)) + "\nDistance: " + weight_text(p.totalWeight);
}

std::string Session::cmdDistances(const Args& args) const {
    if (args.size() != 1) return usage("distances");
    const Graph::Vertex s = parse_vertex(args[0]);
    const DistanceMap dist = distances(*m_graph, s);

    std::ostringstream oss;
    oss << "Distances from " << s << ":";
    for (Graph::Vertex v : m_graph->vertices()) {
        oss << "\n  " << v << ": ";
        if (!dist.count(v)) {
            oss << "unreachable";
            continue;
        }
        oss << weight_text(dist.at(v).distance)
            << " (" << join(pathTo(dist, v).vertices, link(*m_graph)) << ")";
    }
    return oss.str();
}

std::string Session::cmdMst(const Args& args) const {
    if (args.size() > 1) return usage("mst");
    if (args.empty() && m_graph->n() == 0) {                     // nothing to span
        return "Minimum spanning tree: graph is empty\nTotal weight: " + weight_text(0.0);
    }
    const Graph::Vertex start = args.empty() ? m_graph->vertices().front() // smallest vertex
                                             : parse_vertex(args[0]);

    const MstResult tree = mst(*m_graph, start);
    std::ostringstream oss;
    oss << "Minimum spanning tree from " << start << ":";
    for (std::size_t i = 0; i < tree.edges.size(); ++i) {
        const auto& e = tree.edges[i];
        oss << "\n  Step " << (i + 1) << ": " << e.from << " - " << e.to
            << " (" << weight_text(e.weight) << ")";
    }
    oss << "\nTotal weight: " << weight_text(tree.totalWeight);
    return oss.str();
}

std::string Session::cmdInfo() const {
    std::ostringstream oss;
    oss << m_graph->label() << "\n"
        << "Mode: " << (m_graph->directed() ? "directed" : "undirected") << "\n"
        << "Vertices: " << m_graph->n() << "\n"
        << "Edges: " << m_graph->m() << "\n"
        << "Connected: " << (isConnected(*m_graph, m_cfg.connectivity) ? "yes" : "no");
    return oss.str();
}
