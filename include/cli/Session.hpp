#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // the active graph
#include "algo/Connectivity.hpp"          // Connectivity policy
#include <optional>                       // no graph before create/load
#include <string>
#include <utility>                        // std::move
#include <vector>

// ==========================
// Interactive session
// ==========================
// Owns the active graph of one terminal session and executes one text
// command at a time against it, e.g. "add_edge 0 1 2.5" or "mst 0".
// execute() returns the text to show; it never writes to a stream.
// Engine failures come back rendered as "Error [Kind]: message".
// ==========================

class Session {
public:
    struct Config {
        Connectivity connectivity = Connectivity::Weak;   // policy for directed graphs
        Graph::Options graphOptions;                      // applied to create/load
    };

    Session() = default;
    explicit Session(Config cfg) : m_cfg(cfg) {}

    // Run one command line; blank lines yield an empty string
    std::string execute(const std::string& line);

    // True after "exit" / "quit"
    bool finished() const noexcept { return m_finished; }

    bool hasGraph() const noexcept { return m_graph.has_value(); }

    // Throws std::logic_error if no graph was created or loaded yet
    const Graph& graph() const;

    // Replace the active graph (start-up load from the command line)
    void setGraph(Graph g) { m_graph = std::move(g); }

    // The command reference printed by "help"
    static std::string help();

private:
    using Args = std::vector<std::string>;

    Config m_cfg;
    std::optional<Graph> m_graph;
    bool m_finished = false;

    std::string dispatch(const std::string& cmd, const Args& args);

    std::string cmdCreate(const Args& args);
    std::string cmdLoad(const Args& args);
    std::string cmdAddVertex(const Args& args);
    std::string cmdAddEdge(const Args& args);
    std::string cmdRemoveVertex(const Args& args);
    std::string cmdRemoveEdge(const Args& args);
    std::string cmdListVertices() const;
    std::string cmdListEdges(const Args& args) const;
    std::string cmdConnected() const;
    std::string cmdComponents() const;
    std::string cmdShortestPath(const Args& args) const;
    std::string cmdDistances(const Args& args) const;
    std::string cmdMst(const Args& args) const;
    std::string cmdInfo() const;
};
