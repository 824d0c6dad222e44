#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Graph.hpp"                // Graph::EdgeInput, Graph::load
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

// ==========================
// Load-file reader
// ==========================
// Format:
//   line 1     : <vertex count>            non-negative integer
//   next lines : <u> <v> [weight]          weight defaults to 1.0
// Blank lines are skipped. Any other deviation throws
// GraphError(MalformedInput) naming the 1-based line number.
// ==========================

struct GraphFile {
    std::size_t vertexCount = 0;
    std::vector<Graph::EdgeInput> edges;      // in file order, duplicates kept
};

GraphFile readGraph(std::istream& in);

// Throws MalformedInput if the file cannot be opened
GraphFile readGraphFile(const std::string& path);

// readGraphFile() followed by Graph::load()
Graph loadGraphFile(const std::string& path, Graph::Kind kind, Graph::Options opts = Graph::Options{});
