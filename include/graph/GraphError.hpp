#pragma once                              // ensure this header is included only once per translation unit

#include <stdexcept>     // base class std::runtime_error
#include <string>        // message text

// ==========================
// Typed failure of a graph operation
// ==========================
// Every Graph / algorithm / reader failure throws a GraphError.
// The kind tells the caller *what* went wrong, the message says *where*.
// ==========================

enum class ErrorKind {
    UnknownVertex,    // vertex id not in the graph
    DuplicateVertex,  // addVertex on an existing id
    UnknownEdge,      // no edge for the requested pair
    MalformedInput,   // bad file shape, bad number, out-of-range endpoint
    NotUndirected,    // MST asked on a directed graph
    Disconnected,     // MST asked on a disconnected graph
    NoPath,           // target unreachable from source
    NegativeWeight,   // Dijkstra refuses negative edge weights
    SelfLoop          // u == v while self-loops are disabled
};

// Stable name of a kind, e.g. "UnknownVertex"
const char* errorKindName(ErrorKind kind) noexcept;

class GraphError : public std::runtime_error {
public:
    GraphError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};
