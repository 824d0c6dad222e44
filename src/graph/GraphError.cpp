// ==========================
// GraphError.cpp
// ==========================
// Stable display names for ErrorKind values, as used in
// "Error [Kind]: message" replies.
// ==========================

#include "graph/GraphError.hpp"

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownVertex:   return "UnknownVertex";
        case ErrorKind::DuplicateVertex: return "DuplicateVertex";
        case ErrorKind::UnknownEdge:     return "UnknownEdge";
        case ErrorKind::MalformedInput:  return "MalformedInput";
        case ErrorKind::NotUndirected:   return "NotUndirected";
        case ErrorKind::Disconnected:    return "Disconnected";
        case ErrorKind::NoPath:          return "NoPath";
        case ErrorKind::NegativeWeight:  return "NegativeWeight";
        case ErrorKind::SelfLoop:        return "SelfLoop";
    }
    return "Unknown";
}
