#include "io/GraphReader.hpp"
#include <cctype>                         // std::isdigit
#include <cmath>                          // std::isfinite
#include <fstream>                        // std::ifstream
#include <sstream>                        // line tokenizing
#include <stdexcept>                      // std::invalid_argument, std::out_of_range from stoull/stod

namespace {

[[noreturn]] void malformed(std::size_t lineNo, const std::string& what) {
    throw GraphError(ErrorKind::MalformedInput, "line " + std::to_string(lineNo) + ": " + what);
}

// Unsigned decimal integer, no sign, no trailing junk
std::size_t parse_count(const std::string& tok, std::size_t lineNo, const char* what) {
    bool digits = !tok.empty();
    for (char c : tok) digits = digits && std::isdigit(static_cast<unsigned char>(c));
    if (!digits) malformed(lineNo, std::string(what) + " must be a non-negative integer, got '" + tok + "'");
    try {
        return static_cast<std::size_t>(std::stoull(tok));
    } catch (const std::out_of_range&) {
        malformed(lineNo, std::string(what) + " '" + tok + "' is too large");
    }
}

Graph::Weight parse_weight(const std::string& tok, std::size_t lineNo) {
    std::size_t used = 0;
    double w = 0.0;
    try {
        w = std::stod(tok, &used);
    } catch (const std::invalid_argument&) {
        malformed(lineNo, "weight must be a number, got '" + tok + "'");
    } catch (const std::out_of_range&) {
        malformed(lineNo, "weight '" + tok + "' is out of range");
    }
    if (used != tok.size()) malformed(lineNo, "weight must be a number, got '" + tok + "'");
    if (!std::isfinite(w)) malformed(lineNo, "weight must be finite, got '" + tok + "'");
    return w;
}

std::vector<std::string> tokens(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> out;
    for (std::string t; iss >> t; ) out.push_back(t);
    return out;
}

} // namespace

GraphFile readGraph(std::istream& in) {
    GraphFile file;
    bool haveCount = false;
    std::size_t lineNo = 0;

    for (std::string line; std::getline(in, line); ) {
        ++lineNo;
        const auto toks = tokens(line);
        if (toks.empty()) continue;                               // blank line

        if (!haveCount) {                                         // header: vertex count
            if (toks.size() != 1) malformed(lineNo, "expected a single vertex count");
            file.vertexCount = parse_count(toks[0], lineNo, "vertex count");
            if (file.vertexCount > Graph::kMaxVertexCount)
                malformed(lineNo, "vertex count " + toks[0] + " exceeds the limit of "
                                  + std::to_string(Graph::kMaxVertexCount));
            haveCount = true;
            continue;
        }

        if (toks.size() < 2 || toks.size() > 3)
            malformed(lineNo, "expected 'u v [weight]'");

        Graph::EdgeInput e{parse_count(toks[0], lineNo, "vertex"),
                           parse_count(toks[1], lineNo, "vertex"),
                           std::nullopt};
        if (toks.size() == 3) e.weight = parse_weight(toks[2], lineNo);
        file.edges.push_back(e);
    }

    if (!haveCount) malformed(lineNo == 0 ? 1 : lineNo, "missing vertex count");
    return file;
}

GraphFile readGraphFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw GraphError(ErrorKind::MalformedInput, "cannot open '" + path + "'");
    return readGraph(in);
}

Graph loadGraphFile(const std::string& path, Graph::Kind kind, Graph::Options opts) {
    const GraphFile file = readGraphFile(path);
    return Graph::load(file.vertexCount, file.edges, kind, opts);
}
