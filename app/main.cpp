// ==========================
// graphkit: interactive graph tool
// ==========================
// Parses: [-f <file>] [--directed] [--strong] [--allow-self-loops] [--help]
// Reads one command per line from stdin and prints the session's reply.
// ==========================

#include "cli/Session.hpp"     // command dispatch
#include "io/GraphReader.hpp"  // start-up load
#include <getopt.h>            // getopt_long for command-line parsing
#include <unistd.h>            // isatty
#include <cstdlib>             // std::exit
#include <iostream>            // I/O
#include <string>

static void usage(const char* prog, int code) {               // print usage and exit
    std::cerr << "Usage: " << prog
              << " [-f <file>] [-d|--directed] [-s|--strong] [-l|--allow-self-loops]\n"
              << "  -f <file>            load a graph file at start-up\n"
              << "  -d, --directed       treat the start-up file as a directed graph\n"
              << "  -s, --strong         strong connectivity for directed graphs (default: weak)\n"
              << "  -l, --allow-self-loops  accept edges u -> u\n";
    std::exit(code);
}

int main(int argc, char* argv[]) {                            // entry point
    std::string file; bool dir = false; int li = 0;           // defaults and parsing state
    Session::Config cfg;                                      // weak connectivity, no self-loops
    option lo[] = {                                           // long options
        {"file",             required_argument, nullptr, 'f'},
        {"directed",         no_argument,       nullptr, 'd'},
        {"strong",           no_argument,       nullptr, 's'},
        {"allow-self-loops", no_argument,       nullptr, 'l'},
        {"help",             no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "f:dslh", lo, &li)) != -1; ) { // parse flags
        if (opt == 'f') file = optarg;                        // start-up file
        else if (opt == 'd') dir = true;                      // directed flag
        else if (opt == 's') cfg.connectivity = Connectivity::Strong;
        else if (opt == 'l') cfg.graphOptions.allowSelfLoops = true;
        else if (opt == 'h') usage(argv[0], 0);
        else usage(argv[0], 1);                               // invalid flag
    }
    if (optind < argc) usage(argv[0], 1);                     // no positional arguments

    Session session(cfg);

    if (!file.empty()) {                                      // optional start-up load
        try {
            session.setGraph(loadGraphFile(file,
                                           dir ? Graph::Kind::Directed : Graph::Kind::Undirected,
                                           cfg.graphOptions));
        } catch (const GraphError& e) {
            std::cerr << "[graphkit] cannot load " << file << ": "
                      << errorKindName(e.kind()) << ": " << e.what() << "\n";
            return 1;
        }
        std::cout << "Loaded " << session.graph().label() << " from " << file << "\n";
    }

    const bool interactive = isatty(STDIN_FILENO) != 0;       // prompt only on a terminal
    if (interactive) std::cout << "graphkit. Type 'help' for the list of commands.\n";

    std::string line;
    while (!session.finished()) {
        if (interactive) std::cout << "graph> " << std::flush;
        if (!std::getline(std::cin, line)) break;             // EOF ends the session
        const std::string reply = session.execute(line);
        if (!reply.empty()) std::cout << reply << "\n";
    }
    return 0;                                                 // success
}
