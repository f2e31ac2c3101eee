// ==========================
// Demo: random multigraph + describe()
// ==========================
// Parses: -n <nodes> -e <edges> -s <seed> [--directed] [--loops] [--json]
// Generates a random multigraph (parallel edges allowed, loops on request)
// in batch mode and prints its classification and calculated attributes,
// or its JSON snapshot with --json.
// ==========================

#include "multigraph/Graph.hpp"   // Graph API
#include "multigraph/Snapshot.hpp" // dumpSnapshot() for --json
#include <getopt.h>               // getopt_long for command-line parsing
#include <cstdint>                // std::uint32_t
#include <cstdlib>                // std::atoi, std::exit
#include <iostream>               // I/O
#include <random>                 // PRNG
#include <string>                 // std::string, std::to_string
#include <vector>                 // node identifiers

static void usage(const char* prog) {                          // print usage and exit
    std::cerr << "Usage: " << prog
              << " -n <nodes> -e <edges> -s <seed> [--directed] [--loops] [--json]\n";
    std::exit(1);
}

int main(int argc, char* argv[]) {                             // entry point
    long long N=-1, E=-1, SEED=-1; bool dir=false, loops=false, asJson=false; int li=0; // defaults and parsing state
    option lo[] = {{"directed", no_argument, nullptr, 'D'},
                   {"loops",    no_argument, nullptr, 'L'},
                   {"json",     no_argument, nullptr, 'J'},
                   {nullptr,0,nullptr,0}};                     // long options

    for (int opt; (opt = getopt_long(argc, argv, "n:e:s:", lo, &li)) != -1; ) { // parse flags
        if (opt=='n') N = std::atoi(optarg);                   // nodes
        else if (opt=='e') E = std::atoi(optarg);              // edges
        else if (opt=='s') SEED = std::atoi(optarg);           // seed
        else if (opt=='D') dir = true;                         // directed flag
        else if (opt=='L') loops = true;                       // allow loops
        else if (opt=='J') asJson = true;                       // print the snapshot instead
        else usage(argv[0]);                                   // invalid flag
    }

    if (N<=0 || E<0 || SEED<0) usage(argv[0]);                 // basic validation
    if (!loops && N < 2 && E > 0) {                            // every edge would be a loop
        std::cerr << "Need at least 2 nodes for edges without loops\n";
        return 1;
    }

    Graph g(dir ? Graph::Kind::Directed : Graph::Kind::Undirected);

    std::vector<Identifier> ids;                               // node identifiers v0..v{N-1}
    for (long long i = 0; i < N; ++i)
        ids.push_back(g.addNode("v" + std::to_string(i)));

    std::mt19937 rng(static_cast<std::uint32_t>(SEED));        // PRNG
    std::uniform_int_distribution<int> pick(0, (int)N-1);      // uniform node picker

    long long added = 0;                                       // edges added
    while (added < E) {                                        // keep adding edges
        int u = pick(rng), v = pick(rng);                      // random endpoints
        if (u == v && !loops) continue;                        // skip loops unless enabled
        g.addEdge(ids[u], ids[v], std::nullopt, false, true, false); // batch mode: no recalculation
        ++added;                                               // count it (parallel edges allowed)
    }

    if (asJson) {                                              // snapshot document, 2-space indent
        std::cout << dumpSnapshot(g).to_json().dump(2) << "\n";
        return 0;
    }

    try {
        const Graph::Description d = g.describe();             // recalculates first
        std::cout << g.label() << "\n";                        // summary line
        std::cout << "parallel edges: " << g.numberOfEdges()
                  << ", multigraph: " << (d.multigraph ? "yes" : "no")
                  << ", pseudograph: " << (d.pseudograph ? "yes" : "no")
                  << ", complete: " << (d.complete ? "yes" : "no")
                  << ", connected: n/a\n";

        for (const auto& id : ids) {                           // per-node calculated attributes
            const Graph::Node& node = g.node(id);
            std::cout << id << " degree=" << node.degree << " neighbors={";
            bool first = true;
            for (const auto& nb : node.neighbors) {
                std::cout << (first ? "" : ",") << nb;
                first = false;
            }
            std::cout << "}\n";
        }

        std::size_t loopCount = 0;
        for (const Couple& c : g.findLoops()) {                // loops, if any
            std::cout << "loop " << c << "\n";
            ++loopCount;
        }
        if (loopCount == 0) std::cout << "no loops\n";
    } catch (const GraphError& err) {
        std::cerr << "graph error: " << err.what() << "\n";
        return 1;
    }

    return 0;                                                  // success
}
