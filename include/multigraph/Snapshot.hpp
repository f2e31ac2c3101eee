#pragma once                 // ensure this header is included only once per translation unit

#include "multigraph/Graph.hpp"   // Graph, Graph::Kind, Graph::Options
#include <nlohmann/json.hpp>      // snapshot documents

// In-memory snapshot of a graph. `nodes` and `edges` use the mapping shapes
// accepted by bulk loading:
//   nodes: { "identifier": { attributes } }
//   edges: [ [ ["left", "right"], { "identifier": { attributes } } ], ... ]
struct Snapshot {
    Graph::Kind kind = Graph::Kind::Undirected;
    nlohmann::json nodes = nlohmann::json::object();
    nlohmann::json edges = nlohmann::json::array();

    // {"kind": "directed" | "undirected", "nodes": ..., "edges": ...}
    nlohmann::json to_json() const;

    // Inverse of to_json(). An unknown kind throws std::invalid_argument;
    // missing keys throw nlohmann::json::out_of_range.
    static Snapshot from_json(const nlohmann::json& j);
};

// Capture nodes and edges of `g`. Calculated attributes are not stored; they
// are rebuilt on load. Nodes come out in identifier order, couples in
// (left, right) order.
Snapshot dumpSnapshot(const Graph& g);

// Rebuild a graph of the recorded variant through the bulk-loading path.
Graph loadSnapshot(const Snapshot& snapshot);
Graph loadSnapshot(const Snapshot& snapshot, Graph::Options opts);
