#include "multigraph/Snapshot.hpp"
#include <algorithm>         // std::sort
#include <stdexcept>         // std::invalid_argument
#include <string>            // std::string
#include <utility>           // std::move
#include <vector>            // std::vector

nlohmann::json Snapshot::to_json() const {
    nlohmann::json j;
    j["kind"] = kind == Graph::Kind::Directed ? "directed" : "undirected";
    j["nodes"] = nodes;
    j["edges"] = edges;
    return j;
}

Snapshot Snapshot::from_json(const nlohmann::json& j) {
    Snapshot snap;
    const std::string kind = j.at("kind").get<std::string>();
    if (kind == "directed") snap.kind = Graph::Kind::Directed;
    else if (kind == "undirected") snap.kind = Graph::Kind::Undirected;
    else throw std::invalid_argument("Snapshot: unknown graph kind '" + kind + "'");

    snap.nodes = j.at("nodes");
    snap.edges = j.at("edges");
    return snap;
}

Snapshot dumpSnapshot(const Graph& g) {
    Snapshot snap;
    snap.kind = g.kind();

    for (const auto& entry : g.nodes())                            // objects keep keys sorted
        snap.nodes[entry.first] = entry.second.attributes;

    std::vector<const Graph::EdgeStore::value_type*> couples;     // sorted view of the edge store
    for (const auto& entry : g.edges()) couples.push_back(&entry);
    std::sort(couples.begin(), couples.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });

    for (const auto* entry : couples) {
        nlohmann::json multiples = nlohmann::json::object();
        for (const auto& m : entry->second) multiples[m.first] = m.second;

        nlohmann::json couple = nlohmann::json::array();
        couple.push_back(entry->first.left);
        couple.push_back(entry->first.right);

        nlohmann::json item = nlohmann::json::array();
        item.push_back(std::move(couple));
        item.push_back(std::move(multiples));
        snap.edges.push_back(std::move(item));
    }

    return snap;
}

Graph loadSnapshot(const Snapshot& snapshot) {
    return loadSnapshot(snapshot, Graph::Options{});
}

Graph loadSnapshot(const Snapshot& snapshot, Graph::Options opts) {
    return Graph(snapshot.kind, snapshot.nodes, snapshot.edges, opts);
}
