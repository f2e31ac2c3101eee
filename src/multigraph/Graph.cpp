// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line methods of the Graph class:
// construction and bulk loading, the node / edge mutation API, the
// calculated-attribute passes, subgraph extraction, classification and
// label(). Views and trivial accessors are inline in Graph.hpp.
// ==========================

#include "multigraph/Graph.hpp"        // include the Graph class declaration
#include "multigraph/Validation.hpp"   // validateNodes(), validateEdges()
#include <algorithm>                    // std::minmax
#include <sstream>                      // used for building strings in label()
#include <utility>                      // std::move, std::pair

// --------------------------
// topologyFor
// --------------------------
// Purpose:
//   Map a Kind onto its (stateless, shared) Topology implementation.
static std::shared_ptr<const Topology> topologyFor(Graph::Kind kind) {
    static const std::shared_ptr<const Topology> directed   = std::make_shared<DirectedTopology>();   // successors, ordered couples
    static const std::shared_ptr<const Topology> undirected = std::make_shared<UndirectedTopology>(); // symmetric, (min,max) couples
    if (kind == Graph::Kind::Directed) return directed;
    return undirected;
}

// --------------------------
// Constructors
// --------------------------

Graph::Graph(Kind kind)
    : m_kind(kind), m_topology(topologyFor(kind)), m_opts(Options{}) {}

Graph::Graph(Kind kind, Options opts)
    : m_kind(kind), m_topology(topologyFor(kind)), m_opts(opts) {}

Graph::Graph(Kind kind, const nlohmann::json& nodes, const nlohmann::json& edges)
    : Graph(kind, nodes, edges, Options{}) {}

Graph::Graph(Kind kind, const nlohmann::json& nodes, const nlohmann::json& edges, Options opts)
    : m_kind(kind), m_topology(topologyFor(kind)), m_opts(opts) {
    addNodes(nodes);                    // validate + insert nodes
    addEdges(edges, false);             // validate + insert edges, defer recalculation
    recalculate();                      // one degree/neighbor pass for the whole load
}

// --------------------------
// Lookups
// --------------------------

std::size_t Graph::numberOfEdges() const {
    std::size_t total = 0;
    for (const auto& entry : m_edges) total += entry.second.size(); // parallel edges count one by one
    return total;
}

Couple Graph::couple(const Identifier& left, const Identifier& right) const {
    return m_topology->canonical(left, right);
}

bool Graph::hasNode(const Identifier& identifier) const {
    return m_nodes.count(identifier) != 0;
}

bool Graph::hasEdge(const Identifier& left, const Identifier& right) const {
    return m_edges.count(couple(left, right)) != 0;
}

bool Graph::hasEdge(const Identifier& left, const Identifier& right, const Identifier& identifier) const {
    auto it = m_edges.find(couple(left, right));
    return it != m_edges.end() && it->second.count(identifier) != 0;
}

const Graph::Node& Graph::node(const Identifier& identifier) const {
    auto it = m_nodes.find(identifier);
    if (it == m_nodes.end())
        throw GraphError(ErrorKind::NodeNotFound, std::nullopt, identifier);
    return it->second;
}

const Graph::Multiples& Graph::edgesBetween(const Identifier& left, const Identifier& right) const {
    const Couple c = couple(left, right);
    auto it = m_edges.find(c);
    if (it == m_edges.end())
        throw GraphError(ErrorKind::CoupleNotFound, c);
    return it->second;
}

const Attributes& Graph::edge(const Identifier& left, const Identifier& right,
                              const Identifier& identifier) const {
    const Multiples& multiples = edgesBetween(left, right);
    auto it = multiples.find(identifier);
    if (it == multiples.end())
        throw GraphError(ErrorKind::EdgeNotFound, couple(left, right), identifier);
    return it->second;
}

// --------------------------
// addNode
// --------------------------
// Purpose:
//   Insert a node, or overwrite the attributes of an existing one when
//   `replace` is set. Calculated attributes of a replaced node survive.
// Returns:
//   The node identifier (generated when none was given).
Identifier Graph::addNode(std::optional<Identifier> identifier, bool replace, Attributes attributes) {
    Identifier id = identifier ? std::move(*identifier) : generateIdentifier(); // pick identifier

    auto it = m_nodes.find(id);                         // look for an existing node
    if (it != m_nodes.end()) {
        if (!replace)                                   // existing node and no replace -> fail
            throw GraphError(ErrorKind::NodeAlreadyExists, std::nullopt, id);
        it->second.attributes = std::move(attributes);  // overwrite, degree/neighbors kept
    } else {
        Node n;                                         // fresh node, calculated attributes zeroed
        n.attributes = std::move(attributes);
        m_nodes.emplace(id, std::move(n));
    }

    markStale();                                        // addNode never recalculates
    return id;
}

// --------------------------
// addNodes
// --------------------------
// Purpose:
//   Bulk insertion. The whole input is validated first, so a type or shape
//   failure leaves the graph untouched. A repeated mapping key fails with
//   NodeAlreadyExists after the earlier entries were inserted.
void Graph::addNodes(const nlohmann::json& nodes) {
    switch (validateNodes(nodes)) {
        case InputShape::None:
            return;                                     // nothing to load
        case InputShape::Mapping:
            for (const auto& e : nodes.items())         // identifier -> attributes, in key order
                addNode(e.key(), false, e.value().get<Attributes>());
            return;
        case InputShape::Sequence:
            for (const auto& item : nodes)              // identifiers only; duplicates replace
                addNode(item.get<Identifier>(), true, Attributes{});
            return;
    }
}

// --------------------------
// delNode
// --------------------------
// Purpose:
//   Remove a node and, before it, every couple that has the node at either
//   end. Fails with NodeNotFound without touching the graph.
void Graph::delNode(const Identifier& identifier, bool recalc) {
    auto it = m_nodes.find(identifier);
    if (it == m_nodes.end())
        throw GraphError(ErrorKind::NodeNotFound, std::nullopt, identifier);

    auto inc = m_incidence.find(identifier);            // couples touching the node
    if (inc != m_incidence.end()) {
        const std::vector<Couple> incident(inc->second.begin(), inc->second.end()); // copy: eraseCouple edits the index
        for (const Couple& c : incident) eraseCouple(m_edges.find(c));
    }

    m_nodes.erase(it);                                  // finally the node itself

    if (recalc) recalculate();                          // O(V+E) now...
    else markStale();                                   // ...or left to the caller
}

// --------------------------
// clearNodes
// --------------------------
// Purpose:
//   Remove every node. Edges stay unless Options::cascadeClearNodes is set;
//   kept edges then reference absent nodes and are skipped by the
//   calculated-attribute passes until their endpoints are added back.
void Graph::clearNodes() {
    m_nodes.clear();
    if (m_opts.cascadeClearNodes) {
        m_edges.clear();
        m_incidence.clear();
    }
    m_degreeStale = m_neighborsStale = false;           // no node left to be stale
}

// --------------------------
// addEdge
// --------------------------
// Purpose:
//   Store an edge under the canonical couple of (left, right). Missing
//   endpoints are created when addMissingNodes is set.
// Returns:
//   The edge identifier (generated when none was given).
Identifier Graph::addEdge(const Identifier& left, const Identifier& right,
                          std::optional<Identifier> identifier,
                          bool replace, bool addMissingNodes, bool recalc,
                          Attributes attributes) {
    const Couple c = couple(left, right);                               // canonical couple
    Identifier id = identifier ? std::move(*identifier) : generateIdentifier();

    auto found = m_edges.find(c);
    if (!replace && found != m_edges.end() && found->second.count(id) != 0) // already stored
        throw GraphError(ErrorKind::EdgeAlreadyExists, c, id);

    touchCouple(c)[id] = std::move(attributes);                         // insert or overwrite

    if (addMissingNodes) {                                              // endpoints that do not exist yet
        m_nodes.try_emplace(left);
        m_nodes.try_emplace(right);
    }

    if (recalc) recalculate();
    else markStale();
    return id;
}

// --------------------------
// addEdges
// --------------------------
// Purpose:
//   Bulk insertion. Validation runs over the whole input first. A repeated
//   edge identifier within one couple (for instance (a,b) and (b,a) keys in
//   an undirected graph) fails with DuplicationInEdgeIdentifiers after the
//   preceding edges were inserted.
void Graph::addEdges(const nlohmann::json& edges, bool recalc) {
    const InputShape shape = validateEdges(edges, m_opts.rejectEmptyMultiples);

    if (shape == InputShape::Mapping) {
        for (const auto& entry : edges) {                               // [[left, right], {id: attrs}]
            const Identifier left  = entry[0][0].get<Identifier>();
            const Identifier right = entry[0][1].get<Identifier>();
            const nlohmann::json& multiples = entry[1];

            if (multiples.empty()) {                                    // {} -> one anonymous edge
                addEdge(left, right, std::nullopt, false, true, false);
                continue;
            }
            for (const auto& multiple : multiples.items()) {
                try {
                    addEdge(left, right, multiple.key(), false, true, false,
                            multiple.value().get<Attributes>());
                } catch (const GraphError& err) {
                    if (err.kind() != ErrorKind::EdgeAlreadyExists) throw;
                    throw GraphError(ErrorKind::DuplicationInEdgeIdentifiers,
                                     err.couple(), err.identifier(), err.kind());
                }
            }
        }
    } else if (shape == InputShape::Sequence) {
        for (const auto& item : edges)                                  // every couple -> one anonymous edge
            addEdge(item[0].get<Identifier>(), item[1].get<Identifier>(),
                    std::nullopt, false, true, false);
    } else {
        return;                                                         // null input
    }

    if (recalc) recalculate();
}

// --------------------------
// delEdge
// --------------------------
// Purpose:
//   Without identifier: drop the couple with all its parallel edges.
//   With identifier: drop that edge only (and the couple once it is empty).
//   Fails with CoupleNotFound / EdgeNotFound without touching the graph.
void Graph::delEdge(const Identifier& left, const Identifier& right,
                    std::optional<Identifier> identifier, bool recalc) {
    const Couple c = couple(left, right);
    auto found = m_edges.find(c);
    if (found == m_edges.end())
        throw GraphError(ErrorKind::CoupleNotFound, c);

    if (!identifier) {
        eraseCouple(found);                                             // all parallel edges at once
    } else {
        auto e = found->second.find(*identifier);
        if (e == found->second.end())
            throw GraphError(ErrorKind::EdgeNotFound, c, *identifier);
        found->second.erase(e);
        if (found->second.empty()) eraseCouple(found);                  // no empty couples in the store
    }

    if (recalc) recalculate();
    else markStale();
}

// --------------------------
// clearEdges
// --------------------------
// Purpose:
//   Remove every edge. Unlike clearNodes() this keeps the graph consistent:
//   every node ends with degree 0 and no neighbors.
void Graph::clearEdges() {
    m_edges.clear();
    m_incidence.clear();
    clearDegree();
    clearNeighbors();
}

// --------------------------
// Calculated attributes
// --------------------------

void Graph::clearDegree() {
    for (auto& entry : m_nodes) entry.second.degree = 0;
    m_degreeStale = !m_edges.empty();                   // zero is only accurate without edges
}

// degree(v) = sum of parallel-edge counts over couples touching v; both ends
// of a couple are incremented, so a loop counts twice and a directed degree
// is in-degree + out-degree.
void Graph::calcDegree() {
    clearDegree();
    for (const auto& entry : m_edges) {
        const std::size_t count = entry.second.size();  // parallel multiplicity
        auto l = m_nodes.find(entry.first.left);
        if (l != m_nodes.end()) l->second.degree += count;
        auto r = m_nodes.find(entry.first.right);
        if (r != m_nodes.end()) r->second.degree += count;
    }
    m_degreeStale = false;
}

void Graph::clearNeighbors() {
    for (auto& entry : m_nodes) entry.second.neighbors.clear();
    m_neighborsStale = !m_edges.empty();
}

void Graph::calcNeighbors() {
    clearNeighbors();
    const Topology::NeighborSink sink = [this](const Identifier& owner, const Identifier& neighbor) {
        auto it = m_nodes.find(owner);
        if (it != m_nodes.end()) it->second.neighbors.insert(neighbor);
    };
    for (const auto& entry : m_edges) m_topology->linkNeighbors(entry.first, sink);
    m_neighborsStale = false;
}

void Graph::recalculate() {
    calcDegree();
    calcNeighbors();
}

// --------------------------
// getSubgraph
// --------------------------
// Purpose:
//   Copy the couples selected by `fullmatch` together with their endpoints.
//   Node retention is edge-driven: a selected node with no kept couple is
//   not part of the result.
Graph Graph::getSubgraph(const std::vector<Identifier>& selected, bool fullmatch) const {
    std::unordered_set<Identifier> chosen;                              // selected ∩ existing nodes
    for (const auto& id : selected)
        if (hasNode(id)) chosen.insert(id);

    auto keep = [&](const Couple& c) {
        const bool l = chosen.count(c.left) != 0;
        const bool r = chosen.count(c.right) != 0;
        return fullmatch ? (l && r) : (l || r);
    };

    Graph sub(m_kind, m_opts);                                          // same variant, same options
    for (const auto& entry : m_edges) {
        const Couple& c = entry.first;
        if (!keep(c)) continue;

        for (const auto& multiple : entry.second)                       // every parallel edge
            sub.addEdge(c.left, c.right, multiple.first, false, false, false, multiple.second);

        for (const Identifier* end : {&c.left, &c.right}) {             // copy endpoints once
            auto it = m_nodes.find(*end);
            if (it != m_nodes.end() && !sub.hasNode(*end))
                sub.addNode(*end, false, it->second.attributes);
        }
    }

    sub.recalculate();                                                  // fresh calculated attributes
    return sub;
}

// --------------------------
// Classification
// --------------------------

bool Graph::isMulti() const {
    for (const auto& entry : m_edges)
        if (entry.second.size() > 1) return true;
    return false;
}

bool Graph::isPseudo() const {
    return !findLoops().empty();
}

// Complete when the distinct non-loop pairs reach n*(n-1)/2. Pairs are
// normalized with std::minmax so (a,b) and (b,a) of a directed graph count once.
bool Graph::isComplete() const {
    std::set<std::pair<Identifier, Identifier>> pairs;
    for (const auto& entry : m_edges) {
        const Couple& c = entry.first;
        if (c.isLoop()) continue;
        auto k = std::minmax(c.left, c.right);
        pairs.emplace(k.first, k.second);
    }
    const std::size_t n = m_nodes.size();
    const std::size_t maxPairs = n < 2 ? 0 : n * (n - 1) / 2;
    return pairs.size() == maxPairs;
}

Graph::Description Graph::describe() {
    recalculate();                                      // classification reads fresh state

    Description d{};
    d.kind        = m_kind;
    d.nodes       = m_nodes.size();
    d.couples     = m_edges.size();
    d.multigraph  = isMulti();
    d.pseudograph = isPseudo();
    d.complete    = isComplete();
    d.connected   = std::nullopt;                       // connectivity is not implemented
    return d;
}

// --------------------------
// label
// --------------------------
// Format:
//   "[Complete] [Pseudo] [Multi] Directed|Undirected Graph with N node(s) and M edge(s)"
//   where M counts distinct couples.
std::string Graph::label() {
    const Description d = describe();

    std::string type = directed() ? "Directed Graph" : "Undirected Graph";
    if (d.multigraph)  type = "Multi " + type;
    if (d.pseudograph) type = "Pseudo " + type;
    if (d.complete)    type = "Complete " + type;

    std::ostringstream oss;
    oss << type << " with "
        << d.nodes << (d.nodes == 1 ? " node" : " nodes") << " and "
        << d.couples << (d.couples == 1 ? " edge" : " edges");
    return oss.str();
}

bool Graph::operator==(const Graph& other) const {
    return m_kind == other.m_kind &&
           m_nodes == other.m_nodes &&
           m_edges == other.m_edges;
}

// --------------------------
// Private helpers
// --------------------------

Graph::Multiples& Graph::touchCouple(const Couple& c) {
    auto inserted = m_edges.try_emplace(c);
    if (inserted.second) {                              // new couple: index both endpoints
        m_incidence[c.left].insert(c);
        m_incidence[c.right].insert(c);
    }
    return inserted.first->second;
}

void Graph::eraseCouple(EdgeStore::iterator it) {
    const Couple c = it->first;                         // copy: the key dies with erase()
    m_edges.erase(it);
    for (const Identifier* end : {&c.left, &c.right}) {
        auto inc = m_incidence.find(*end);
        if (inc == m_incidence.end()) continue;         // loop: second endpoint already handled
        inc->second.erase(c);
        if (inc->second.empty()) m_incidence.erase(inc);
    }
}
