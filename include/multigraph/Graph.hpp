#pragma once                              // ensure this header is included only once per translation unit

#include "multigraph/Attributes.hpp"      // Attributes record for nodes and edges
#include "multigraph/Couple.hpp"          // Couple edge-store key + CoupleHash
#include "multigraph/GraphError.hpp"      // GraphError thrown by every failing operation
#include "multigraph/Identifier.hpp"      // Identifier + generateIdentifier()
#include "multigraph/Topology.hpp"        // directed / undirected capability interface
#include <nlohmann/json.hpp>               // bulk input documents
#include <cstddef>       // defines std::size_t type
#include <iterator>      // std::forward_iterator_tag for the loop range
#include <memory>        // std::shared_ptr to the shared topology
#include <optional>      // optional identifiers and the connectivity marker
#include <set>           // ordered neighbor sets
#include <string>        // used for std::string in label()
#include <unordered_map> // node store, edge store, incidence index
#include <unordered_set> // couples incident to a node
#include <vector>        // selections passed to getSubgraph()

// ==========================
// Attributed multigraph
// ==========================
// This class supports:
// - Directed and undirected graphs (behavior differs only through Topology)
// - Arbitrary node / edge identifiers, generated when omitted
// - Parallel edges between the same endpoints and loops
// - Attribute records on nodes and on every single edge
// - Calculated node attributes (degree, neighbors) with an explicit stale flag
// - Subgraph extraction and structural classification
// ==========================

class Graph {
public:
    // Enumeration to specify whether the graph is Undirected or Directed
    enum class Kind { Undirected, Directed };

    // Options to control behavior of bulk loading and clearing
    struct Options {
        bool cascadeClearNodes    = false; // if true, clearNodes() also clears every edge
        bool rejectEmptyMultiples = false; // if true, {couple: {}} is a validation failure
    };

    // Node record: caller attributes + calculated attributes
    struct Node {
        Attributes attributes;            // caller-owned attributes
        std::size_t degree = 0;           // calculated: parallel edges incident to the node
        std::set<Identifier> neighbors;   // calculated: successors (directed) or adjacent nodes
    };

    // Type aliases for readability
    using Multiples = std::unordered_map<Identifier, Attributes>;            // edge id -> attributes
    using NodeStore = std::unordered_map<Identifier, Node>;                  // node id -> node
    using EdgeStore = std::unordered_map<Couple, Multiples, CoupleHash>;     // couple -> parallel edges

    // Result of describe()
    struct Description {
        Kind kind;                        // variant
        std::size_t nodes;                // number of nodes
        std::size_t couples;              // number of distinct couples (parallel edges count once)
        bool multigraph;                  // some couple has more than one edge
        bool pseudograph;                 // some couple is a loop
        bool complete;                    // every pair of distinct nodes is connected
        std::optional<bool> connected;    // no connectivity check: always empty ("not available")
    };

    // Lazy, restartable view over the loop couples of the current edge store
    class LoopRange {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type        = Couple;
            using difference_type   = std::ptrdiff_t;
            using pointer           = const Couple*;
            using reference         = const Couple&;

            iterator(EdgeStore::const_iterator it, EdgeStore::const_iterator end)
                : m_it(it), m_end(end) { skip(); }

            reference operator*() const { return m_it->first; }
            pointer operator->() const { return &m_it->first; }
            iterator& operator++() { ++m_it; skip(); return *this; }
            iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }
            bool operator==(const iterator& o) const { return m_it == o.m_it; }
            bool operator!=(const iterator& o) const { return m_it != o.m_it; }

        private:
            EdgeStore::const_iterator m_it;   // current position in the edge store
            EdgeStore::const_iterator m_end;  // end of the edge store

            // Advance to the next loop couple (or the end)
            void skip() { while (m_it != m_end && !m_it->first.isLoop()) ++m_it; }
        };

        explicit LoopRange(const EdgeStore& edges) : m_edges(&edges) {}

        iterator begin() const { return iterator(m_edges->begin(), m_edges->end()); }
        iterator end() const { return iterator(m_edges->end(), m_edges->end()); }
        bool empty() const { return begin() == end(); }

    private:
        const EdgeStore* m_edges;         // observed store; invalidated by edge mutations
    };

    // ---- Constructors ----

    // Empty graph with default Options{}
    explicit Graph(Kind kind = Kind::Undirected);

    // Empty graph with explicit Options
    Graph(Kind kind, Options opts);

    // Bulk-loaded graph: validates and inserts nodes, then edges, then runs
    // one degree/neighbor pass. A null document means "nothing to load".
    // Document shapes are listed in Validation.hpp.
    Graph(Kind kind, const nlohmann::json& nodes, const nlohmann::json& edges);
    Graph(Kind kind, const nlohmann::json& nodes, const nlohmann::json& edges, Options opts);

    // ---- Read-only views ----

    // Return whether the graph is Undirected or Directed
    Kind kind() const noexcept { return m_kind; }

    // Convenience: return true if the graph is Directed
    bool directed() const noexcept { return m_kind == Kind::Directed; }

    const Options& options() const noexcept { return m_opts; }
    const NodeStore& nodes() const noexcept { return m_nodes; }
    const EdgeStore& edges() const noexcept { return m_edges; }

    // Return the number of nodes
    std::size_t size() const noexcept { return m_nodes.size(); }

    // Return the number of distinct couples
    std::size_t numberOfCouples() const noexcept { return m_edges.size(); }

    // Return the number of edges, counting every parallel edge
    std::size_t numberOfEdges() const;

    // True when a mutation ran without recalculation since the last pass
    bool calculatedStale() const noexcept { return m_degreeStale || m_neighborsStale; }

    // Canonical couple for an endpoint pair in this variant
    Couple couple(const Identifier& left, const Identifier& right) const;

    bool hasNode(const Identifier& identifier) const;
    bool hasEdge(const Identifier& left, const Identifier& right) const;
    bool hasEdge(const Identifier& left, const Identifier& right, const Identifier& identifier) const;

    // Lookups; throw NodeNotFound / CoupleNotFound / EdgeNotFound
    const Node& node(const Identifier& identifier) const;
    const Multiples& edgesBetween(const Identifier& left, const Identifier& right) const;
    const Attributes& edge(const Identifier& left, const Identifier& right,
                           const Identifier& identifier) const;

    // ---- Nodes ----

    // Add node (identifier generated when omitted). An existing node is a
    // NodeAlreadyExists failure unless `replace`, which overwrites its
    // attributes and keeps its calculated attributes. Never recalculates.
    Identifier addNode(std::optional<Identifier> identifier = std::nullopt,
                       bool replace = false,
                       Attributes attributes = {});

    // Validate and insert bulk node input (mapping or list of identifiers)
    void addNodes(const nlohmann::json& nodes);

    // Remove node and every couple incident to it
    void delNode(const Identifier& identifier, bool recalc = true);

    // Remove all nodes; edges are kept unless Options::cascadeClearNodes
    void clearNodes();

    // ---- Edges ----

    // Add edge left-right (identifier generated when omitted). An existing
    // (couple, identifier) is an EdgeAlreadyExists failure unless `replace`.
    Identifier addEdge(const Identifier& left, const Identifier& right,
                       std::optional<Identifier> identifier = std::nullopt,
                       bool replace = false,
                       bool addMissingNodes = true,
                       bool recalc = true,
                       Attributes attributes = {});

    // Validate and insert bulk edge input (mapping or list of couples)
    void addEdges(const nlohmann::json& edges, bool recalc = true);

    // Remove one edge, or the whole couple when no identifier is given
    void delEdge(const Identifier& left, const Identifier& right,
                 std::optional<Identifier> identifier = std::nullopt,
                 bool recalc = true);

    // Remove all edges and reset calculated attributes of every node
    void clearEdges();

    // ---- Calculated attributes ----

    void calcDegree();
    void clearDegree();
    void calcNeighbors();
    void clearNeighbors();

    // calcDegree() + calcNeighbors()
    void recalculate();

    // ---- Projections ----

    // New graph of the same variant holding every couple whose endpoints are
    // both (fullmatch) or at least one (!fullmatch) in `selected`, plus the
    // endpoints of those couples.
    Graph getSubgraph(const std::vector<Identifier>& selected, bool fullmatch = true) const;

    // Recalculate, then classify the graph
    Description describe();

    // Return a human-readable summary, e.g. "Multi Directed Graph with 3 nodes and 2 edges"
    std::string label();

    // Couples whose endpoints coincide, read from the current edge store.
    // The range points into this graph, so it is not available on temporaries.
    LoopRange findLoops() const & { return LoopRange(m_edges); }
    LoopRange findLoops() const && = delete;

    // Same variant, same nodes (attributes and calculated attributes), same edges
    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    Kind m_kind;                                 // directed or undirected
    std::shared_ptr<const Topology> m_topology;  // canonicalization + neighbor rule for m_kind
    Options m_opts;                              // options (clear cascade, empty multiples)
    NodeStore m_nodes;                           // node store
    EdgeStore m_edges;                           // edge store
    std::unordered_map<Identifier, std::unordered_set<Couple, CoupleHash>> m_incidence; // node -> couples touching it
    bool m_degreeStale = false;                  // degree not recalculated since last mutation
    bool m_neighborsStale = false;               // neighbors not recalculated since last mutation

    // Helper: mark calculated attributes as out of date
    void markStale() noexcept { m_degreeStale = m_neighborsStale = true; }

    // Helper: insert an empty couple or return the existing one
    Multiples& touchCouple(const Couple& c);

    // Helper: drop a couple and its incidence entries
    void eraseCouple(EdgeStore::iterator it);

    // Helpers: structural predicates
    bool isMulti() const;
    bool isPseudo() const;
    bool isComplete() const;
};

inline bool operator==(const Graph::Node& a, const Graph::Node& b) {
    return a.attributes == b.attributes && a.degree == b.degree && a.neighbors == b.neighbors;
}

inline bool operator!=(const Graph::Node& a, const Graph::Node& b) {
    return !(a == b);
}

// ==========================
// Variants
// ==========================
// Both variants are the same engine bound to a different Topology. They add
// no state and no virtual functions: kind() alone identifies the variant, and
// the plain Graph returned by getSubgraph() / loadSnapshot() keeps it.
// ==========================

class DirectedGraph final : public Graph {
public:
    DirectedGraph() : Graph(Kind::Directed) {}
    explicit DirectedGraph(Options opts) : Graph(Kind::Directed, opts) {}
    DirectedGraph(const nlohmann::json& nodes, const nlohmann::json& edges) : Graph(Kind::Directed, nodes, edges) {}
    DirectedGraph(const nlohmann::json& nodes, const nlohmann::json& edges, Options opts)
        : Graph(Kind::Directed, nodes, edges, opts) {}
};

class UndirectedGraph final : public Graph {
public:
    UndirectedGraph() : Graph(Kind::Undirected) {}
    explicit UndirectedGraph(Options opts) : Graph(Kind::Undirected, opts) {}
    UndirectedGraph(const nlohmann::json& nodes, const nlohmann::json& edges) : Graph(Kind::Undirected, nodes, edges) {}
    UndirectedGraph(const nlohmann::json& nodes, const nlohmann::json& edges, Options opts)
        : Graph(Kind::Undirected, nodes, edges, opts) {}
};
