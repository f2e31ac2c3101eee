// ==========================
// tests/test_graph.cpp
// ==========================
// Unit tests for the graph engine: node / edge mutation, calculated
// attributes, classification, loops, subgraphs and equality.
// Uses the doctest framework.
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"         // doctest framework header

// Include project headers
#include "multigraph/Graph.hpp"   // Graph, DirectedGraph, UndirectedGraph

#include <nlohmann/json.hpp> // bulk input documents

#include <cstdint>           // std::int64_t attribute values
#include <random>            // std::mt19937 for the degree property test
#include <string>            // std::string
#include <type_traits>       // std::false_type, std::void_t
#include <utility>           // std::declval
#include <vector>            // std::vector

using nlohmann::json;

// Helper: the directed X/Y/Z multigraph used by several tests
static DirectedGraph xyz() {
    return DirectedGraph(
        json::parse(R"(["X", "Y", "Z"])"),
        json::parse(R"([ [["X", "Y"], {"e1": {}, "e2": {}}],
                         [["Y", "Z"], {"e3": {}}] ])"));
}

// Helper: detects whether findLoops() can be called on an expression of type G
template <typename G, typename = void>
struct canFindLoops : std::false_type {};
template <typename G>
struct canFindLoops<G, std::void_t<decltype(std::declval<G>().findLoops())>> : std::true_type {};

// ---------------------------
// Test 1: directed X/Y/Z scenario
// ---------------------------
TEST_CASE("Directed X/Y/Z: degree, neighbors and classification") {
    DirectedGraph g = xyz();

    CHECK(g.node("X").degree == 2);                       // two parallel edges X->Y
    CHECK(g.node("Y").degree == 3);                       // in 2 + out 1
    CHECK(g.node("Z").degree == 1);                       // in 1
    CHECK(g.node("X").neighbors == std::set<Identifier>{"Y"});  // successors only
    CHECK(g.node("Y").neighbors == std::set<Identifier>{"Z"});
    CHECK(g.node("Z").neighbors.empty());

    auto d = g.describe();
    CHECK(d.kind == Graph::Kind::Directed);
    CHECK(d.nodes == 3);
    CHECK(d.couples == 2);                                // parallel edges count once
    CHECK(d.multigraph);
    CHECK_FALSE(d.pseudograph);
    CHECK_FALSE(d.complete);
    CHECK_FALSE(d.connected.has_value());                 // not available
    CHECK(g.numberOfEdges() == 3);
}

// ---------------------------
// Test 2: generated identifiers
// ---------------------------
TEST_CASE("addNode without identifier generates a fresh one") {
    UndirectedGraph g;
    Identifier a = g.addNode();                           // auto id
    Identifier b = g.addNode();                           // another auto id
    CHECK(a.size() == 32);                                // 128 bits as hex
    CHECK(a != b);
    CHECK(g.hasNode(a));
    CHECK(g.hasNode(b));

    Identifier e = g.addEdge(a, b);                       // auto edge id
    CHECK(e.size() == 32);
    CHECK(g.hasEdge(a, b, e));
}

// ---------------------------
// Test 3: duplicate node
// ---------------------------
TEST_CASE("addNode on an existing node without replace throws NodeAlreadyExists") {
    UndirectedGraph g;
    g.addNode("A", false, {{"age", std::int64_t{19}}});

    try {
        g.addNode("A");
        FAIL("expected NodeAlreadyExists");
    } catch (const GraphError& err) {
        CHECK(err.kind() == ErrorKind::NodeAlreadyExists);
        CHECK(err.family() == ErrorFamily::ObjectAlreadyExists);
        REQUIRE(err.identifier().has_value());
        CHECK(*err.identifier() == "A");
    }
    CHECK(g.size() == 1);                                 // graph untouched
    CHECK(g.node("A").attributes.at("age") == 19);
}

// ---------------------------
// Test 4: replace keeps calculated attributes
// ---------------------------
TEST_CASE("addNode with replace overwrites attributes and keeps degree/neighbors") {
    UndirectedGraph g;
    g.addNode("A", false, {{"age", std::int64_t{19}}, {"name", std::string("Ann")}});
    g.addEdge("A", "B", "e1");                            // recalculates: degree(A) = 1

    g.addNode("A", true, {{"city", std::string("Oslo")}});
    const auto& a = g.node("A");
    CHECK(a.attributes.size() == 1);                      // overwritten, not merged
    CHECK(a.attributes.count("age") == 0);
    CHECK(a.attributes.at("city") == "Oslo");
    CHECK(a.degree == 1);                                 // preserved
    CHECK(a.neighbors == std::set<Identifier>{"B"});      // preserved
}

// ---------------------------
// Test 5: add then delete restores node count
// ---------------------------
TEST_CASE("addNode followed by delNode restores the node count") {
    DirectedGraph g = xyz();
    const std::size_t before = g.size();
    Identifier id = g.addNode();
    CHECK(g.size() == before + 1);
    g.delNode(id);
    CHECK(g.size() == before);
    CHECK_FALSE(g.calculatedStale());
}

// ---------------------------
// Test 6: delNode cascades to every incident couple
// ---------------------------
TEST_CASE("delNode removes couples on both endpoint positions") {
    DirectedGraph g = xyz();
    g.addEdge("Z", "Z", "loop");                          // loop on Z
    g.delNode("Y");                                       // Y is right of (X,Y) and left of (Y,Z)

    CHECK_FALSE(g.hasNode("Y"));
    CHECK_FALSE(g.hasEdge("X", "Y"));
    CHECK_FALSE(g.hasEdge("Y", "Z"));
    CHECK(g.hasEdge("Z", "Z"));                           // unrelated couple kept
    CHECK(g.node("X").degree == 0);
    CHECK(g.node("X").neighbors.empty());
    CHECK(g.node("Z").degree == 2);                       // loop counts twice
}

// ---------------------------
// Test 7: delNode on a missing node
// ---------------------------
TEST_CASE("delNode on a missing node throws NodeNotFound") {
    DirectedGraph g = xyz();
    try {
        g.delNode("nope");
        FAIL("expected NodeNotFound");
    } catch (const GraphError& err) {
        CHECK(err.kind() == ErrorKind::NodeNotFound);
        CHECK(err.family() == ErrorFamily::ObjectNotFound);
    }
    CHECK(g == xyz());                                    // nothing changed
}

// ---------------------------
// Test 8: deferred recalculation
// ---------------------------
TEST_CASE("recalc=false leaves calculated attributes stale until recalculate()") {
    UndirectedGraph g;
    g.addEdge("A", "B", "e1");
    CHECK_FALSE(g.calculatedStale());

    g.addEdge("A", "C", "e2", false, true, false);        // batch mode
    CHECK(g.calculatedStale());
    CHECK(g.node("A").degree == 1);                       // stale value

    g.recalculate();
    CHECK_FALSE(g.calculatedStale());
    CHECK(g.node("A").degree == 2);
    CHECK(g.node("C").neighbors == std::set<Identifier>{"A"});

    g.delNode("B", false);
    CHECK(g.calculatedStale());
    g.calcDegree();
    CHECK(g.calculatedStale());                           // neighbors still pending
    g.calcNeighbors();
    CHECK_FALSE(g.calculatedStale());
    CHECK(g.node("A").neighbors == std::set<Identifier>{"C"});
}

// ---------------------------
// Test 9: clearNodes keeps edges unless configured to cascade
// ---------------------------
TEST_CASE("clearNodes does not cascade by default") {
    UndirectedGraph g;
    g.addEdge("A", "B", "e1");
    g.clearNodes();
    CHECK(g.size() == 0);
    CHECK(g.numberOfCouples() == 1);                      // dangling couple kept

    g.addNode("A");                                       // endpoint comes back
    g.recalculate();
    CHECK(g.node("A").degree == 1);
    CHECK(g.node("A").neighbors == std::set<Identifier>{"B"});
}

TEST_CASE("clearNodes cascades when Options::cascadeClearNodes is set") {
    Graph::Options o; o.cascadeClearNodes = true;
    UndirectedGraph g(o);
    g.addEdge("A", "B", "e1");
    g.clearNodes();
    CHECK(g.size() == 0);
    CHECK(g.numberOfCouples() == 0);
}

// ---------------------------
// Test 10: duplicate edge and replace
// ---------------------------
TEST_CASE("addEdge on an existing (couple, identifier) throws EdgeAlreadyExists") {
    DirectedGraph g;
    g.addEdge("A", "B", "e1", false, true, true, {{"amount", std::int64_t{1400}}});

    try {
        g.addEdge("A", "B", "e1");
        FAIL("expected EdgeAlreadyExists");
    } catch (const GraphError& err) {
        CHECK(err.kind() == ErrorKind::EdgeAlreadyExists);
        REQUIRE(err.couple().has_value());
        CHECK(*err.couple() == Couple{"A", "B"});
        CHECK(*err.identifier() == "e1");
    }
    CHECK(g.edge("A", "B", "e1").at("amount") == 1400);

    g.addEdge("B", "A", "e1");                            // other direction is another couple
    CHECK(g.numberOfCouples() == 2);

    g.addEdge("A", "B", "e1", true, true, true, {{"amount", std::int64_t{2700}}});
    CHECK(g.edgesBetween("A", "B").size() == 1);
    CHECK(g.edge("A", "B", "e1").at("amount") == 2700);
}

// ---------------------------
// Test 11: addMissingNodes
// ---------------------------
TEST_CASE("addEdge creates missing endpoints unless suppressed") {
    UndirectedGraph g;
    g.addNode("A", false, {{"keep", true}});
    g.addEdge("A", "B", "e1");
    CHECK(g.hasNode("B"));
    CHECK(g.node("A").attributes.at("keep") == true); // existing endpoint untouched

    g.addEdge("C", "D", "e2", false, false);
    CHECK(g.hasEdge("C", "D"));
    CHECK_FALSE(g.hasNode("C"));
    CHECK_FALSE(g.hasNode("D"));
}

// ---------------------------
// Test 12: delEdge
// ---------------------------
TEST_CASE("delEdge removes one identifier or the whole couple") {
    DirectedGraph g = xyz();

    g.delEdge("X", "Y", std::string("e1"));               // one of two parallel edges
    CHECK(g.hasEdge("X", "Y"));
    CHECK(g.node("X").degree == 1);

    g.delEdge("X", "Y", std::string("e2"));               // last edge empties the couple
    CHECK_FALSE(g.hasEdge("X", "Y"));
    CHECK(g.node("X").neighbors.empty());

    g.addEdge("Y", "Z", "e4");
    g.delEdge("Y", "Z");                                  // whole couple at once
    CHECK(g.numberOfCouples() == 0);
    CHECK(g.node("Y").degree == 0);
}

TEST_CASE("delEdge on missing couple / identifier throws and changes nothing") {
    DirectedGraph g = xyz();

    try {
        g.delEdge("Z", "Y");                              // only (Y,Z) exists in a directed graph
        FAIL("expected CoupleNotFound");
    } catch (const GraphError& err) {
        CHECK(err.kind() == ErrorKind::CoupleNotFound);
        CHECK(*err.couple() == Couple{"Z", "Y"});
    }

    try {
        g.delEdge("X", "Y", std::string("e9"));
        FAIL("expected EdgeNotFound");
    } catch (const GraphError& err) {
        CHECK(err.kind() == ErrorKind::EdgeNotFound);
        CHECK(*err.identifier() == "e9");
    }
    CHECK(g == xyz());
}

// ---------------------------
// Test 13: clearEdges keeps the graph consistent
// ---------------------------
TEST_CASE("clearEdges zeroes degree and neighbors of every node") {
    DirectedGraph g = xyz();
    g.clearEdges();
    CHECK(g.numberOfCouples() == 0);
    CHECK(g.size() == 3);
    for (const auto& entry : g.nodes()) {
        CHECK(entry.second.degree == 0);
        CHECK(entry.second.neighbors.empty());
    }
    CHECK_FALSE(g.calculatedStale());
}

// ---------------------------
// Test 14: undirected couples are order independent
// ---------------------------
TEST_CASE("Undirected: (B,A) resolves to the same stored entry as (A,B)") {
    UndirectedGraph g;
    g.addEdge("B", "A", "e1", false, true, true, {{"w", 1.5}});

    CHECK(g.couple("A", "B") == g.couple("B", "A"));
    CHECK(&g.edgesBetween("A", "B") == &g.edgesBetween("B", "A"));
    CHECK(g.edge("A", "B", "e1").at("w") == 1.5);
    CHECK_THROWS_AS(g.addEdge("A", "B", "e1"), GraphError);   // same edge from the other side
    CHECK(g.numberOfCouples() == 1);
}

// ---------------------------
// Test 15: undirected neighbors and loops
// ---------------------------
TEST_CASE("Undirected: symmetric neighbors; a loop counts twice in degree") {
    UndirectedGraph g;
    g.addEdge("A", "B", "e1");
    g.addEdge("A", "B", "e2");
    g.addEdge("B", "C", "e3");
    g.addEdge("C", "C", "e4");

    CHECK(g.node("A").neighbors == std::set<Identifier>{"B"});
    CHECK(g.node("B").neighbors == std::set<Identifier>{"A", "C"});
    CHECK(g.node("C").neighbors == std::set<Identifier>{"B", "C"});
    CHECK(g.node("A").degree == 2);
    CHECK(g.node("B").degree == 3);
    CHECK(g.node("C").degree == 3);                       // 1 + loop twice
}

// ---------------------------
// Test 16: loops and pseudograph
// ---------------------------
TEST_CASE("A single loop makes a pseudograph and findLoops() yields it") {
    DirectedGraph g = xyz();
    CHECK(g.findLoops().empty());
    CHECK_FALSE(g.describe().pseudograph);

    g.addEdge("Z", "Z", "l1");
    CHECK(g.describe().pseudograph);

    std::vector<Couple> loops(g.findLoops().begin(), g.findLoops().end());
    REQUIRE(loops.size() == 1);
    CHECK(loops[0] == Couple{"Z", "Z"});

    auto range = g.findLoops();                           // restartable
    std::size_t first = 0, second = 0;
    for (const Couple& c : range) { (void)c; ++first; }
    for (const Couple& c : range) { (void)c; ++second; }
    CHECK(first == 1);
    CHECK(second == 1);

    g.delEdge("Z", "Z");
    CHECK(g.findLoops().empty());                         // recomputed from current state
}

// ---------------------------
// Test 17: multigraph detection
// ---------------------------
TEST_CASE("Parallel edges make a multigraph") {
    UndirectedGraph g;
    g.addEdge("A", "B");
    CHECK_FALSE(g.describe().multigraph);
    g.addEdge("B", "A");                                  // second edge, same couple
    CHECK(g.describe().multigraph);
}

// ---------------------------
// Test 18: complete graph detection
// ---------------------------
TEST_CASE("Complete graph detection ignores loops and direction") {
    UndirectedGraph u;
    u.addEdge("A", "B"); u.addEdge("B", "C");
    CHECK_FALSE(u.describe().complete);
    u.addEdge("C", "A");
    CHECK(u.describe().complete);
    u.addEdge("A", "A");                                  // loop does not break completeness
    CHECK(u.describe().complete);
    u.addNode("D");
    CHECK_FALSE(u.describe().complete);

    DirectedGraph d;
    d.addEdge("A", "B"); d.addEdge("B", "A");             // one pair in both directions
    d.addEdge("B", "C"); d.addEdge("C", "A");
    CHECK(d.describe().complete);
}

// ---------------------------
// Test 19: subgraph extraction
// ---------------------------
TEST_CASE("getSubgraph with fullmatch keeps couples inside the selection") {
    UndirectedGraph g;
    g.addNode("A", false, {{"label", std::string("first")}});
    g.addEdge("A", "B", "e1", false, true, true, {{"w", std::int64_t{1}}});
    g.addEdge("A", "B", "e2");
    g.addEdge("B", "C", "e3");
    g.addEdge("C", "D", "e4");
    g.addNode("E");

    Graph sub = g.getSubgraph({"A", "B", "E", "unknown"});
    CHECK(sub.kind() == Graph::Kind::Undirected);
    CHECK(sub.size() == 2);                               // E has no kept couple
    CHECK_FALSE(sub.hasNode("E"));
    CHECK(sub.numberOfCouples() == 1);
    CHECK(sub.edgesBetween("B", "A").size() == 2);        // all parallel edges
    CHECK(sub.edge("A", "B", "e1").at("w") == 1);
    CHECK(sub.node("A").attributes.at("label") == "first");
    CHECK(sub.node("B").degree == 2);                     // recalculated: B-C is gone
    CHECK_FALSE(sub.calculatedStale());

    sub.addNode("A", true, {});                           // copies, not shared
    CHECK(g.node("A").attributes.count("label") == 1);
}

TEST_CASE("getSubgraph without fullmatch keeps couples touching the selection") {
    DirectedGraph g = xyz();
    Graph sub = g.getSubgraph({"Z"}, false);
    CHECK(sub.kind() == Graph::Kind::Directed);
    CHECK(sub.size() == 2);                               // Y pulled in by (Y,Z)
    CHECK(sub.hasEdge("Y", "Z", "e3"));
    CHECK_FALSE(sub.hasEdge("X", "Y"));
    CHECK(sub.node("Y").neighbors == std::set<Identifier>{"Z"});
}

TEST_CASE("getSubgraph over nodes without edges among themselves is empty") {
    DirectedGraph g = xyz();
    Graph sub = g.getSubgraph({"X", "Z"});
    CHECK(sub.size() == 0);
    CHECK(sub.numberOfCouples() == 0);
}

// ---------------------------
// Test 20: equality
// ---------------------------
TEST_CASE("Equality compares variant, nodes and edges") {
    DirectedGraph a = xyz();
    DirectedGraph b = xyz();
    CHECK(a == b);

    b.addNode("X", true, {{"tag", std::int64_t{1}}});
    CHECK(a != b);                                        // attribute differs

    UndirectedGraph u;
    DirectedGraph d;
    CHECK(u != d);                                        // both empty, different variants
}

// ---------------------------
// Test 21: label
// ---------------------------
TEST_CASE("label() summarizes classification and counts") {
    DirectedGraph g = xyz();
    CHECK(g.label() == "Multi Directed Graph with 3 nodes and 2 edges");

    UndirectedGraph u;
    u.addEdge("A", "B"); u.addEdge("B", "C"); u.addEdge("C", "A"); u.addEdge("A", "A");
    CHECK(u.label() == "Complete Pseudo Undirected Graph with 3 nodes and 4 edges");

    UndirectedGraph two;
    two.addNode("A"); two.addNode("B");
    CHECK(two.label() == "Undirected Graph with 2 nodes and 0 edges");

    UndirectedGraph empty;
    CHECK(empty.label() == "Complete Undirected Graph with 0 nodes and 0 edges");

    DirectedGraph one;
    one.addEdge("A", "B");
    one.delNode("B");                                     // couple goes with the node
    CHECK(one.label() == "Complete Directed Graph with 1 node and 0 edges");
    one.addEdge("A", "A");
    CHECK(one.label() == "Complete Pseudo Directed Graph with 1 node and 1 edge");
}

// ---------------------------
// Test 22: degree invariant on a random multigraph
// ---------------------------
TEST_CASE("After recalculation degree equals the parallel edges over incident couples") {
    for (Graph::Kind kind : {Graph::Kind::Directed, Graph::Kind::Undirected}) {
        Graph g(kind);
        std::mt19937 rng(7);                              // fixed seed
        std::uniform_int_distribution<int> pick(0, 5);
        g.addEdge("n3", "n1", std::nullopt, false, true, false); // n3 exists for delNode below

        for (int i = 0; i < 60; ++i) {                    // batch of random edges, loops included
            int u = pick(rng), v = pick(rng);
            g.addEdge("n" + std::to_string(u), "n" + std::to_string(v),
                      std::nullopt, false, true, false);
        }
        g.delNode("n3", false);
        g.recalculate();

        for (const auto& entry : g.nodes()) {
            std::size_t expected = 0;
            for (const auto& e : g.edges()) {
                if (e.first.left == entry.first) expected += e.second.size();
                if (e.first.right == entry.first) expected += e.second.size();
            }
            CHECK(entry.second.degree == expected);
        }
    }
}

// ---------------------------
// Test 23: findLoops() on named graphs only
// ---------------------------
TEST_CASE("findLoops() is callable on named graphs and rejected on temporaries") {
    static_assert(canFindLoops<const Graph&>::value, "lvalue graphs expose their loops");
    static_assert(canFindLoops<Graph&>::value, "lvalue graphs expose their loops");
    static_assert(!canFindLoops<Graph>::value, "a loop range over a temporary would dangle");
    static_assert(!canFindLoops<const Graph&&>::value, "a loop range over a temporary would dangle");

    DirectedGraph g = xyz();
    g.addEdge("X", "X", "lx");
    g.addEdge("Z", "Z", "lz");

    Graph sub = g.getSubgraph({"X", "Y"});                // keep the subgraph alive by name
    std::vector<Couple> loops;
    for (const Couple& c : sub.findLoops()) loops.push_back(c);
    REQUIRE(loops.size() == 1);
    CHECK(loops[0] == Couple{"X", "X"});
}

// ---------------------------
// Test 24: variant survives projections
// ---------------------------
TEST_CASE("getSubgraph returns a Graph whose kind() names the source variant") {
    DirectedGraph d = xyz();
    Graph dsub = d.getSubgraph({"X", "Y"});
    CHECK(dsub.kind() == Graph::Kind::Directed);
    CHECK(dsub.directed());
    CHECK(dsub.hasEdge("X", "Y"));
    CHECK_FALSE(dsub.hasEdge("Y", "X"));                  // still ordered couples

    UndirectedGraph u;
    u.addEdge("B", "A", "e1");
    Graph usub = u.getSubgraph({"A", "B"});
    CHECK(usub.kind() == Graph::Kind::Undirected);
    CHECK(usub.hasEdge("A", "B", "e1"));
    CHECK(usub.hasEdge("B", "A", "e1"));
}
