#pragma once                 // ensure this header is included only once per translation unit

#include "multigraph/Couple.hpp"      // Couple
#include "multigraph/Identifier.hpp"  // Identifier
#include <functional>        // std::function for the neighbor sink

// Capability interface that separates the directed and undirected variants.
// The graph engine is written once against these two operations.
struct Topology {
    // Receives (owner, neighbor): `neighbor` belongs in the neighbor set of `owner`
    using NeighborSink = std::function<void(const Identifier& owner, const Identifier& neighbor)>;

    virtual ~Topology() = default;

    // Canonical edge-store key for an endpoint pair
    virtual Couple canonical(const Identifier& left, const Identifier& right) const = 0;

    // Report the neighbor relations a stored couple induces
    virtual void linkNeighbors(const Couple& couple, const NeighborSink& sink) const = 0;
};

// Order = direction; neighbors are successors only.
struct DirectedTopology final : Topology {
    Couple canonical(const Identifier& left, const Identifier& right) const override;
    void linkNeighbors(const Couple& couple, const NeighborSink& sink) const override;
};

// (a, b) and (b, a) share one couple; neighbors are symmetric.
struct UndirectedTopology final : Topology {
    Couple canonical(const Identifier& left, const Identifier& right) const override;
    void linkNeighbors(const Couple& couple, const NeighborSink& sink) const override;
};
