#include "multigraph/Topology.hpp"
#include <algorithm>         // std::minmax

Couple DirectedTopology::canonical(const Identifier& left, const Identifier& right) const {
    return Couple{left, right};
}

void DirectedTopology::linkNeighbors(const Couple& couple, const NeighborSink& sink) const {
    sink(couple.left, couple.right);                       // left -> right only
}

Couple UndirectedTopology::canonical(const Identifier& left, const Identifier& right) const {
    auto k = std::minmax(left, right);                     // order-independent key
    return Couple{k.first, k.second};
}

void UndirectedTopology::linkNeighbors(const Couple& couple, const NeighborSink& sink) const {
    sink(couple.left, couple.right);
    if (!couple.isLoop()) sink(couple.right, couple.left); // symmetric; a loop links once
}
