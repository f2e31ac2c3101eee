#pragma once                 // ensure this header is included only once per translation unit

#include "multigraph/Identifier.hpp"  // Identifier
#include <cstddef>           // std::size_t
#include <functional>        // std::hash
#include <ostream>           // std::ostream for operator<<
#include <tuple>             // std::tie for ordering

// Canonical pair of edge endpoints, used as the edge-store key.
// The directed variant keeps (left, right) as given; the undirected variant
// stores (min, max) so that both orders map to the same couple.
struct Couple {
    Identifier left;         // left (source) endpoint
    Identifier right;        // right (target) endpoint

    // A loop connects a node to itself
    bool isLoop() const noexcept { return left == right; }
};

inline bool operator==(const Couple& a, const Couple& b) {
    return a.left == b.left && a.right == b.right;
}

inline bool operator!=(const Couple& a, const Couple& b) {
    return !(a == b);
}

inline bool operator<(const Couple& a, const Couple& b) {
    return std::tie(a.left, a.right) < std::tie(b.left, b.right);
}

// Print as "(left, right)"
inline std::ostream& operator<<(std::ostream& os, const Couple& c) {
    return os << '(' << c.left << ", " << c.right << ')';
}

// Hash functor so Couple can key unordered containers
struct CoupleHash {
    std::size_t operator()(const Couple& c) const noexcept {
        const std::size_t h1 = std::hash<Identifier>{}(c.left);
        const std::size_t h2 = std::hash<Identifier>{}(c.right);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2)); // order-sensitive mix
    }
};
