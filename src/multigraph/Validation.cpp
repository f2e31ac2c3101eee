// ==========================
// Validation.cpp
// ==========================
// Pre-scan of bulk node / edge input. Each check walks the whole input
// before the next one starts, so the first failing phase decides the
// reported kind regardless of where in the input the problem sits:
//   container type -> key shape -> key type -> nested value type
//   -> nested cardinality
// JSON object keys are always strings, so identifiers given as object keys
// never fail a type check; identifiers given as array items can.
// ==========================

#include "multigraph/Validation.hpp"
#include "multigraph/GraphError.hpp"   // GraphError, ErrorKind

using nlohmann::json;

bool isAttributeRecord(const json& v) {
    return v.is_object();
}

bool isMultiplesEntry(const json& item) {
    return item.is_array() && item.size() == 2 &&
           (item[0].is_array() || item[1].is_object());
}

// ---------------------------
// Nodes
// ---------------------------

static void checkNodeIdentifierType(const json& nodes) {
    for (const auto& item : nodes)
        if (!item.is_string())
            throw GraphError(ErrorKind::WrongTypeOfNodeIdentifier);
}

static void checkNodeAttributesType(const json& nodes) {
    for (const auto& e : nodes.items())
        if (!isAttributeRecord(e.value()))
            throw GraphError(ErrorKind::WrongTypeOfNodeAttributes, std::nullopt, e.key());
}

InputShape validateNodes(const json& nodes) {
    if (nodes.is_null()) return InputShape::None;

    if (nodes.is_object()) {
        checkNodeAttributesType(nodes);
        return InputShape::Mapping;
    }
    if (nodes.is_array()) {
        checkNodeIdentifierType(nodes);
        return InputShape::Sequence;
    }
    throw GraphError(ErrorKind::WrongTypeOfNodes);
}

// ---------------------------
// Edges
// ---------------------------

// Couples are item[0] of every mapping entry, or the items of a sequence.
template <typename Fn>
static void forEachCouple(const json& edges, bool mapping, Fn&& fn) {
    for (const auto& item : edges) fn(mapping ? item[0] : item);
}

static Couple coupleOf(const json& couple) {
    return Couple{couple[0].get<Identifier>(), couple[1].get<Identifier>()};
}

static void checkEntryShape(const json& edges) {
    for (const auto& item : edges)
        if (!item.is_array() || item.size() != 2)
            throw GraphError(ErrorKind::WrongTypeOfEdges);
}

static void checkCoupleType(const json& edges, bool mapping) {
    forEachCouple(edges, mapping, [](const json& c) {
        if (!c.is_array()) throw GraphError(ErrorKind::WrongTypeOfCouple);
    });
}

static void checkCoupleLength(const json& edges, bool mapping) {
    forEachCouple(edges, mapping, [](const json& c) {
        if (c.size() != 2) throw GraphError(ErrorKind::WrongLengthOfCouple);
    });
}

static void checkNodeIdentifierInCoupleType(const json& edges, bool mapping) {
    forEachCouple(edges, mapping, [](const json& c) {
        if (!c[0].is_string() || !c[1].is_string())
            throw GraphError(ErrorKind::WrongTypeOfNodeIdentifierInCouple);
    });
}

static void checkMultiplesType(const json& edges) {
    for (const auto& item : edges)
        if (!item[1].is_object())
            throw GraphError(ErrorKind::WrongTypeOfMultipleEdges, coupleOf(item[0]));
}

static void checkMultiplesLength(const json& edges) {
    for (const auto& item : edges)
        if (item[1].empty())
            throw GraphError(ErrorKind::WrongLengthOfMultipleEdges, coupleOf(item[0]));
}

static void checkEdgeAttributesType(const json& edges) {
    for (const auto& item : edges)
        for (const auto& multiple : item[1].items())
            if (!isAttributeRecord(multiple.value()))
                throw GraphError(ErrorKind::WrongTypeOfEdgeAttributes,
                                 coupleOf(item[0]), multiple.key());
}

InputShape validateEdges(const json& edges, bool rejectEmptyMultiples) {
    if (edges.is_null()) return InputShape::None;
    if (!edges.is_array()) throw GraphError(ErrorKind::WrongTypeOfEdges);

    if (!edges.empty() && isMultiplesEntry(edges[0])) {
        checkEntryShape(edges);
        checkCoupleType(edges, true);
        checkCoupleLength(edges, true);
        checkNodeIdentifierInCoupleType(edges, true);
        checkMultiplesType(edges);
        checkEdgeAttributesType(edges);
        if (rejectEmptyMultiples) checkMultiplesLength(edges);
        return InputShape::Mapping;
    }

    checkCoupleType(edges, false);
    checkCoupleLength(edges, false);
    checkNodeIdentifierInCoupleType(edges, false);
    return InputShape::Sequence;
}
