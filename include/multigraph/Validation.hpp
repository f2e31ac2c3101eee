#pragma once                 // ensure this header is included only once per translation unit

#include <nlohmann/json.hpp> // bulk input documents

// Admissible shape of a bulk input once it passed validation.
//
// Accepted JSON documents:
//   nodes  null | {"id": {attributes}, ...}          (Mapping)
//               | ["id", ...]                        (Sequence)
//   edges  null | [[["l","r"], {"id": {attributes}}], ...]   (Mapping)
//               | [["l","r"], ...]                   (Sequence)
// Couples cannot be JSON object keys, so the couple -> multiples mapping is
// written as an array of [couple, multiples] pairs.
enum class InputShape {
    None,       // null input: nothing to load
    Mapping,    // nodes: identifier -> attributes; edges: couple -> {identifier -> attributes}
    Sequence,   // nodes: [identifier, ...];       edges: [couple, ...]
};

// Type- and shape-check bulk node input. Checks run fail-fast in a fixed
// order and throw GraphError with a NodesValidation kind. Nothing is mutated.
InputShape validateNodes(const nlohmann::json& nodes);

// Type- and shape-check bulk edge input. Checks run fail-fast in a fixed
// order and throw GraphError with an EdgesValidation kind. With
// rejectEmptyMultiples an empty {identifier -> attributes} object fails with
// WrongLengthOfMultipleEdges instead of standing for one autogenerated edge.
// Duplicated edge identifiers are only detectable while inserting and are not
// checked here.
InputShape validateEdges(const nlohmann::json& edges, bool rejectEmptyMultiples);

// True for a JSON object; its keys are strings and its values arbitrary.
bool isAttributeRecord(const nlohmann::json& v);

// True for a [couple, multiples] entry of the edge mapping form: a
// two-element array whose first element is an array or whose second element
// is an object.
bool isMultiplesEntry(const nlohmann::json& item);
