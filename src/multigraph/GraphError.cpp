// ==========================
// GraphError.cpp
// ==========================
// Kind/family tables and message rendering for GraphError.
// ==========================

#include "multigraph/GraphError.hpp"
#include <sstream>           // std::ostringstream to render messages
#include <string>            // std::string
#include <utility>           // std::move

ErrorFamily familyOf(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::WrongTypeOfNodes:
        case ErrorKind::WrongTypeOfNodeIdentifier:
        case ErrorKind::WrongTypeOfNodeAttributes:
            return ErrorFamily::NodesValidation;
        case ErrorKind::NodeAlreadyExists:
        case ErrorKind::EdgeAlreadyExists:
            return ErrorFamily::ObjectAlreadyExists;
        case ErrorKind::NodeNotFound:
        case ErrorKind::CoupleNotFound:
        case ErrorKind::EdgeNotFound:
            return ErrorFamily::ObjectNotFound;
        default:
            return ErrorFamily::EdgesValidation;
    }
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::WrongTypeOfNodes:                  return "WrongTypeOfNodes";
        case ErrorKind::WrongTypeOfNodeIdentifier:         return "WrongTypeOfNodeIdentifier";
        case ErrorKind::WrongTypeOfNodeAttributes:         return "WrongTypeOfNodeAttributes";
        case ErrorKind::WrongTypeOfEdges:                  return "WrongTypeOfEdges";
        case ErrorKind::WrongTypeOfCouple:                 return "WrongTypeOfCouple";
        case ErrorKind::WrongLengthOfCouple:               return "WrongLengthOfCouple";
        case ErrorKind::WrongTypeOfNodeIdentifierInCouple: return "WrongTypeOfNodeIdentifierInCouple";
        case ErrorKind::WrongTypeOfMultipleEdges:          return "WrongTypeOfMultipleEdges";
        case ErrorKind::WrongLengthOfMultipleEdges:        return "WrongLengthOfMultipleEdges";
        case ErrorKind::WrongTypeOfEdgeIdentifier:         return "WrongTypeOfEdgeIdentifier";
        case ErrorKind::WrongTypeOfEdgeAttributes:         return "WrongTypeOfEdgeAttributes";
        case ErrorKind::DuplicationInEdgeIdentifiers:      return "DuplicationInEdgeIdentifiers";
        case ErrorKind::NodeAlreadyExists:                 return "NodeAlreadyExists";
        case ErrorKind::EdgeAlreadyExists:                 return "EdgeAlreadyExists";
        case ErrorKind::NodeNotFound:                      return "NodeNotFound";
        case ErrorKind::CoupleNotFound:                    return "CoupleNotFound";
        case ErrorKind::EdgeNotFound:                      return "EdgeNotFound";
    }
    return "Unknown";
}

const char* toString(ErrorFamily family) noexcept {
    switch (family) {
        case ErrorFamily::NodesValidation:     return "NodesValidation";
        case ErrorFamily::EdgesValidation:     return "EdgesValidation";
        case ErrorFamily::ObjectAlreadyExists: return "ObjectAlreadyExists";
        case ErrorFamily::ObjectNotFound:      return "ObjectNotFound";
    }
    return "Unknown";
}

// One sentence per kind; context is appended by render().
static const char* describeKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::WrongTypeOfNodes:
            return "nodes must be a JSON object or array";
        case ErrorKind::WrongTypeOfNodeIdentifier:
            return "node identifier must be a string";
        case ErrorKind::WrongTypeOfNodeAttributes:
            return "node attributes must be a JSON object";
        case ErrorKind::WrongTypeOfEdges:
            return "edges must be a JSON array of couples or of [couple, multiples] entries";
        case ErrorKind::WrongTypeOfCouple:
            return "couple must be an array";
        case ErrorKind::WrongLengthOfCouple:
            return "couple must hold exactly 2 node identifiers";
        case ErrorKind::WrongTypeOfNodeIdentifierInCouple:
            return "node identifier in couple must be a string";
        case ErrorKind::WrongTypeOfMultipleEdges:
            return "multiple edges must be a JSON object";
        case ErrorKind::WrongLengthOfMultipleEdges:
            return "multiple edges must hold at least 1 edge";
        case ErrorKind::WrongTypeOfEdgeIdentifier:
            return "edge identifier must be a string";
        case ErrorKind::WrongTypeOfEdgeAttributes:
            return "edge attributes must be a JSON object";
        case ErrorKind::DuplicationInEdgeIdentifiers:
            return "duplicated edge identifier";
        case ErrorKind::NodeAlreadyExists:
            return "node already exists";
        case ErrorKind::EdgeAlreadyExists:
            return "edge already exists";
        case ErrorKind::NodeNotFound:
            return "node not found";
        case ErrorKind::CoupleNotFound:
            return "couple not found";
        case ErrorKind::EdgeNotFound:
            return "edge not found";
    }
    return "unknown error";
}

static std::string render(ErrorKind kind,
                          const std::optional<Couple>& couple,
                          const std::optional<Identifier>& identifier) {
    std::ostringstream oss;
    oss << toString(familyOf(kind)) << ": " << describeKind(kind);
    if (couple) oss << " in couple " << *couple;
    if (identifier) oss << " [" << *identifier << "]";
    return oss.str();
}

GraphError::GraphError(ErrorKind kind,
                       std::optional<Couple> couple,
                       std::optional<Identifier> identifier,
                       std::optional<ErrorKind> cause)
    : std::runtime_error(render(kind, couple, identifier)),
      m_kind(kind),
      m_couple(std::move(couple)),
      m_identifier(std::move(identifier)),
      m_cause(cause) {}
