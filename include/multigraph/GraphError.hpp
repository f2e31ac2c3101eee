#pragma once                 // ensure this header is included only once per translation unit

#include "multigraph/Couple.hpp"      // Couple context
#include "multigraph/Identifier.hpp"  // Identifier context
#include <optional>          // optional context fields
#include <stdexcept>         // std::runtime_error base

// Every failure the graph engine can report. Callers discriminate on the kind,
// never on the message text.
enum class ErrorKind {
    // nodes validation
    WrongTypeOfNodes,
    WrongTypeOfNodeIdentifier,
    WrongTypeOfNodeAttributes,
    // edges validation
    WrongTypeOfEdges,
    WrongTypeOfCouple,
    WrongLengthOfCouple,
    WrongTypeOfNodeIdentifierInCouple,
    WrongTypeOfMultipleEdges,
    WrongLengthOfMultipleEdges,
    WrongTypeOfEdgeIdentifier,        // not raised for JSON input: object keys are strings
    WrongTypeOfEdgeAttributes,
    DuplicationInEdgeIdentifiers,
    // object already exists
    NodeAlreadyExists,
    EdgeAlreadyExists,
    // object not found
    NodeNotFound,
    CoupleNotFound,
    EdgeNotFound,
};

enum class ErrorFamily {
    NodesValidation,
    EdgesValidation,
    ObjectAlreadyExists,
    ObjectNotFound,
};

ErrorFamily familyOf(ErrorKind kind) noexcept;
const char* toString(ErrorKind kind) noexcept;
const char* toString(ErrorFamily family) noexcept;

// Exception thrown by the graph engine. Carries the kind plus whatever
// structured context applies (offending couple, offending identifier and,
// for wrapped conditions, the kind of the underlying failure).
class GraphError : public std::runtime_error {
public:
    explicit GraphError(ErrorKind kind,
                        std::optional<Couple> couple = std::nullopt,
                        std::optional<Identifier> identifier = std::nullopt,
                        std::optional<ErrorKind> cause = std::nullopt);

    ErrorKind kind() const noexcept { return m_kind; }
    ErrorFamily family() const noexcept { return familyOf(m_kind); }
    const std::optional<Couple>& couple() const noexcept { return m_couple; }
    const std::optional<Identifier>& identifier() const noexcept { return m_identifier; }
    const std::optional<ErrorKind>& cause() const noexcept { return m_cause; }

private:
    ErrorKind m_kind;
    std::optional<Couple> m_couple;
    std::optional<Identifier> m_identifier;
    std::optional<ErrorKind> m_cause;
};
