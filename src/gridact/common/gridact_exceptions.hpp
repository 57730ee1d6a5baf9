/**
 * @file gridact_exceptions.hpp
 */
#pragma once
#include "gridact/common/common.hpp"

namespace gridact
{

// ============================================================================
// Schema errors
// ============================================================================

/**
 * @brief Error codes for grid schema construction and queries.
 */
enum class SchemaErrorCode
{
    IncorrectNumberOfElements,
    IncorrectNumberOfLoads,
    IncorrectNumberOfGenerators,
    IncorrectNumberOfLines,
    IncorrectNumberOfStorages,
    IncorrectNumberOfSubstation,
    IncorrectNumberOfShunts,
    IncorrectPositionOfLoads,
    IncorrectPositionOfGenerators,
    IncorrectPositionOfLines,
    IncorrectPositionOfStorages,
    InvalidTopologyPositions,
    EmptySubstation,
    InvalidName,
    InvalidDispatchData,
    InvalidStorageData,
    OutOfRange,
    NotFound,
    InvalidDocument
};

/**
 * @brief Exception class for grid schema errors.
 *
 * @details
 * `SchemaError` is thrown while a `GridSchema` is built from a
 * `GridDescription` that violates one of the structural invariants (element
 * counts, substation membership, topology bijection, static data ranges), and
 * by the few schema queries that take an element id or a substation id.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class SchemaError : public std::exception
{
public:
    SchemaError(SchemaErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    SchemaErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    SchemaErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Illegal action (malformed accessor input)
// ============================================================================

/**
 * @brief Error codes for malformed action modifications.
 */
enum class IllegalActionCode
{
    WrongInputShape,       ///< The input variant is not accepted by this accessor.
    OutOfRange,            ///< An element id is outside `[0, n_elements)`.
    UnknownElementName,    ///< A name is not in the schema's name table.
    ValueOutOfDomain,      ///< A bus or status value is outside its domain.
    UnsupportedAttribute,  ///< The action profile does not carry this attribute.
    IncompatibleGrid,      ///< Two actions refer to different grids.
    InvalidQuery           ///< A per-element query is malformed.
};

/**
 * @brief Exception raised synchronously by a mutation that cannot be applied.
 *
 * @details
 * Accessors validate their whole input against a working copy before it is
 * committed, so when `IllegalAction` escapes a setter the action is
 * observably unchanged.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class IllegalAction : public std::exception
{
public:
    /**
     * @brief Construct an IllegalAction.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    IllegalAction(IllegalActionCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    IllegalActionCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    IllegalActionCode m_code;
    std::string m_message;
};

// ============================================================================
// Ambiguous action (semantic violation found by the checker)
// ============================================================================

/**
 * @brief Error codes for semantic violations reported by the ambiguity checker.
 */
enum class AmbiguityCode
{
    InvalidLineStatus,
    IncorrectNumberOfLoads,
    IncorrectNumberOfGenerators,
    IncorrectNumberOfLines,
    IncorrectNumberOfElements,
    IncorrectNumberOfStorages,
    IncorrectNumberOfShunts,
    RedispatchingNotAvailable,
    InvalidRedispatching,
    InvalidStorage,
    InvalidBusStatus,
    InvalidShunt,
    MalformedUpdate
};

/// Name of an ambiguity code, for messages and reports.
inline const char* to_string(AmbiguityCode code) noexcept
{
    switch (code)
    {
    case AmbiguityCode::InvalidLineStatus:
        return "InvalidLineStatus";
    case AmbiguityCode::IncorrectNumberOfLoads:
        return "IncorrectNumberOfLoads";
    case AmbiguityCode::IncorrectNumberOfGenerators:
        return "IncorrectNumberOfGenerators";
    case AmbiguityCode::IncorrectNumberOfLines:
        return "IncorrectNumberOfLines";
    case AmbiguityCode::IncorrectNumberOfElements:
        return "IncorrectNumberOfElements";
    case AmbiguityCode::IncorrectNumberOfStorages:
        return "IncorrectNumberOfStorages";
    case AmbiguityCode::IncorrectNumberOfShunts:
        return "IncorrectNumberOfShunts";
    case AmbiguityCode::RedispatchingNotAvailable:
        return "RedispatchingNotAvailable";
    case AmbiguityCode::InvalidRedispatching:
        return "InvalidRedispatching";
    case AmbiguityCode::InvalidStorage:
        return "InvalidStorage";
    case AmbiguityCode::InvalidBusStatus:
        return "InvalidBusStatus";
    case AmbiguityCode::InvalidShunt:
        return "InvalidShunt";
    case AmbiguityCode::MalformedUpdate:
        return "MalformedUpdate";
    }
    return "Unknown";
}

/**
 * @brief Exception describing why an action is ambiguous.
 *
 * @details
 * Raised by `AmbiguityChecker::check()` and by the few operations that need
 * a well-formed action to proceed (flat encoding, malformed update documents).
 * The code identifies the specific family of violation; the message names the
 * offending elements.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class AmbiguousAction : public std::exception
{
public:
    AmbiguousAction(AmbiguityCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    AmbiguityCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    AmbiguityCode m_code;
    std::string m_message;
};

} // namespace gridact
