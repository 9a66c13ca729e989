// errors.hpp — exception taxonomy for contract violations
#pragma once

#include <stdexcept>
#include <string>

namespace abm {
namespace core {

// All errors are programmer-contract violations or invalid inputs. They are
// thrown synchronously by the operation that detects them and never leave a
// container or space half-mutated.
struct AbmError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Agent record shape does not fit the configured space (construction time).
struct SchemaError : AbmError {
    using AbmError::AbmError;
};

// Mapping container already holds an agent with this id.
struct DuplicateIdError : AbmError {
    using AbmError::AbmError;
};

// Sequence container received an id other than count + 1.
struct IdSequenceError : AbmError {
    using AbmError::AbmError;
};

// Operation the chosen container cannot perform (removal on a sequence).
struct UnsupportedOperationError : AbmError {
    using AbmError::AbmError;
};

// Grid metric without a well-defined fixed-radius offset set.
struct UnsupportedMetricError : AbmError {
    using AbmError::AbmError;
};

// Out-of-range, non-positive or otherwise malformed argument.
struct InvalidArgumentError : AbmError {
    using AbmError::AbmError;
};

// Lookup or removal of an id the model does not hold.
struct MissingAgentError : AbmError {
    using AbmError::AbmError;
};

} // namespace core
} // namespace abm
