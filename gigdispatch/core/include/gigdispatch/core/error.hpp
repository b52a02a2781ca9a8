#pragma once

#include <stdexcept>
#include <string>

namespace gigdispatch::core {

/// @brief Base exception for all dispatch errors.
///
/// All exceptions thrown by the dispatch libraries derive from this class,
/// allowing callers to catch dispatch-specific errors separately from other
/// `std::runtime_error` exceptions.
///
/// @see NotFoundError, InvalidStateError, UnauthorizedError, ExpiredError
/// @ingroup core
class DispatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a task, offer or worker does not exist.
///
/// @see DispatchError
/// @ingroup core
class NotFoundError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, accepting an offer that is no longer pending, or allocating
/// a task that has already been accepted by a worker.
///
/// @see DispatchError
/// @ingroup core
class InvalidStateError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

/// @brief Thrown when a worker responds to an offer addressed to someone else.
///
/// @see DispatchError
/// @ingroup core
class UnauthorizedError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

/// @brief Thrown when an offer is accepted after its expiry time.
///
/// Raised on the wall-clock comparison alone, even when the stored offer
/// status is still pending.
///
/// @see DispatchError
/// @ingroup core
class ExpiredError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

/// @brief Thrown when a strategy is executed without any candidate.
///
/// @see DispatchError
/// @ingroup core
class NoEligibleWorkersError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

/// @brief Wraps a failure reported by an external collaborator.
///
/// The message is formatted as `"collaborator: message"`.
///
/// @see DispatchError
/// @ingroup core
class CollaboratorError : public DispatchError {
public:
    /// @brief Construct with the collaborator name and the original message.
    /// @param collaborator  Short name such as "worker repository".
    /// @param message       Description of the underlying failure.
    CollaboratorError(const std::string& collaborator, const std::string& message)
        : DispatchError(collaborator + ": " + message) {}
};

/// @brief Thrown when the caller cancelled the call or its deadline passed.
///
/// @see CallContext
/// @ingroup core
class CancelledError : public DispatchError {
public:
    using DispatchError::DispatchError;
};

} // namespace gigdispatch::core
