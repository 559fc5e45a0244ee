// === Errors ==================================================================
//
// Exception hierarchy shared by the registries, the connection pool and the
// executor. Registry-level failures (validation, lookup) are thrown straight
// to the caller. Connection and cancellation failures are thrown inside the
// execution path and converted into per-target results by the executor.

#pragma once

#include <stdexcept>
#include <string>

namespace remote_fleet {

/** @brief Root of every error raised by the execution core. */
class FleetError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed target or cluster input. Never retried. */
class ValidationError : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief A target or cluster with the same name is already registered. */
class DuplicateNameError : public ValidationError {
  public:
    using ValidationError::ValidationError;
};

/** @brief A cluster would be left without members. */
class EmptyMembersError : public ValidationError {
  public:
    using ValidationError::ValidationError;
};

/** @brief The target is already a member of the cluster. */
class DuplicateMemberError : public ValidationError {
  public:
    using ValidationError::ValidationError;
};

/** @brief The transport could not be established or was lost mid-session. */
class ConnectionError : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief Unknown target, cluster or cluster member. */
class NotFoundError : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief The shared deadline elapsed before the work could finish. */
class CancellationError : public FleetError {
  public:
    using FleetError::FleetError;
};

}  // namespace remote_fleet
