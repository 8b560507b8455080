#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace fablecore {

/**
 * Base exception for all mechanics errors.
 */
class MechanicsError : public std::runtime_error {
public:
    explicit MechanicsError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Short, stable name of the error kind (used in error frames).
     */
    virtual const char* kind() const { return "MechanicsError"; }

    /**
     * Status code reported to the transport layer.
     */
    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the operation conflicted with the current session state.
     */
    virtual bool is_state_conflict() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if a collaborator (the narrator) was unavailable.
     */
    virtual bool is_unavailable() const { return false; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * Malformed input: unknown difficulty tier, negative ranks or quantities.
 * Rejected before any mutation.
 */
class ValidationError : public MechanicsError {
public:
    explicit ValidationError(const std::string& message)
        : MechanicsError(message) {}

    const char* kind() const override { return "ValidationError"; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
    bool is_invalid_argument() const override { return true; }
};

/**
 * Acting out of turn, acting on a concluded encounter, or rolling back
 * a session that has a turn in flight.
 */
class StateConflictError : public MechanicsError {
public:
    explicit StateConflictError(const std::string& message)
        : MechanicsError(message) {}

    const char* kind() const override { return "StateConflictError"; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_state_conflict() const override { return true; }
};

/**
 * Unknown session, combatant or item.
 */
class NotFoundError : public MechanicsError {
public:
    explicit NotFoundError(const std::string& message)
        : MechanicsError(message) {}

    const char* kind() const override { return "NotFoundError"; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
    bool is_not_found() const override { return true; }
};

/**
 * The narrator failed or timed out. Already committed mechanics stay valid.
 */
class NarrationUnavailableError : public MechanicsError {
public:
    explicit NarrationUnavailableError(const std::string& message)
        : MechanicsError(message) {}

    const char* kind() const override { return "NarrationUnavailableError"; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::UNAVAILABLE; }
    bool is_unavailable() const override { return true; }
};

/**
 * Thrown when a session record cannot be read or written.
 */
class PersistenceError : public MechanicsError {
public:
    explicit PersistenceError(const std::string& message)
        : MechanicsError(message) {}

    const char* kind() const override { return "PersistenceError"; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INTERNAL; }
};

} // namespace fablecore
