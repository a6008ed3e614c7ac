#pragma once

#include <stdexcept>
#include <string>

namespace edgesync {

/// Error classes the scheduler reacts to
enum class ErrorKind {
    TRANSIENT = 0,   // network timeout, remote unavailable, chunk rejected too often
    INTEGRITY = 1,   // final Merkle root mismatch
    RESOURCE = 2,    // local store unavailable
    TERMINAL = 3,    // illegal job, cancelled, retry budget exhausted
    FATAL = 4        // local store corrupted, stops the process
};

const char* error_kind_to_string(ErrorKind kind);

/// Base of all engine errors
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransientError : public SyncError {
public:
    explicit TransientError(const std::string& what)
        : SyncError(ErrorKind::TRANSIENT, what) {}
};

/// The receiver could not be reached at all (no route, deadline exceeded).
/// Retried like any TransientError; also marks the link offline.
class ConnectivityError : public TransientError {
public:
    explicit ConnectivityError(const std::string& what) : TransientError(what) {}
};

class IntegrityError : public SyncError {
public:
    explicit IntegrityError(const std::string& what)
        : SyncError(ErrorKind::INTEGRITY, what) {}
};

class StoreUnavailableError : public SyncError {
public:
    explicit StoreUnavailableError(const std::string& what)
        : SyncError(ErrorKind::RESOURCE, what) {}
};

class InvalidJobError : public SyncError {
public:
    explicit InvalidJobError(const std::string& what)
        : SyncError(ErrorKind::TERMINAL, what) {}
};

class AlreadyPlannedError : public SyncError {
public:
    explicit AlreadyPlannedError(const std::string& what)
        : SyncError(ErrorKind::TERMINAL, what) {}
};

class IllegalTransitionError : public SyncError {
public:
    explicit IllegalTransitionError(const std::string& what)
        : SyncError(ErrorKind::TERMINAL, what) {}
};

class JobNotFoundError : public SyncError {
public:
    explicit JobNotFoundError(const std::string& job_id)
        : SyncError(ErrorKind::TERMINAL, "Job not found: " + job_id) {}
};

class CancelledError : public SyncError {
public:
    CancelledError() : SyncError(ErrorKind::TERMINAL, "cancelled") {}
};

/// Remote endpoint refused a request for a reason retrying cannot fix
class RemoteRejectedError : public SyncError {
public:
    explicit RemoteRejectedError(const std::string& what)
        : SyncError(ErrorKind::TERMINAL, what) {}
};

class StoreCorruptedError : public SyncError {
public:
    explicit StoreCorruptedError(const std::string& what)
        : SyncError(ErrorKind::FATAL, what) {}
};

}  // namespace edgesync
