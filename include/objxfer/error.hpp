#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

/// Failure taxonomy shared by every backend and pipeline.
enum class ErrorKind {
    NotFound,            // object, bucket or path does not exist
    PermissionDenied,    // recoverable: bulk operations skip and continue
    InvalidArgument,     // malformed input, fatal before work starts
    PreconditionNotMet,  // missing --force / --dangerous acknowledgment
    BackendFailure,      // network or filesystem I/O failure
    RetentionConflict    // retention change without content change
};

const char* error_kind_name(ErrorKind kind);

/// A classified error with the chain of alias/path context it passed through.
struct Error {
    ErrorKind kind = ErrorKind::BackendFailure;
    std::string message;
    std::vector<std::string> trace;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// Returns a copy annotated with additional context (alias, path, ...).
    Error with_trace(std::initializer_list<std::string> context) const;

    bool is(ErrorKind k) const { return kind == k; }

    std::string to_string() const;
};

// Convenience constructors
inline Error not_found(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
inline Error permission_denied(std::string msg) { return {ErrorKind::PermissionDenied, std::move(msg)}; }
inline Error invalid_argument(std::string msg) { return {ErrorKind::InvalidArgument, std::move(msg)}; }
inline Error precondition_not_met(std::string msg) { return {ErrorKind::PreconditionNotMet, std::move(msg)}; }
inline Error backend_failure(std::string msg) { return {ErrorKind::BackendFailure, std::move(msg)}; }

/// Map an errno value from a filesystem call to the shared taxonomy.
Error error_from_errno(int err, const std::string& path);

}  // namespace objxfer
