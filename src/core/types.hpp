#pragma once

#include <string>
#include <optional>
#include <vector>
#include <utility>

// What went wrong, at the granularity callers react to
enum class ErrorKind {
    Connection,    // dial, handshake, auth, key material, dead transport
    Session,       // session allocation on a live connection
    NotFound,      // execute() before open()
    Command,       // remote command exited non-zero
    FileNotFound,  // local file missing
    Io,            // local file unreadable
    Config,        // config file missing or invalid
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Connection;
    std::string message;
    int exit_code = 0;           // Command only
    std::string stderr_data;     // Command only

    static Error make(ErrorKind kind, std::string message) {
        Error e;
        e.kind = kind;
        e.message = std::move(message);
        return e;
    }

    static Error command(int exit_code, std::string stderr_data) {
        Error e;
        e.kind = ErrorKind::Command;
        e.exit_code = exit_code;
        e.stderr_data = std::move(stderr_data);
        e.message = "exit status " + std::to_string(exit_code);
        return e;
    }

    bool is(ErrorKind k) const { return kind == k; }

    // User-facing rendering. Exit-code failures and transport failures
    // have different shapes so they can be told apart at a glance.
    std::string describe() const;
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(ErrorKind kind, const std::string& msg) {
        return {false, T{}, Error::make(kind, msg)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(ErrorKind kind, const std::string& msg) {
        return {false, Error::make(kind, msg)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One finished command. Never mutated once it lands in a server's history.
struct CommandResult {
    std::string command;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    bool exit_observed = false;   // remote side reported exit-status or exit-signal
};

// What execute() hands back once the command actually ran: the normalized
// result plus the run's own error, untouched. A result with exit_code 0 and
// an error means the command never reported how it ended.
struct Execution {
    CommandResult result;
    std::optional<Error> error;

    bool clean() const { return !error.has_value(); }
};
