#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Connection:   return "connection";
    case ErrorKind::Session:      return "session";
    case ErrorKind::NotFound:     return "not found";
    case ErrorKind::Command:      return "command";
    case ErrorKind::FileNotFound: return "file not found";
    case ErrorKind::Io:           return "io";
    case ErrorKind::Config:       return "config";
    }
    return "unknown";
}

std::string Error::describe() const {
    switch (kind) {
    case ErrorKind::Command:
        return fmt::format("command failed with exit {}: {}", exit_code, stderr_data);
    case ErrorKind::Connection:
    case ErrorKind::Session:
        return fmt::format("unable to connect/execute: {}", message);
    default:
        return message;
    }
}
