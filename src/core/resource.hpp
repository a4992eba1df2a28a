#pragma once

#include <optional>
#include <string>
#include "constants.hpp"

// A file on a remote host, as requested by the caller.
struct ResourceSpec {
    std::string host;                          // address; also the server name
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> private_key;    // local path
    std::string sudo_password;

    std::string path;
    bool privileged = false;    // run stat/cat under sudo
    bool sensitive = false;     // content goes to sensitive_content
};

// Observed state of a remote file. Exactly one of content/sensitive_content
// carries the file body; the other is empty.
struct ResourceState {
    std::string id;    // "<address>-<inode>"
    std::string content;
    std::string sensitive_content;
    bool privileged = false;
    bool sensitive = false;

    const std::string& body() const { return sensitive ? sensitive_content : content; }
};
