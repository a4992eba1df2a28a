#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "constants.hpp"
#include "types.hpp"

// One remote host as seen by the executor. `name` keys the connection
// registry; `address` is only the dial target, so two names may point at
// the same address and get separate connections.
struct Server {
    std::string name;
    std::string address;
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;

    // Fed to every session as the priming password.
    std::string sudo_password;

    // Append-only. Owned by this server.
    std::vector<CommandResult> history;

    // Held for the whole of one command execution so prime and scrub of
    // the same password are never interleaved with another command.
    // Shared so Server stays copyable.
    std::shared_ptr<std::mutex> exec_mutex = std::make_shared<std::mutex>();

    std::string full_address() const;

    bool has_password() const { return password && !password->empty(); }
    bool has_private_key() const { return private_key_path && !private_key_path->empty(); }

    void record(const CommandResult& result) { history.push_back(result); }
};
