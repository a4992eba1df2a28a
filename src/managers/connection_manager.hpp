#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/server.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// One registered, authenticated connection. Refers to its server by
// identity only; the Server itself stays with the caller.
class Connection {
public:
    Connection(std::string server_name, std::string target, std::unique_ptr<Transport> transport);

    const std::string& server_name() const { return server_name_; }
    const std::string& target() const { return target_; }
    Transport& transport() { return *transport_; }
    bool is_open() const { return transport_->is_open(); }

private:
    std::string server_name_;
    std::string target_;    // user@address:port at dial time
    std::unique_ptr<Transport> transport_;
};

// Registry of live connections, at most one per server name.
//
// open() holds the registry lock across lookup, dial and insert, so two
// callers opening the same name never both dial. Closed connections stay
// registered: the next command on them fails instead of reconnecting.
class ConnectionManager {
public:
    explicit ConnectionManager(std::unique_ptr<Dialer> dialer, DialOptions options = {});

    // Idempotent: Ok without dialing when server.name is already registered.
    Result<void> open(const Server& server);

    // Best effort over many servers; failures are logged and skipped.
    // Returns how many connections this call added.
    size_t open_all(const std::vector<Server>& servers);

    // Terminate the transport. The registry entry is kept.
    Result<void> close(Connection& connection);
    Result<void> close(const std::string& server_name);

    // Close every transport (registry entries kept)
    void close_all();

    std::shared_ptr<Connection> find(const std::string& server_name) const;
    std::vector<std::shared_ptr<Connection>> list() const;
    size_t size() const;

private:
    std::unique_ptr<Dialer> dialer_;
    DialOptions options_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;

    std::shared_ptr<Connection> find_locked(const std::string& server_name) const;
};
