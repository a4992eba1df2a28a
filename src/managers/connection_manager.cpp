#include "connection_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Connection::Connection(std::string server_name, std::string target,
                       std::unique_ptr<Transport> transport)
    : server_name_(std::move(server_name)), target_(std::move(target)),
      transport_(std::move(transport)) {
}

ConnectionManager::ConnectionManager(std::unique_ptr<Dialer> dialer, DialOptions options)
    : dialer_(std::move(dialer)), options_(options) {
}

std::shared_ptr<Connection> ConnectionManager::find_locked(const std::string& server_name) const {
    for (const auto& conn : connections_) {
        if (conn->server_name() == server_name) return conn;
    }
    return nullptr;
}

Result<void> ConnectionManager::open(const Server& server) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (find_locked(server.name)) {
        return Result<void>::Ok();
    }

    rexec_log(fmt::format("[connections] dialing {} at {}", server.name, server.full_address()));
    auto dialed = dialer_->dial(server, options_);
    if (dialed.is_err()) {
        rexec_log(fmt::format("[connections] {} failed: {}", server.name, dialed.error.message));
        // Every dial-side failure is a connection error to the caller,
        // whatever the underlying kind (key file, socket, auth)
        Error err = dialed.error;
        err.kind = ErrorKind::Connection;
        return Result<void>::Err(err);
    }

    std::string target = dialed.value->describe();
    connections_.push_back(std::make_shared<Connection>(server.name, target,
                                                        std::move(dialed.value)));
    rexec_log(fmt::format("[connections] registered {} ({} total)", server.name,
                          connections_.size()));
    return Result<void>::Ok();
}

size_t ConnectionManager::open_all(const std::vector<Server>& servers) {
    size_t opened = 0;
    for (const auto& server : servers) {
        if (find(server.name)) continue;

        auto result = open(server);
        if (result.is_err()) {
            rexec_log(fmt::format("[connections] skipping {}: {}", server.name,
                                  result.error.describe()));
            continue;
        }
        ++opened;
    }
    return opened;
}

Result<void> ConnectionManager::close(Connection& connection) {
    rexec_log(fmt::format("[connections] closing {}", connection.server_name()));
    return connection.transport().close();
}

Result<void> ConnectionManager::close(const std::string& server_name) {
    auto conn = find(server_name);
    if (!conn) {
        return Result<void>::Err(ErrorKind::NotFound,
                                 fmt::format("no connection found for server {}", server_name));
    }
    return close(*conn);
}

void ConnectionManager::close_all() {
    for (const auto& conn : list()) {
        auto result = close(*conn);
        if (result.is_err()) {
            rexec_log(fmt::format("[connections] close {} failed: {}", conn->server_name(),
                                  result.error.describe()));
        }
    }
}

std::shared_ptr<Connection> ConnectionManager::find(const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(server_name);
}

std::vector<std::shared_ptr<Connection>> ConnectionManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

size_t ConnectionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}
