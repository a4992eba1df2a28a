#include "remote_file_resource.hpp"
#include "file_resolver.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

RemoteFileResource::RemoteFileResource(FileResolver& resolver)
    : resolver_(resolver) {
}

Server RemoteFileResource::server_for(const ResourceSpec& spec) {
    Server server;
    server.name = spec.host;
    server.address = spec.host;
    server.port = spec.port;
    server.user = spec.user;
    server.password = spec.password;
    server.private_key_path = spec.private_key;
    server.sudo_password = spec.sudo_password;
    return server;
}

Server& RemoteFileResource::server_for_host(const ResourceSpec& spec) {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    auto it = servers_.find(spec.host);
    if (it == servers_.end()) {
        it = servers_.emplace(spec.host, server_for(spec)).first;
    }
    return it->second;
}

Diagnostic RemoteFileResource::diagnose(const Error& error) {
    if (error.is(ErrorKind::Command)) {
        return {"Command Error", fmt::format("Unable to get file info: {}", error.describe())};
    }
    return {"SSH Error", fmt::format("Unable to execute commands: {}", error.describe())};
}

ResourceOutcome RemoteFileResource::observe(const ResourceSpec& spec, const char* step) {
    rexec_log(fmt::format("[resource] {} {}:{}", step, spec.host, spec.path));

    Server& server = server_for_host(spec);
    auto resolved = resolver_.resolve(spec.path, spec.privileged, spec.sensitive, server);

    ResourceOutcome outcome;
    if (resolved.is_err()) {
        outcome.diagnostic = diagnose(resolved.error);
        rexec_log(fmt::format("[resource] {} {}: {}", step, outcome.diagnostic->summary,
                              outcome.diagnostic->detail));
        return outcome;
    }
    outcome.state = std::move(resolved.value);
    return outcome;
}

ResourceOutcome RemoteFileResource::create(const ResourceSpec& spec) {
    return observe(spec, "create");
}

ResourceOutcome RemoteFileResource::read(const ResourceSpec& spec) {
    return observe(spec, "read");
}

ResourceOutcome RemoteFileResource::update(const ResourceSpec& spec, const ResourceState& prior) {
    ResourceState next = prior;
    next.privileged = spec.privileged;
    if (spec.sensitive != prior.sensitive) {
        // Keep the body, move it to the field the new flag selects
        std::string body = prior.body();
        next.sensitive = spec.sensitive;
        next.content.clear();
        next.sensitive_content.clear();
        (spec.sensitive ? next.sensitive_content : next.content) = std::move(body);
    }

    ResourceOutcome outcome;
    outcome.state = std::move(next);
    return outcome;
}

void RemoteFileResource::remove(const ResourceSpec& spec) {
    rexec_log(fmt::format("[resource] remove {}:{} (state only, file left in place)",
                          spec.host, spec.path));
}

ResourceState RemoteFileResource::import_state(const std::string& id) const {
    ResourceState state;
    state.id = id;
    return state;
}
