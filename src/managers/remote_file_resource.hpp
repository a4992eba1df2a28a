#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <core/resource.hpp>
#include <core/server.hpp>
#include <core/types.hpp>

class FileResolver;

// Caller-facing failure report: a short category plus the rendered error.
struct Diagnostic {
    std::string summary;    // "SSH Error" or "Command Error"
    std::string detail;
};

// Outcome of one lifecycle step: a state, or a diagnostic explaining why not.
struct ResourceOutcome {
    std::optional<ResourceState> state;
    std::optional<Diagnostic> diagnostic;

    bool ok() const { return state.has_value() && !diagnostic.has_value(); }
};

// Lifecycle of an existing remote file. The file is only ever observed:
// create and read look it up, update and remove touch nothing remote.
class RemoteFileResource {
public:
    explicit RemoteFileResource(FileResolver& resolver);

    ResourceOutcome create(const ResourceSpec& spec);
    ResourceOutcome read(const ResourceSpec& spec);
    ResourceOutcome update(const ResourceSpec& spec, const ResourceState& prior);
    void remove(const ResourceSpec& spec);
    ResourceState import_state(const std::string& id) const;

    // Server descriptor used for a spec: name and address are both the host.
    static Server server_for(const ResourceSpec& spec);

    static Diagnostic diagnose(const Error& error);

private:
    FileResolver& resolver_;

    // One descriptor per host for the life of this object, so commands on a
    // host share its exec mutex and history. The first spec seen for a host
    // fixes its credentials, as the connection registry does.
    std::map<std::string, Server> servers_;
    std::mutex servers_mutex_;

    Server& server_for_host(const ResourceSpec& spec);

    ResourceOutcome observe(const ResourceSpec& spec, const char* step);
};
