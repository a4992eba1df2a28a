#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "server.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// A named remote file in the config, bound to one configured server.
struct ResourceConfig {
    std::string name;
    std::string server;
    std::string path;
    bool privileged = false;
    bool sensitive = false;
};

class Config {
public:
    // Load from a YAML file (default ~/.rexec/config.yaml)
    static Result<Config> load(const fs::path& path = get_default_path());

    // Parse YAML text; `origin` names the source in error messages
    static Result<Config> parse(const std::string& yaml_text,
                                const std::string& origin = "<string>");

    static fs::path get_default_path();

    // Accessors
    int connect_timeout() const { return connect_timeout_; }
    const std::string& log_file() const { return log_file_; }
    const std::vector<Server>& servers() const { return servers_; }
    const std::vector<ResourceConfig>& resources() const { return resources_; }

    const ResourceConfig* find_resource(const std::string& name) const;

public:
    Config() = default;

private:
    int connect_timeout_ = DIAL_TIMEOUT_SECS;
    std::string log_file_;
    std::vector<Server> servers_;
    std::vector<ResourceConfig> resources_;
};

bool config_exists(const fs::path& path = Config::get_default_path());

// Write a commented template; leaves an existing file alone.
Result<void> create_default_config(const fs::path& path = Config::get_default_path());
