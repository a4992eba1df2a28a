#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

static Result<Server> parse_server(const YAML::Node& node, size_t index) {
    Server server;
    server.address = node["address"].as<std::string>("");
    server.user = node["user"].as<std::string>("");
    server.name = node["name"].as<std::string>(server.address);
    server.port = node["port"].as<int>(DEFAULT_SSH_PORT);

    if (server.address.empty()) {
        return Result<Server>::Err(ErrorKind::Config,
                                   fmt::format("servers[{}]: missing address", index));
    }
    if (server.user.empty()) {
        return Result<Server>::Err(ErrorKind::Config,
                                   fmt::format("server {}: missing user", server.name));
    }
    if (server.port <= 0 || server.port > 65535) {
        return Result<Server>::Err(ErrorKind::Config,
                                   fmt::format("server {}: invalid port {}", server.name, server.port));
    }

    if (node["password"]) {
        server.password = node["password"].as<std::string>();
    }
    if (node["private_key"]) {
        server.private_key_path = expand_user_path(node["private_key"].as<std::string>());
    }
    server.sudo_password = node["sudo_password"].as<std::string>("");

    return Result<Server>::Ok(std::move(server));
}

static ResourceConfig parse_resource(const YAML::Node& node) {
    ResourceConfig res;
    res.path = node["path"].as<std::string>("");
    res.name = node["name"].as<std::string>(res.path);
    res.server = node["server"].as<std::string>("");
    res.privileged = node["privileged"].as<bool>(false);
    res.sensitive = node["sensitive"].as<bool>(false);
    return res;
}

fs::path Config::get_default_path() {
    return platform::home_dir() / CONFIG_DIR_NAME / CONFIG_FILE_NAME;
}

bool config_exists(const fs::path& path) {
    return platform::file_exists(path);
}

Result<Config> Config::parse(const std::string& yaml_text, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.connect_timeout_ = root["connect_timeout"].as<int>(DIAL_TIMEOUT_SECS);
        if (config.connect_timeout_ <= 0) {
            return Result<Config>::Err(ErrorKind::Config,
                                       fmt::format("{}: connect_timeout must be positive", origin));
        }
        if (root["log_file"]) {
            config.log_file_ = expand_user_path(root["log_file"].as<std::string>());
        }

        std::set<std::string> names;
        if (root["servers"] && root["servers"].IsSequence()) {
            size_t index = 0;
            for (const auto& node : root["servers"]) {
                auto server = parse_server(node, index++);
                if (server.is_err()) {
                    Error err = server.error;
                    err.message = origin + ": " + err.message;
                    return Result<Config>::Err(err);
                }
                if (!names.insert(server.value.name).second) {
                    return Result<Config>::Err(ErrorKind::Config,
                        fmt::format("{}: duplicate server name {}", origin, server.value.name));
                }
                config.servers_.push_back(std::move(server.value));
            }
        }

        if (root["resources"] && root["resources"].IsSequence()) {
            for (const auto& node : root["resources"]) {
                ResourceConfig res = parse_resource(node);
                if (res.path.empty()) {
                    return Result<Config>::Err(ErrorKind::Config,
                        fmt::format("{}: resource {} has no path", origin, res.name));
                }
                if (!names.count(res.server)) {
                    return Result<Config>::Err(ErrorKind::Config,
                        fmt::format("{}: resource {} refers to unknown server '{}'",
                                    origin, res.name, res.server));
                }
                config.resources_.push_back(std::move(res));
            }
        }

        return Result<Config>::Ok(std::move(config));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
                                   fmt::format("failed to parse {}: {}", origin, e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err(ErrorKind::Config,
                                   "config not found at " + path.string());
    }

    auto text = platform::read_file(path.string());
    if (text.is_err()) {
        return Result<Config>::Err(ErrorKind::Config, text.error.message);
    }
    return parse(text.value, path.string());
}

const ResourceConfig* Config::find_resource(const std::string& name) const {
    for (const auto& r : resources_) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (config_exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Io,
                                 fmt::format("failed to create {}: {}",
                                             path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# rexec configuration

# Seconds allowed for TCP connect + SSH handshake
connect_timeout: 10

# Optional: debug log location (default: $TMPDIR/rexec_debug.log)
# log_file: ~/.rexec/debug.log

servers:
  # - name: web1                     # defaults to address
  #   address: 10.0.0.5
  #   port: 22
  #   user: deploy
  #   password: ""                   # optional
  #   private_key: ~/.ssh/id_ed25519 # optional, unencrypted
  #   sudo_password: ""              # typed into every session

resources:
  # - name: hosts
  #   server: web1
  #   path: /etc/hosts
  #   privileged: false
  #   sensitive: false
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Io, "failed to create config file at " + path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err(ErrorKind::Io, "failed to write config file at " + path.string());
    }
    return Result<void>::Ok();
}
