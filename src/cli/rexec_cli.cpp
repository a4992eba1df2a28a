#include "rexec_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <managers/remote_file_resource.hpp>
#include <ostream>
#include <fmt/format.h>

RexecCLI::RexecCLI(Config config, std::unique_ptr<Dialer> dialer,
                   std::ostream& out, std::ostream& err)
    : config_(std::move(config)), servers_(config_.servers()), out_(out), err_(err) {
    DialOptions options;
    options.timeout_secs = config_.connect_timeout();
    connections_ = std::make_unique<ConnectionManager>(std::move(dialer), options);
    executor_ = std::make_unique<SshCommandExecutor>(*connections_);
    resolver_ = std::make_unique<FileResolver>(*connections_, *executor_);
    register_commands();
}

RexecCLI::~RexecCLI() {
    connections_->close_all();
}

void RexecCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& help) {
    commands_[name] = {handler, help};
}

bool RexecCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

int RexecCLI::execute_command(const std::string& name, const std::vector<std::string>& args) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        err_ << theme::fail("Unknown command: " + name);
        err_ << theme::step("Run 'rexec --help' for available commands.");
        return 1;
    }
    return it->second.first(*this, args);
}

void RexecCLI::print_help() const {
    out_ << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        out_ << theme::color::BLUE << fmt::format("    {:<14}", name) << theme::color::RESET
             << theme::color::DIM << entry.second << theme::color::RESET << "\n";
    }
    out_ << "\n";
}

void RexecCLI::register_commands() {
    add_command("read", [](RexecCLI& cli, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            cli.err_ << theme::fail("Usage: rexec read <resource>");
            return 1;
        }
        return cli.run_read(args[0]);
    }, "Resolve a configured remote file (identity + content)");

    add_command("exec", [](RexecCLI& cli, const std::vector<std::string>& args) {
        if (args.size() < 2) {
            cli.err_ << theme::fail("Usage: rexec exec <server> <command...>");
            return 1;
        }
        std::vector<std::string> words(args.begin() + 1, args.end());
        std::string command;
        for (size_t i = 0; i < words.size(); i++) {
            if (i > 0) command += " ";
            command += words[i];
        }
        return cli.run_exec(args[0], command);
    }, "Run a command on a configured server");

    add_command("connect", [](RexecCLI& cli, const std::vector<std::string>& args) {
        if (!args.empty()) {
            cli.err_ << theme::fail("Usage: rexec connect");
            return 1;
        }
        return cli.run_connect();
    }, "Connect to every configured server and list connections");
}

Server* RexecCLI::find_server(const std::string& name) {
    for (auto& s : servers_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

int RexecCLI::report(const Error& error) {
    Diagnostic diag = RemoteFileResource::diagnose(error);
    rexec_log(fmt::format("[cli] {} error: {}", error_kind_name(error.kind), error.message));
    err_ << theme::fail(diag.summary + ": " + error.describe());
    return 1;
}

int RexecCLI::run_read(const std::string& resource_name) {
    const ResourceConfig* res = config_.find_resource(resource_name);
    if (!res) {
        err_ << theme::fail("Unknown resource: " + resource_name);
        return 1;
    }
    Server* server = find_server(res->server);
    if (!server) {
        err_ << theme::fail("Unknown server: " + res->server);
        return 1;
    }

    auto resolved = resolver_->resolve(res->path, res->privileged, res->sensitive, *server);
    if (resolved.is_err()) {
        return report(resolved.error);
    }

    const ResourceState& state = resolved.value;
    out_ << theme::kv("id", state.id);
    out_ << theme::kv("path", res->path);
    if (state.sensitive) {
        out_ << theme::kv("content", theme::dim("(sensitive)"));
    } else {
        out_ << theme::section("Content") << state.content << "\n";
    }
    return 0;
}

int RexecCLI::run_exec(const std::string& server_name, const std::string& command) {
    Server* server = find_server(server_name);
    if (!server) {
        err_ << theme::fail("Unknown server: " + server_name);
        return 1;
    }

    auto opened = connections_->open(*server);
    if (opened.is_err()) {
        return report(opened.error);
    }

    auto executed = executor_->execute(command, *server);
    if (executed.is_err()) {
        return report(executed.error);
    }

    const Execution& execution = executed.value;
    const CommandResult& result = execution.result;
    out_ << result.stdout_data;
    if (!result.stdout_data.empty() && result.stdout_data.back() != '\n') out_ << "\n";
    if (!result.stderr_data.empty()) {
        err_ << result.stderr_data;
        if (result.stderr_data.back() != '\n') err_ << "\n";
    }

    if (execution.error) {
        if (execution.error->is(ErrorKind::Command)) {
            err_ << theme::fail(fmt::format("exit {}", result.exit_code));
            return 1;
        }
        return report(*execution.error);
    }
    return 0;
}

int RexecCLI::run_connect() {
    if (servers_.empty()) {
        out_ << theme::warn("No servers configured.");
        return 0;
    }

    size_t added = connections_->open_all(servers_);
    rexec_log(fmt::format("[cli] connect: {} new connection(s)", added));

    out_ << theme::section("Connections");
    int missing = 0;
    for (const auto& server : servers_) {
        auto conn = connections_->find(server.name);
        if (conn && conn->is_open()) {
            out_ << theme::ok(fmt::format("{:<12} {}", server.name, conn->target()));
        } else {
            err_ << theme::fail(fmt::format("{:<12} {} (see {})", server.name,
                                            server.full_address(), rexec_log_path()));
            missing++;
        }
    }
    return missing == 0 ? 0 : 1;
}
