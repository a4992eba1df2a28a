#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <managers/connection_manager.hpp>
#include <managers/file_resolver.hpp>
#include <ssh/command_executor.hpp>

// Subcommands that need a loaded config and the connection stack.
// Program output goes to `out`, failures to `err`; each command returns
// the process exit status.
class RexecCLI {
public:
    RexecCLI(Config config, std::unique_ptr<Dialer> dialer,
             std::ostream& out, std::ostream& err);
    ~RexecCLI();

    using CommandHandler = std::function<int(RexecCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name, CommandHandler handler, const std::string& help);

    bool has_command(const std::string& name) const;
    int execute_command(const std::string& name, const std::vector<std::string>& args);
    void print_help() const;

    int run_read(const std::string& resource_name);
    int run_exec(const std::string& server_name, const std::string& command);
    int run_connect();

    ConnectionManager& connections() { return *connections_; }

private:
    Config config_;
    std::vector<Server> servers_;    // mutable copies: history, sudo password
    std::unique_ptr<ConnectionManager> connections_;
    std::unique_ptr<SshCommandExecutor> executor_;
    std::unique_ptr<FileResolver> resolver_;
    std::ostream& out_;
    std::ostream& err_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

    Server* find_server(const std::string& name);
    int report(const Error& error);
    void register_commands();
};
