#include <iostream>
#include <vector>
#include <string>
#include "cli/rexec_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <ssh/session.hpp>

static const char* REXEC_VERSION = "0.1.0";

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    rexec read "
              << theme::color::RESET << theme::color::BROWN << "<resource>"
              << theme::color::RESET << theme::color::DIM
              << "          Resolve a configured remote file" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    rexec exec "
              << theme::color::RESET << theme::color::BROWN << "<server> <cmd...>"
              << theme::color::RESET << theme::color::DIM
              << "    Run a command on a server" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    rexec connect"
              << theme::color::RESET << theme::color::DIM
              << "                   Connect to all configured servers" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    rexec init"
              << theme::color::RESET << theme::color::DIM
              << "                      Write a config template" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <file>         Config file (default ~/.rexec/config.yaml)\n"
              << "    rexec --version         Show version\n"
              << "    rexec --help            Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    fs::path config_path = Config::get_default_path();
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << theme::fail("--config needs a file");
                return 1;
            }
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty() || args[0] == "--help") {
        print_usage();
        return args.empty() ? 1 : 0;
    }

    std::string cmd = args[0];
    args.erase(args.begin());

    if (cmd == "--version") {
        std::cout << theme::color::BROWN << theme::color::BOLD << "rexec"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << REXEC_VERSION << theme::color::RESET << "\n";
        return 0;
    }

    if (cmd == "init") {
        auto created = create_default_config(config_path);
        if (created.is_err()) {
            std::cerr << theme::fail(created.error.message);
            return 1;
        }
        std::cout << theme::ok("Config at " + config_path.string());
        return 0;
    }

    auto config = Config::load(config_path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error.message);
        std::cerr << theme::step("Run 'rexec init' to create one.");
        return 1;
    }
    if (!config.value.log_file().empty()) {
        set_rexec_log_path(config.value.log_file());
    }

    RexecCLI cli(std::move(config.value), std::make_unique<SshDialer>(), std::cout, std::cerr);
    if (!cli.has_command(cmd)) {
        std::cerr << theme::fail("Unknown command: " + cmd);
        cli.print_help();
        return 1;
    }
    return cli.execute_command(cmd, args);
}
