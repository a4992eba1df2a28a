#include "file_resolver.hpp"
#include "connection_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/command_executor.hpp>
#include <fmt/format.h>

std::string build_combined_command(const std::string& path, bool privileged) {
    const std::string sudo = privileged ? SUDO_PREFIX : "";
    const std::string quoted = shell_quote_path(path);
    return fmt::format("{}stat -c '%i' {}; {}cat {}", sudo, quoted, sudo, quoted);
}

Result<ResourceState> parse_resource_output(const std::string& stdout_data,
                                            const std::string& address, bool sensitive) {
    auto lines = split_lines(stdout_data);
    if (lines.size() > 1 && lines.back().empty()) {
        lines.pop_back();
    }
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }

    if (lines.size() < 2) {
        Error err = Error::make(ErrorKind::Command,
                                fmt::format("malformed output: expected inode line, got {} line(s)",
                                            lines.size()));
        return Result<ResourceState>::Err(err);
    }

    std::string inode = trimmed(lines[1]);
    if (inode.empty()) {
        return Result<ResourceState>::Err(ErrorKind::Command, "malformed output: empty inode");
    }

    std::vector<std::string> body(lines.begin() + 2, lines.end());

    ResourceState state;
    state.id = address + RESOURCE_ID_SEPARATOR + inode;
    state.sensitive = sensitive;
    if (sensitive) {
        state.sensitive_content = join_lines(body);
    } else {
        state.content = join_lines(body);
    }
    return Result<ResourceState>::Ok(std::move(state));
}

FileResolver::FileResolver(ConnectionManager& connections, CommandExecutor& executor)
    : connections_(connections), executor_(executor) {
}

Result<ResourceState> FileResolver::resolve(const std::string& path, bool privileged,
                                            bool sensitive, Server& server) {
    auto opened = connections_.open(server);
    if (opened.is_err()) {
        return Result<ResourceState>::Err(opened.error);
    }

    std::string command = build_combined_command(path, privileged);
    auto executed = executor_.execute(command, server);
    if (executed.is_err()) {
        return Result<ResourceState>::Err(executed.error);
    }

    const Execution& execution = executed.value;
    const CommandResult& result = execution.result;
    if (result.exit_code != 0) {
        rexec_log(fmt::format("[resolve] {}:{} exit {}", server.name, path, result.exit_code));
        return Result<ResourceState>::Err(Error::command(result.exit_code, result.stderr_data));
    }
    if (execution.error) {
        return Result<ResourceState>::Err(*execution.error);
    }

    auto parsed = parse_resource_output(result.stdout_data, server.address, sensitive);
    if (parsed.is_err()) {
        rexec_log(fmt::format("[resolve] {}:{} {}", server.name, path, parsed.error.message));
        return parsed;
    }
    parsed.value.privileged = privileged;

    if (sensitive) {
        rexec_log(fmt::format("[resolve] {} content=<redacted>", parsed.value.id));
    } else {
        rexec_log(fmt::format("[resolve] {} content({})={}", parsed.value.id,
                              parsed.value.content.size(),
                              parsed.value.content.substr(0, LOG_OUTPUT_PREVIEW_BYTES)));
    }
    return parsed;
}
