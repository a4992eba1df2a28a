#include "command_executor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/connection_manager.hpp>
#include <map>
#include <fmt/format.h>

// ── Scrubbing ────────────────────────────────────────────────────────

static bool contains(const std::string& line, const std::string& needle) {
    return !needle.empty() && line.find(needle) != std::string::npos;
}

std::string scrub_sudo_echo(const std::string& stdout_data, const std::string& password) {
    auto lines = split_lines(stdout_data);

    bool prompted = false;
    for (const auto& line : lines) {
        if (contains(line, SUDO_PROMPT_MARKER)) {
            prompted = true;
            break;
        }
    }

    if (prompted) {
        std::vector<std::string> kept;
        kept.reserve(lines.size());
        for (auto& line : lines) {
            if (contains(line, SUDO_PROMPT_MARKER) || contains(line, password)) continue;
            kept.push_back(std::move(line));
        }
        lines = std::move(kept);
    } else if (!lines.empty() && contains(lines.front(), password)) {
        lines.erase(lines.begin());
    }

    return join_lines(lines);
}

int exit_code_for_signal(const std::string& signal_name) {
    static const std::map<std::string, int> SIGNALS{
        {"HUP", 1},  {"INT", 2},   {"QUIT", 3},  {"ILL", 4},
        {"ABRT", 6}, {"FPE", 8},   {"KILL", 9},  {"USR1", 10},
        {"SEGV", 11}, {"USR2", 12}, {"PIPE", 13}, {"ALRM", 14},
        {"TERM", 15},
    };
    auto it = SIGNALS.find(signal_name);
    return 128 + (it != SIGNALS.end() ? it->second : 0);
}

// ── Session release ──────────────────────────────────────────────────

namespace {

// Closes the session on every way out of execute(). Close failures are
// only logged; the command's own outcome is what the caller gets.
class SessionRelease {
public:
    SessionRelease(RemoteSession& session, std::string label)
        : session_(session), label_(std::move(label)) {}

    ~SessionRelease() {
        auto closed = session_.close();
        if (closed.is_err()) {
            rexec_log(fmt::format("{} session close failed: {}", label_, closed.error.message));
        }
    }

    SessionRelease(const SessionRelease&) = delete;
    SessionRelease& operator=(const SessionRelease&) = delete;

private:
    RemoteSession& session_;
    std::string label_;
};

} // namespace

// ── SshCommandExecutor ───────────────────────────────────────────────

SshCommandExecutor::SshCommandExecutor(ConnectionManager& connections)
    : connections_(connections) {
}

Result<Execution> SshCommandExecutor::execute(const std::string& command, Server& server) {
    auto connection = connections_.find(server.name);
    if (!connection) {
        return Result<Execution>::Err(ErrorKind::NotFound,
                                      fmt::format("no connection found for server {}", server.name));
    }

    std::string label = fmt::format("[exec {}]", server.name);

    // One command at a time per server: the password primed here is the one
    // scrubbed below, whatever other callers do to the server meanwhile.
    std::lock_guard<std::mutex> exec_lock(*server.exec_mutex);
    const std::string priming_password = server.sudo_password;

    auto opened = connection->transport().open_session();
    if (opened.is_err()) {
        rexec_log(fmt::format("{} {}", label, opened.error.message));
        return Result<Execution>::Err(opened.error);
    }
    std::unique_ptr<RemoteSession> session = std::move(opened.value);
    SessionRelease release(*session, label);

    session->set_stdin(priming_password + "\n");

    auto pty = session->request_pty(pty_);
    if (pty.is_err()) {
        rexec_log(fmt::format("{} {}", label, pty.error.message));
        return Result<Execution>::Err(pty.error);
    }

    SessionRun run = session->run(command);
    Execution execution = normalize(command, std::move(run), priming_password);

    server.record(execution.result);
    // Sizes only: output may be a sensitive file. Callers that know better
    // log the content themselves.
    rexec_log_cmd(label, execution.result, true);
    if (execution.error && !execution.error->is(ErrorKind::Command)) {
        rexec_log(fmt::format("{} run error: {}", label, execution.error->message));
    }

    return Result<Execution>::Ok(std::move(execution));
}

Execution SshCommandExecutor::normalize(const std::string& command, SessionRun run,
                                        const std::string& priming_password) {
    Execution execution;
    CommandResult& result = execution.result;
    result.command = command;
    result.stdout_data = scrub_sudo_echo(run.stdout_data, priming_password);
    result.stderr_data = std::move(run.stderr_data);

    if (run.error) {
        // Never learned how the command ended
        result.exit_code = 0;
        result.exit_observed = false;
        execution.error = std::move(run.error);
        return execution;
    }

    if (run.exit_signal) {
        result.exit_code = exit_code_for_signal(*run.exit_signal);
        result.exit_observed = true;
        Error err = Error::command(result.exit_code, result.stderr_data);
        err.message = "process killed by signal " + *run.exit_signal;
        execution.error = std::move(err);
        return execution;
    }

    if (run.exit_status) {
        result.exit_code = *run.exit_status;
        result.exit_observed = true;
        if (result.exit_code != 0) {
            execution.error = Error::command(result.exit_code, result.stderr_data);
        }
    }

    return execution;
}
