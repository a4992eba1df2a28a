#pragma once

#include <string>
#include <core/server.hpp>
#include <core/types.hpp>
#include "transport.hpp"

class ConnectionManager;

// Remove the echo of a primed sudo password from captured stdout.
//
// If any line carries the sudo prompt marker, every line containing the
// marker or the password is dropped. Otherwise only a first line that
// contains the password is dropped (plain echo of the typed input).
// Line order is preserved. An empty password never matches a line.
std::string scrub_sudo_echo(const std::string& stdout_data, const std::string& password);

// "Run this command on that server". One production implementation
// (SshCommandExecutor); tests substitute recording doubles.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Err: the command never ran (NotFound, Session).
    // Ok: it ran; the Execution carries the result, already appended to
    // server.history, plus the run's own error if any.
    virtual Result<Execution> execute(const std::string& command, Server& server) = 0;
};

// Runs commands over connections registered in a ConnectionManager, one PTY
// session per command, priming stdin with the server's sudo password.
class SshCommandExecutor : public CommandExecutor {
public:
    explicit SshCommandExecutor(ConnectionManager& connections);

    Result<Execution> execute(const std::string& command, Server& server) override;

private:
    ConnectionManager& connections_;
    PtyRequest pty_;

    // Turn a finished session run into the normalized result + error pair.
    static Execution normalize(const std::string& command, SessionRun run,
                               const std::string& priming_password);
};
