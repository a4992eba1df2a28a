#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/server.hpp>
#include <core/types.hpp>

// Seams between the executor and the wire. The libssh2 implementations live
// in session.hpp / channel.hpp; tests plug in recording doubles instead.

struct PtyRequest {
    std::string term = PTY_TERM;
    int width_cols = PTY_WIDTH_COLS;
    int height_rows = PTY_HEIGHT_ROWS;
    bool echo = true;
    unsigned ispeed = PTY_BAUD;
    unsigned ospeed = PTY_BAUD;
};

// Everything a session reports once the remote command is done.
struct SessionRun {
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_status;          // exit-status request seen
    std::optional<std::string> exit_signal;  // exit-signal request seen (name, no "SIG")
    std::optional<Error> error;              // transport failure while running
};

// exit-signal names to numbers, reported as 128 + number the way a shell
// would. Unknown names map to 128.
int exit_code_for_signal(const std::string& signal_name);

// One command's worth of remote execution, single use: stdin, pty, run, close.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Bytes written to the command's stdin after it starts, followed by EOF.
    virtual void set_stdin(std::string data) = 0;

    virtual Result<void> request_pty(const PtyRequest& pty) = 0;

    // Blocks until the remote side closes the channel.
    virtual SessionRun run(const std::string& command) = 0;

    // Ok when the channel closed cleanly or was already at end of stream.
    virtual Result<void> close() = 0;
};

// One authenticated connection to a server.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<RemoteSession>> open_session() = 0;
    virtual Result<void> close() = 0;
    virtual bool is_open() const = 0;

    // "user@host:port", for logs
    virtual std::string describe() const = 0;
};

struct DialOptions {
    int timeout_secs = DIAL_TIMEOUT_SECS;
};

class Dialer {
public:
    virtual ~Dialer() = default;

    virtual Result<std::unique_ptr<Transport>> dial(const Server& server,
                                                    const DialOptions& options) = 0;
};
