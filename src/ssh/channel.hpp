#pragma once

#include <memory>
#include <string>
#include "session.hpp"
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RFC 4254 §8 encoded terminal modes: opcode byte + uint32 value per mode,
// terminated by TTY_OP_END.
std::string encode_terminal_modes(const PtyRequest& pty);

// A "session" channel running exactly one command.
class SshChannelSession : public RemoteSession {
public:
    SshChannelSession(std::shared_ptr<SshHandle> handle, LIBSSH2_CHANNEL* channel);
    ~SshChannelSession() override;

    SshChannelSession(const SshChannelSession&) = delete;
    SshChannelSession& operator=(const SshChannelSession&) = delete;

    void set_stdin(std::string data) override;
    Result<void> request_pty(const PtyRequest& pty) override;
    SessionRun run(const std::string& command) override;
    Result<void> close() override;

private:
    std::shared_ptr<SshHandle> handle_;
    LIBSSH2_CHANNEL* channel_;
    std::string stdin_data_;
    bool remote_closed_ = false;

    Result<void> write_all(const std::string& data);
    Result<void> send_eof();
    Result<void> read_until_eof(std::string& out, std::string& err);
    Result<void> wait_closed();
    void collect_exit(SessionRun& run);
    void free_channel();
};
