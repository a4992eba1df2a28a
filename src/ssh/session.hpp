#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/server.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "auth.hpp"
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// The libssh2 session and its socket, shared between a transport and every
// channel opened on it. Once shut down, `session` is null and channels must
// not touch their channel pointers: libssh2_session_free already released them.
struct SshHandle {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = REXEC_INVALID_SOCKET;
    std::mutex io_mutex;

    SshHandle() = default;
    SshHandle(const SshHandle&) = delete;
    SshHandle& operator=(const SshHandle&) = delete;
    ~SshHandle();

    // Disconnect, free the session and close the socket. Caller holds io_mutex.
    void shutdown_locked(const char* reason);

    bool alive_locked() const { return session != nullptr; }

    // Block until the socket is ready in whichever direction libssh2 last
    // wanted, or timeout_ms elapses.
    void wait_socket(int timeout_ms);

    // Most recent libssh2 error text. Caller holds io_mutex.
    std::string last_error_locked() const;
};

class SshTransport : public Transport {
public:
    SshTransport(const Server& server, std::vector<AuthMethod> auth_methods);
    ~SshTransport() override;

    // Connect, handshake and authenticate within options.timeout_secs.
    Result<void> establish(const DialOptions& options);

    Result<std::unique_ptr<RemoteSession>> open_session() override;
    Result<void> close() override;
    bool is_open() const override;
    std::string describe() const override;

private:
    std::string target_str_;
    std::string name_;
    std::string user_;
    std::string address_;
    int port_;
    std::vector<AuthMethod> auth_methods_;
    std::shared_ptr<SshHandle> handle_;

    using Deadline = std::chrono::steady_clock::time_point;

    Result<void> handshake(Deadline deadline);
    Result<void> authenticate(Deadline deadline);
    void record_host_fingerprint();
    void configure_keepalive();
};

// Production dialer: one SshTransport per successful dial.
class SshDialer : public Dialer {
public:
    Result<std::unique_ptr<Transport>> dial(const Server& server,
                                            const DialOptions& options) override;
};
