#include "session.hpp"
#include "channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>

// ── libssh2 global init ──────────────────────────────────────────────

static Result<void> ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Connection, "Failed to initialize libssh2");
    }
    return Result<void>::Ok();
}

// ── SshHandle ────────────────────────────────────────────────────────

SshHandle::~SshHandle() {
    std::lock_guard<std::mutex> lock(io_mutex);
    shutdown_locked("Normal disconnection");
}

void SshHandle::shutdown_locked(const char* reason) {
    if (session) {
        // Non-blocking disconnect: one attempt, the socket goes away next anyway
        libssh2_session_disconnect(session, reason);
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != REXEC_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = REXEC_INVALID_SOCKET;
    }
}

void SshHandle::wait_socket(int timeout_ms) {
    short events = 0;
    socket_t fd;
    {
        std::lock_guard<std::mutex> lock(io_mutex);
        if (!session || sock == REXEC_INVALID_SOCKET) return;
        int dir = libssh2_session_block_directions(session);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
        fd = sock;
    }
    if (events == 0) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        return;
    }
    platform::poll_socket(fd, events, timeout_ms);
}

std::string SshHandle::last_error_locked() const {
    if (!session) return "session closed";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

// ── Keyboard-interactive ─────────────────────────────────────────────

// Some servers only offer keyboard-interactive; answer every prompt with the
// password, same as password auth would have sent.
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// ── SshTransport ─────────────────────────────────────────────────────

SshTransport::SshTransport(const Server& server, std::vector<AuthMethod> auth_methods)
    : target_str_(server.user + "@" + server.full_address()),
      name_(server.name), user_(server.user), address_(server.address), port_(server.port),
      auth_methods_(std::move(auth_methods)),
      handle_(std::make_shared<SshHandle>()) {
}

SshTransport::~SshTransport() {
    close();
}

Result<void> SshTransport::establish(const DialOptions& options) {
    auto init = ensure_libssh2_init();
    if (init.is_err()) return init;

    if (auth_methods_.empty()) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "no authentication method configured for " + name_ +
                                 " (set a password or a private key)");
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.timeout_secs);

    auto sock = platform::connect_tcp(address_, port_, platform::remaining_ms(deadline));
    if (sock.is_err()) return Result<void>::Err(sock.error);

    {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        handle_->sock = sock.value;
        handle_->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
        if (!handle_->session) {
            handle_->shutdown_locked("Init failed");
            return Result<void>::Err(ErrorKind::Connection, "Failed to create SSH session");
        }
        libssh2_session_set_blocking(handle_->session, 0);
    }

    auto hs = handshake(deadline);
    if (hs.is_err()) {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        handle_->shutdown_locked("Handshake failed");
        return hs;
    }

    record_host_fingerprint();
    configure_keepalive();

    auto auth = authenticate(deadline);
    if (auth.is_err()) {
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        handle_->shutdown_locked("Authentication failed");
        return auth;
    }

    rexec_log(fmt::format("[ssh] connected {} ({})", target_str_, name_));
    return Result<void>::Ok();
}

Result<void> SshTransport::handshake(Deadline deadline) {
    while (true) {
        int ret;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            ret = libssh2_session_handshake(handle_->session, handle_->sock);
        }
        if (ret == 0) return Result<void>::Ok();
        if (ret != LIBSSH2_ERROR_EAGAIN) {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            return Result<void>::Err(ErrorKind::Connection,
                                     "SSH handshake failed: " + handle_->last_error_locked());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<void>::Err(ErrorKind::Connection,
                                     "SSH handshake timed out: " + target_str_);
        }
        handle_->wait_socket(100);
    }
}

void SshTransport::record_host_fingerprint() {
    std::lock_guard<std::mutex> lock(handle_->io_mutex);
    const char* hash = libssh2_hostkey_hash(handle_->session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) {
        rexec_log(fmt::format("[ssh] WARNING: host key of {} not verified (no SHA256 hash available)",
                              target_str_));
        return;
    }

    std::string fp = base64_encode(std::string(hash, 32));
    while (!fp.empty() && fp.back() == '=') fp.pop_back();
    std::string fingerprint = "SHA256:" + fp;

    // Host identity is accepted without checking any trust store
    rexec_log(fmt::format("[ssh] WARNING: accepting unverified host key {} for {}",
                          fingerprint, target_str_));
}

void SshTransport::configure_keepalive() {
    std::lock_guard<std::mutex> lock(handle_->io_mutex);

    int tcp_keepalive = 1;
    setsockopt(handle_->sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(handle_->sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    int keepintvl = 15;
    setsockopt(handle_->sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif

    // SSH keepalive every 30s
    libssh2_keepalive_config(handle_->session, 1, 30);
}

Result<void> SshTransport::authenticate(Deadline deadline) {
    // Ask which methods the server offers. A null list with no error means
    // the server accepted "none" auth outright.
    std::string offered;
    while (true) {
        char* list = nullptr;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            list = libssh2_userauth_list(handle_->session, user_.c_str(),
                                         static_cast<unsigned int>(user_.length()));
            if (list) {
                offered = list;
            } else if (libssh2_userauth_authenticated(handle_->session)) {
                return Result<void>::Ok();
            } else {
                err = libssh2_session_last_errno(handle_->session);
            }
        }
        if (list) break;
        if (err != LIBSSH2_ERROR_EAGAIN) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<void>::Err(ErrorKind::Connection, "Authentication timed out: " + target_str_);
        }
        handle_->wait_socket(100);
    }

    auto offers = [&](const char* m) {
        return offered.empty() || offered.find(m) != std::string::npos;
    };

    std::vector<std::string> tried;
    std::string last_error;

    for (const auto& method : auth_methods_) {
        int ret = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
        KbdAuthData kbd_data{method.password, 0};

        while (true) {
            {
                std::lock_guard<std::mutex> lock(handle_->io_mutex);
                if (method.kind == AuthKind::PASSWORD && offers("password")) {
                    ret = libssh2_userauth_password(handle_->session, user_.c_str(),
                                                    method.password.c_str());
                } else if (method.kind == AuthKind::PASSWORD && offers("keyboard-interactive")) {
                    *libssh2_session_abstract(handle_->session) = &kbd_data;
                    ret = libssh2_userauth_keyboard_interactive(handle_->session, user_.c_str(),
                                                                kbd_callback);
                } else if (method.kind == AuthKind::PUBLIC_KEY && offers("publickey")) {
                    ret = libssh2_userauth_publickey_frommemory(
                        handle_->session, user_.c_str(), user_.length(),
                        nullptr, 0,
                        method.key.pem.c_str(), method.key.pem.length(),
                        nullptr);
                } else {
                    ret = LIBSSH2_ERROR_METHOD_NOT_SUPPORTED;
                    last_error = fmt::format("{} not offered by server", auth_kind_name(method.kind));
                }
                if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN &&
                    ret != LIBSSH2_ERROR_METHOD_NOT_SUPPORTED) {
                    last_error = handle_->last_error_locked();
                }
            }
            if (ret != LIBSSH2_ERROR_EAGAIN) break;
            if (std::chrono::steady_clock::now() >= deadline) {
                return Result<void>::Err(ErrorKind::Connection,
                                         "Authentication timed out: " + target_str_);
            }
            handle_->wait_socket(100);
        }

        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            *libssh2_session_abstract(handle_->session) = nullptr;
        }

        tried.push_back(auth_kind_name(method.kind));
        if (ret == 0) {
            rexec_log(fmt::format("[ssh] {} authenticated with {}", target_str_,
                                  auth_kind_name(method.kind)));
            return Result<void>::Ok();
        }
    }

    std::string tried_list;
    for (const auto& t : tried) {
        if (!tried_list.empty()) tried_list += ", ";
        tried_list += t;
    }
    return Result<void>::Err(ErrorKind::Connection,
                             fmt::format("authentication failed for {} (tried {}; server offers {}): {}",
                                         target_str_, tried_list,
                                         offered.empty() ? "unknown" : offered, last_error));
}

Result<std::unique_ptr<RemoteSession>> SshTransport::open_session() {
    using SessionResult = Result<std::unique_ptr<RemoteSession>>;

    while (true) {
        LIBSSH2_CHANNEL* ch = nullptr;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            if (!handle_->alive_locked()) {
                return SessionResult::Err(ErrorKind::Connection,
                                          "connection to " + target_str_ + " is closed");
            }
            ch = libssh2_channel_open_session(handle_->session);
            if (!ch) {
                err = libssh2_session_last_errno(handle_->session);
                if (err != LIBSSH2_ERROR_EAGAIN) {
                    return SessionResult::Err(ErrorKind::Session,
                                              "Failed to open session channel: " +
                                              handle_->last_error_locked());
                }
            }
        }
        if (ch) {
            return SessionResult::Ok(std::make_unique<SshChannelSession>(handle_, ch));
        }
        handle_->wait_socket(1000);
    }
}

Result<void> SshTransport::close() {
    std::lock_guard<std::mutex> lock(handle_->io_mutex);
    if (handle_->alive_locked()) {
        rexec_log(fmt::format("[ssh] closing {}", target_str_));
    }
    handle_->shutdown_locked("Normal disconnection");
    return Result<void>::Ok();
}

bool SshTransport::is_open() const {
    std::lock_guard<std::mutex> lock(handle_->io_mutex);
    return handle_->alive_locked();
}

std::string SshTransport::describe() const {
    return target_str_;
}

// ── SshDialer ────────────────────────────────────────────────────────

Result<std::unique_ptr<Transport>> SshDialer::dial(const Server& server,
                                                   const DialOptions& options) {
    using DialResult = Result<std::unique_ptr<Transport>>;

    auto methods = build_auth_methods(server);
    if (methods.is_err()) return DialResult::Err(methods.error);

    auto transport = std::make_unique<SshTransport>(server, std::move(methods.value));
    auto established = transport->establish(options);
    if (established.is_err()) return DialResult::Err(established.error);

    return DialResult::Ok(std::move(transport));
}
