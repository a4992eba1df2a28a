#include "channel.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <cstdint>
#include <cstring>

// ── Terminal modes ───────────────────────────────────────────────────

namespace {

constexpr unsigned char TTY_OP_END    = 0;
constexpr unsigned char TTY_OP_ECHO   = 53;
constexpr unsigned char TTY_OP_ISPEED = 128;
constexpr unsigned char TTY_OP_OSPEED = 129;

void put_mode(std::string& out, unsigned char opcode, uint32_t value) {
    out += static_cast<char>(opcode);
    out += static_cast<char>((value >> 24) & 0xFF);
    out += static_cast<char>((value >> 16) & 0xFF);
    out += static_cast<char>((value >> 8) & 0xFF);
    out += static_cast<char>(value & 0xFF);
}

// Returned by locked_call once the transport underneath was shut down
constexpr int TRANSPORT_GONE = LIBSSH2_ERROR_SOCKET_DISCONNECT;

// Run one libssh2 call under the transport's I/O lock.
template <typename Op>
auto locked_call(SshHandle& h, Op op) -> decltype(op()) {
    std::lock_guard<std::mutex> lock(h.io_mutex);
    if (!h.alive_locked()) return TRANSPORT_GONE;
    return op();
}

} // namespace

std::string encode_terminal_modes(const PtyRequest& pty) {
    std::string modes;
    put_mode(modes, TTY_OP_ECHO, pty.echo ? 1 : 0);
    put_mode(modes, TTY_OP_ISPEED, pty.ispeed);
    put_mode(modes, TTY_OP_OSPEED, pty.ospeed);
    modes += static_cast<char>(TTY_OP_END);
    return modes;
}

// ── SshChannelSession ────────────────────────────────────────────────

SshChannelSession::SshChannelSession(std::shared_ptr<SshHandle> handle, LIBSSH2_CHANNEL* channel)
    : handle_(std::move(handle)), channel_(channel) {
}

SshChannelSession::~SshChannelSession() {
    free_channel();
}

void SshChannelSession::set_stdin(std::string data) {
    stdin_data_ = std::move(data);
}

Result<void> SshChannelSession::request_pty(const PtyRequest& pty) {
    std::string modes = encode_terminal_modes(pty);
    while (true) {
        int rc = locked_call(*handle_, [&] {
            return libssh2_channel_request_pty_ex(
                channel_, pty.term.c_str(), static_cast<unsigned int>(pty.term.length()),
                modes.data(), static_cast<unsigned int>(modes.length()),
                pty.width_cols, pty.height_rows, 0, 0);
        });
        if (rc == 0) return Result<void>::Ok();
        if (rc == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed before pty request");
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            return Result<void>::Err(ErrorKind::Session,
                                     "request for pseudo terminal failed: " + handle_->last_error_locked());
        }
        handle_->wait_socket(1000);
    }
}

Result<void> SshChannelSession::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = locked_call(*handle_, [&] {
            return libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        });
        if (w == LIBSSH2_ERROR_EAGAIN) {
            handle_->wait_socket(1000);
            continue;
        }
        if (w == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed while writing stdin");
        }
        if (w < 0) {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            return Result<void>::Err(ErrorKind::Connection,
                                     "channel write error: " + handle_->last_error_locked());
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> SshChannelSession::send_eof() {
    while (true) {
        int rc = locked_call(*handle_, [&] { return libssh2_channel_send_eof(channel_); });
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            handle_->wait_socket(1000);
            continue;
        }
        if (rc == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed while sending EOF");
        }
        // Remote already closed its side; nothing left to signal
        return Result<void>::Ok();
    }
}

Result<void> SshChannelSession::read_until_eof(std::string& out, std::string& err) {
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        ssize_t n_out = locked_call(*handle_, [&] {
            return libssh2_channel_read(channel_, buf, sizeof(buf));
        });
        if (n_out > 0) {
            out.append(buf, static_cast<size_t>(n_out));
            continue;
        }

        ssize_t n_err = locked_call(*handle_, [&] {
            return libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        });
        if (n_err > 0) {
            err.append(buf, static_cast<size_t>(n_err));
            continue;
        }

        if (n_out == TRANSPORT_GONE || n_err == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed while reading output");
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            return Result<void>::Err(ErrorKind::Connection,
                                     "channel read error: " + handle_->last_error_locked());
        }

        int eof = locked_call(*handle_, [&] { return libssh2_channel_eof(channel_); });
        if (eof == 1) return Result<void>::Ok();
        if (eof == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed while reading output");
        }

        handle_->wait_socket(1000);
    }
}

Result<void> SshChannelSession::wait_closed() {
    while (true) {
        int rc = locked_call(*handle_, [&] { return libssh2_channel_close(channel_); });
        if (rc == 0) break;
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            handle_->wait_socket(1000);
            continue;
        }
        if (rc == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed before exit status");
        }
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        return Result<void>::Err(ErrorKind::Connection,
                                 "channel close failed: " + handle_->last_error_locked());
    }

    while (true) {
        int rc = locked_call(*handle_, [&] { return libssh2_channel_wait_closed(channel_); });
        if (rc == 0) break;
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            handle_->wait_socket(1000);
            continue;
        }
        if (rc == TRANSPORT_GONE) {
            return Result<void>::Err(ErrorKind::Connection, "connection closed before exit status");
        }
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        return Result<void>::Err(ErrorKind::Connection,
                                 "waiting for channel close failed: " + handle_->last_error_locked());
    }

    remote_closed_ = true;
    return Result<void>::Ok();
}

void SshChannelSession::collect_exit(SessionRun& run) {
    std::lock_guard<std::mutex> lock(handle_->io_mutex);
    if (!handle_->alive_locked()) return;

    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel_, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal) {
        run.exit_signal = std::string(signal, signal_len);
        libssh2_free(handle_->session, signal);
        return;
    }

    run.exit_status = libssh2_channel_get_exit_status(channel_);
}

SessionRun SshChannelSession::run(const std::string& command) {
    SessionRun run;

    while (true) {
        int rc = locked_call(*handle_, [&] { return libssh2_channel_exec(channel_, command.c_str()); });
        if (rc == 0) break;
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            handle_->wait_socket(1000);
            continue;
        }
        if (rc == TRANSPORT_GONE) {
            run.error = Error::make(ErrorKind::Connection, "connection closed before command start");
            return run;
        }
        std::lock_guard<std::mutex> lock(handle_->io_mutex);
        run.error = Error::make(ErrorKind::Connection,
                                "failed to start command: " + handle_->last_error_locked());
        return run;
    }

    if (!stdin_data_.empty()) {
        auto written = write_all(stdin_data_);
        if (written.is_err()) {
            run.error = written.error;
            return run;
        }
    }
    auto eof = send_eof();
    if (eof.is_err()) {
        run.error = eof.error;
        return run;
    }

    auto read = read_until_eof(run.stdout_data, run.stderr_data);
    if (read.is_err()) {
        run.error = read.error;
        return run;
    }

    auto closed = wait_closed();
    if (closed.is_err()) {
        run.error = closed.error;
        return run;
    }

    collect_exit(run);
    return run;
}

Result<void> SshChannelSession::close() {
    if (!channel_) return Result<void>::Ok();

    Result<void> result = Result<void>::Ok();
    if (!remote_closed_) {
        while (true) {
            int rc = locked_call(*handle_, [&] { return libssh2_channel_close(channel_); });
            if (rc == 0) break;
            if (rc == LIBSSH2_ERROR_EAGAIN) {
                handle_->wait_socket(1000);
                continue;
            }
            if (rc == TRANSPORT_GONE) {
                result = Result<void>::Err(ErrorKind::Connection, "connection already closed");
                break;
            }
            std::lock_guard<std::mutex> lock(handle_->io_mutex);
            result = Result<void>::Err(ErrorKind::Session,
                                       "channel close failed: " + handle_->last_error_locked());
            break;
        }
    }

    free_channel();
    return result;
}

void SshChannelSession::free_channel() {
    if (!channel_) return;
    std::lock_guard<std::mutex> lock(handle_->io_mutex);
    // After session shutdown the channel was freed along with the session
    if (handle_->alive_locked()) {
        libssh2_channel_free(channel_);
    }
    channel_ = nullptr;
}
