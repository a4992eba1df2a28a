#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

} // namespace

std::string rexec_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_rexec_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void rexec_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

void rexec_log_cmd(const std::string& label, const CommandResult& r, bool redact) {
    rexec_log(fmt::format("{} CMD: {}", label, r.command));
    if (redact) {
        rexec_log(fmt::format("{} exit={} stdout({})=<redacted> stderr({})",
                              label, r.exit_code, r.stdout_data.size(), r.stderr_data.size()));
        return;
    }
    rexec_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                          r.stdout_data.size(),
                          r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW_BYTES)));
    if (!r.stderr_data.empty())
        rexec_log(fmt::format("{} stderr={}", label,
                              r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW_BYTES)));
}
