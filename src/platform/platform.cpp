#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

Result<std::string> read_file(const fs::path& path) {
    if (!file_exists(path)) {
        return Result<std::string>::Err(ErrorKind::FileNotFound,
                                        "File " + path.string() + " not found");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::Err(ErrorKind::Io,
                                        "Cannot read file " + path.string() + ": " +
                                        std::strerror(errno));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::Err(ErrorKind::Io,
                                        "Error while reading " + path.string());
    }
    return Result<std::string>::Ok(std::move(content));
}

} // namespace platform
