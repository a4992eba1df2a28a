#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp directory.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

bool file_exists(const std::filesystem::path& path);

// Read a whole file as bytes. FileNotFound when it does not exist, Io when
// it exists but cannot be read.
Result<std::string> read_file(const std::filesystem::path& path);

} // namespace platform
