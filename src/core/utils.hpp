#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Split on '\n'. Every separator produces a boundary, so "a\n" yields
// {"a", ""} and "" yields {""}.
std::vector<std::string> split_lines(const std::string& text);

// Inverse of split_lines.
std::string join_lines(const std::vector<std::string>& lines);

// Quote a value for a POSIX shell command line ('...' with embedded quotes escaped).
std::string shell_quote(const std::string& s);

// shell_quote for a remote path, leaving a leading "~" or "~user" prefix
// unquoted so the remote shell still expands it.
std::string shell_quote_path(const std::string& path);

// Standard base64 (RFC 4648). Decoding skips whitespace and stops at '='
// or the first invalid character.
std::string base64_encode(const std::string& input);
std::string base64_decode(const std::string& input);

// Expand a leading "~/" to the user's home directory.
std::string expand_user_path(const std::string& path);
