#pragma once

#include <string>
#include <vector>
#include <core/server.hpp>
#include <core/types.hpp>

// What kind of credential an auth attempt presents
enum class AuthKind {
    PASSWORD,
    PUBLIC_KEY,
};

// A private key that looked usable as a signing credential
struct PrivateKey {
    std::string format;   // "openssh", "rsa", "ec", "dsa", "pkcs8"
    std::string pem;
};

// One entry of the ordered method list tried during authentication
struct AuthMethod {
    AuthKind kind;
    std::string password;   // PASSWORD
    PrivateKey key;         // PUBLIC_KEY
};

// Framing and passphrase check only: the bytes must hold one PEM block with
// a known private key label and a non-empty body, and must not be
// passphrase protected (there is no passphrase to give). For OpenSSH keys
// the cipher field is read; other bodies are not decoded. Whether the key
// can actually sign is found out by libssh2 at authentication time.
Result<PrivateKey> parse_private_key(const std::string& material);

// Build the auth method list for a server, in the order they are tried:
// password first (if set), then the private key (if a path is set).
// Reading or parsing the key fails the whole build with a Connection error.
Result<std::vector<AuthMethod>> build_auth_methods(const Server& server);

const char* auth_kind_name(AuthKind kind);
