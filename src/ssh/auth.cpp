#include "auth.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <cstdint>
#include <fmt/format.h>

// ── PEM framing ──────────────────────────────────────────────────────

struct PemLabel {
    const char* label;
    const char* format;
};

static const PemLabel KNOWN_LABELS[] = {
    {"OPENSSH PRIVATE KEY", "openssh"},
    {"RSA PRIVATE KEY",     "rsa"},
    {"EC PRIVATE KEY",      "ec"},
    {"DSA PRIVATE KEY",     "dsa"},
    {"PRIVATE KEY",         "pkcs8"},
};

static const char OPENSSH_MAGIC[] = "openssh-key-v1";

// Body between the BEGIN and END lines for a label; false if either is missing.
static bool extract_pem_body(const std::string& material, const std::string& label,
                             std::string& body) {
    std::string begin = "-----BEGIN " + label + "-----";
    std::string end = "-----END " + label + "-----";

    auto b = material.find(begin);
    if (b == std::string::npos) return false;
    auto body_start = b + begin.size();
    auto e = material.find(end, body_start);
    if (e == std::string::npos) return false;

    body = material.substr(body_start, e - body_start);
    return true;
}

static uint32_t read_u32(const std::string& blob, size_t pos) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(blob[pos])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(blob[pos + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(blob[pos + 2])) << 8) |
           static_cast<uint32_t>(static_cast<unsigned char>(blob[pos + 3]));
}

// openssh-key-v1 layout: magic "\0", string ciphername, string kdfname, ...
static Result<void> check_openssh_blob(const std::string& body) {
    std::string blob = base64_decode(body);
    size_t magic_len = sizeof(OPENSSH_MAGIC);   // includes the NUL terminator
    if (blob.size() < magic_len + 4 ||
        blob.compare(0, magic_len, std::string(OPENSSH_MAGIC, magic_len)) != 0) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "invalid openssh private key (bad magic)");
    }

    uint32_t cipher_len = read_u32(blob, magic_len);
    if (blob.size() < magic_len + 4 + cipher_len) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "invalid openssh private key (truncated)");
    }

    std::string cipher = blob.substr(magic_len + 4, cipher_len);
    if (cipher != "none") {
        return Result<void>::Err(ErrorKind::Connection,
                                 fmt::format("private key is passphrase protected ({})", cipher));
    }
    return Result<void>::Ok();
}

Result<PrivateKey> parse_private_key(const std::string& material) {
    std::string body;
    if (extract_pem_body(material, "ENCRYPTED PRIVATE KEY", body)) {
        return Result<PrivateKey>::Err(ErrorKind::Connection,
                                       "private key is passphrase protected");
    }

    for (const auto& known : KNOWN_LABELS) {
        if (!extract_pem_body(material, known.label, body)) continue;

        if (body.find("Proc-Type: 4,ENCRYPTED") != std::string::npos) {
            return Result<PrivateKey>::Err(ErrorKind::Connection,
                                           "private key is passphrase protected");
        }

        if (std::string(known.format) == "openssh") {
            auto check = check_openssh_blob(body);
            if (check.is_err()) return Result<PrivateKey>::Err(check.error);
        } else if (trimmed(body).empty()) {
            return Result<PrivateKey>::Err(ErrorKind::Connection,
                                           "invalid private key (empty body)");
        }

        return Result<PrivateKey>::Ok(PrivateKey{known.format, material});
    }

    return Result<PrivateKey>::Err(ErrorKind::Connection, "no private key found in key material");
}

Result<std::vector<AuthMethod>> build_auth_methods(const Server& server) {
    std::vector<AuthMethod> methods;

    if (server.has_password()) {
        AuthMethod m;
        m.kind = AuthKind::PASSWORD;
        m.password = *server.password;
        methods.push_back(std::move(m));
    }

    if (server.has_private_key()) {
        std::string path = expand_user_path(*server.private_key_path);
        auto material = platform::read_file(path);
        if (material.is_err()) {
            return Result<std::vector<AuthMethod>>::Err(
                ErrorKind::Connection,
                fmt::format("unable to read private key {}: {}", path, material.error.message));
        }

        auto key = parse_private_key(material.value);
        if (key.is_err()) {
            return Result<std::vector<AuthMethod>>::Err(
                ErrorKind::Connection,
                fmt::format("unable to parse private key {}: {}", path, key.error.message));
        }

        AuthMethod m;
        m.kind = AuthKind::PUBLIC_KEY;
        m.key = std::move(key.value);
        methods.push_back(std::move(m));
    }

    return Result<std::vector<AuthMethod>>::Ok(std::move(methods));
}

const char* auth_kind_name(AuthKind kind) {
    switch (kind) {
    case AuthKind::PASSWORD:   return "password";
    case AuthKind::PUBLIC_KEY: return "publickey";
    }
    return "unknown";
}
