#include "server.hpp"
#include <fmt/format.h>

std::string Server::full_address() const {
    // Bracket IPv6 literals so the port separator stays unambiguous
    if (address.find(':') != std::string::npos) {
        return fmt::format("[{}]:{}", address, port);
    }
    return fmt::format("{}:{}", address, port);
}
