#pragma once

#include <string>
#include <core/resource.hpp>
#include <core/server.hpp>
#include <core/types.hpp>

class ConnectionManager;
class CommandExecutor;

// "stat -c '%i' <path>; cat <path>", each half prefixed with "sudo " when
// privileged. The path is shell-quoted unless it is a plain word.
std::string build_combined_command(const std::string& path, bool privileged);

// Split combined-command stdout into state. Line 0 is the PTY artifact
// (typically empty once the sudo echo is scrubbed), line 1 the inode, the
// rest the file body. A trailing "\r" on each line and the newline ending the
// output are dropped. Fewer than two lines is a Command error.
Result<ResourceState> parse_resource_output(const std::string& stdout_data,
                                            const std::string& address, bool sensitive);

// Derives a remote file's identity and content in one round trip.
class FileResolver {
public:
    FileResolver(ConnectionManager& connections, CommandExecutor& executor);

    Result<ResourceState> resolve(const std::string& path, bool privileged, bool sensitive,
                                  Server& server);

private:
    ConnectionManager& connections_;
    CommandExecutor& executor_;
};
