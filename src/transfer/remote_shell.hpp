#pragma once

#include <string>
#include <core/types.hpp>

// A remote POSIX shell the uploader can drive, whatever carries it.
//
// Implementations release their session or process in the destructor, so
// an early return anywhere in a transfer still tears the connection down.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    // Connect and authenticate. Nothing is sent before this succeeds.
    virtual SSHResult open(StatusCallback callback = nullptr) = 0;

    // Run a command whose output is not needed. Drivers that can see the
    // exit status report it; pipe drivers report only delivery.
    virtual SSHResult send(const std::string& command) = 0;

    // Run a command and return its stdout.
    virtual SSHResult query(const std::string& command) = 0;

    // End the session. Pipe drivers send "exit" and wait a bounded time.
    virtual SSHResult close() = 0;

    // True when send() reflects the remote command's exit status.
    virtual bool reports_exit_status() const = 0;
};
