#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <core/types.hpp>
#include "remote_shell.hpp"
#include "pipe_shell.hpp"
#include "chunked_uploader.hpp"

// Per-backend chunking and pacing, before any settings are applied
struct BackendProfile {
    std::size_t chunk_size;
    std::size_t progress_interval;
    int settle_ms;            // pipe drivers only
    int truncate_delay_ms;
    int chunk_delay_ms;
    int exit_timeout_secs;    // pipe drivers only
};

BackendProfile backend_profile(Backend backend);

// Upload options for backend with settings applied (chunk size override,
// pacing switch, failure and verification policy).
UploadOptions upload_options(Backend backend, const TransferSettings& settings);

// ssh -p <port> -o StrictHostKeyChecking=no [-o BatchMode=yes] [-i key] -T user@host
PipeCommand openssh_command(const TransferRequest& req, const std::string& ssh_program,
                            bool batch_mode);

// sshpass -e wrapping openssh_command; the password travels in SSHPASS.
PipeCommand password_helper_command(const TransferRequest& req, const std::string& helper,
                                    const std::string& ssh_program);

// Construct the driver for backend. Fails without connecting when the
// backend cannot serve the request (native OpenSSH with a password).
Result<std::unique_ptr<RemoteShell>> make_remote_shell(Backend backend,
                                                       const TransferRequest& req,
                                                       const TransferSettings& settings);
