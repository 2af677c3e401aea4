#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "remote_shell.hpp"

struct UploadOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t progress_interval = DEFAULT_PROGRESS_INTERVAL;
    int truncate_delay_ms = 0;         // pause after the truncate command
    int chunk_delay_ms = 0;            // pause after every append
    bool abort_on_chunk_failure = true;
    bool strict_verify = false;
};

struct SizeCheck {
    bool ok;
    std::optional<std::uint64_t> remote_size;
    std::string message;
};

// Compare a "wc -c" reply with the local length. A failed query always
// fails; a successful but unparsable reply passes unless strict is set.
SizeCheck verify_remote_size(const SSHResult& reply, std::size_t local_size, bool strict);

// Streams a buffer into a remote file through any RemoteShell:
// truncate, one printf append per chunk, then a byte-count check.
class ChunkedUploader {
public:
    explicit ChunkedUploader(UploadOptions options = UploadOptions{});

    void on_progress(ProgressCallback callback) { progress_ = std::move(callback); }
    void on_status(StatusCallback callback) { status_ = std::move(callback); }

    // Drives shell through open → truncate → stream → verify → close.
    // The shell is always closed before returning.
    TransferResult upload(RemoteShell& shell, const std::string& data,
                          const std::string& remote_path);

    const UploadOptions& options() const { return options_; }

private:
    UploadOptions options_;
    ProgressCallback progress_;
    StatusCallback status_;

    void status(const std::string& msg) const;
};
