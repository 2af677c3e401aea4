#pragma once

#include <memory>
#include <functional>
#include <string>
#include <core/types.hpp>
#include "remote_shell.hpp"
#include "backend_selector.hpp"

// Builds the driver for a chosen backend. Tests swap in fakes here.
using ShellFactory = std::function<Result<std::unique_ptr<RemoteShell>>(
    Backend, const TransferRequest&, const TransferSettings&)>;

// Where a transfer runs: the local OS and the tools found on it
struct RunEnvironment {
    platform::HostOs os;
    ToolAvailability tools;
};

// Entry point for one upload: checks the local file, picks a backend and
// hands the buffer to a ChunkedUploader. Never throws.
class TransferRunner {
public:
    explicit TransferRunner(TransferSettings settings = TransferSettings{},
                            ShellFactory factory = nullptr);

    void on_progress(ProgressCallback callback) { progress_ = std::move(callback); }
    void on_status(StatusCallback callback) { status_ = std::move(callback); }

    // Detects the environment, then runs.
    TransferResult run(const TransferRequest& req);
    TransferResult run(const TransferRequest& req, const RunEnvironment& env);

    const TransferSettings& settings() const { return settings_; }

private:
    TransferSettings settings_;
    ShellFactory factory_;
    ProgressCallback progress_;
    StatusCallback status_;

    TransferResult attempt(Backend backend, const TransferRequest& req, const std::string& data);
    void status(const std::string& msg) const;
};

// Read a whole local file as bytes.
Result<std::string> read_local_file(const std::string& path);
