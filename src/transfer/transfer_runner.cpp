#include "transfer_runner.hpp"
#include "backend_factory.hpp"
#include "chunked_uploader.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

Result<std::string> read_local_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string>::Err("Local file not found: " + path);
    }
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::string>::Err("Not a regular file: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot open local file: " + path);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::Err("Error reading local file: " + path);
    }
    return Result<std::string>::Ok(std::move(data));
}

TransferRunner::TransferRunner(TransferSettings settings, ShellFactory factory)
    : settings_(std::move(settings)), factory_(std::move(factory)) {
    if (!factory_) factory_ = make_remote_shell;
}

void TransferRunner::status(const std::string& msg) const {
    shellpush_log(msg);
    if (status_) status_(msg);
}

TransferResult TransferRunner::run(const TransferRequest& req) {
    RunEnvironment env{platform::host_os(), detect_tools(settings_)};
    return run(req, env);
}

TransferResult TransferRunner::run(const TransferRequest& req, const RunEnvironment& env) {
    TransferResult result;

    auto fail = [&](const std::string& error) {
        result.success = false;
        result.phase = TransferPhase::FAILURE;
        result.error = error;
        status(error);
        return result;
    };

    if (req.host.empty()) return fail("No host given");
    if (req.remote_path.empty()) return fail("No remote path given");

    auto data = read_local_file(req.local_path);
    if (data.is_err()) return fail(data.error);
    result.local_size = data.value.size();

    shellpush_log(fmt::format("push {} ({} bytes) -> {}@{}:{}:{}", req.local_path,
                              data.value.size(), req.user, req.host, req.port,
                              req.remote_path));

    auto candidates = select_backends(env.os, env.tools, req.password.has_value(),
                                      settings_.forced_backend);
    if (candidates.empty()) {
        // Only reachable with a forced backend; raw-pipe is otherwise always usable
        std::string name = settings_.forced_backend
            ? backend_name(*settings_.forced_backend) : "any";
        return fail("Backend " + name + " is not available on this machine");
    }

    // The first usable backend decides the outcome; a failed transfer is
    // not retried elsewhere since the remote file may be half written.
    return attempt(candidates.front(), req, data.value);
}

TransferResult TransferRunner::attempt(Backend backend, const TransferRequest& req,
                                       const std::string& data) {
    TransferResult result;
    result.backend = backend;
    result.local_size = data.size();

    status(std::string("Using ") + backend_name(backend) + " backend");

    try {
        auto shell = factory_(backend, req, settings_);
        if (shell.is_err()) {
            result.phase = TransferPhase::FAILURE;
            result.error = shell.error;
            status(shell.error);
            return result;
        }

        ChunkedUploader uploader(upload_options(backend, settings_));
        uploader.on_progress(progress_);
        uploader.on_status(status_);
        result = uploader.upload(*shell.value, data, req.remote_path);
        result.backend = backend;
    } catch (const std::exception& e) {
        result.success = false;
        result.phase = TransferPhase::FAILURE;
        result.error = std::string("Transfer failed: ") + e.what();
        status(result.error);
    }
    return result;
}
