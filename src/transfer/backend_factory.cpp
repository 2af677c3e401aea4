#include "backend_factory.hpp"
#include "exec_shell.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

BackendProfile backend_profile(Backend backend) {
    switch (backend) {
    case Backend::CLIENT_LIBRARY:
        // exec() waits for each command, so no truncate delay is needed
        return {DEFAULT_CHUNK_SIZE, DEFAULT_PROGRESS_INTERVAL, 0,
                0, CLIENT_CHUNK_DELAY_MS, 0};
    case Backend::PASSWORD_HELPER:
        return {DEFAULT_CHUNK_SIZE, DEFAULT_PROGRESS_INTERVAL, HELPER_SETTLE_MS,
                HELPER_TRUNCATE_DELAY_MS, HELPER_CHUNK_DELAY_MS, HELPER_EXIT_TIMEOUT_SECS};
    case Backend::NATIVE_OPENSSH:
        return {NATIVE_OPENSSH_CHUNK_SIZE, NATIVE_PROGRESS_INTERVAL, PIPE_SETTLE_MS,
                PIPE_TRUNCATE_DELAY_MS, NATIVE_CHUNK_DELAY_MS, PIPE_EXIT_TIMEOUT_SECS};
    case Backend::RAW_PIPE:
        return {DEFAULT_CHUNK_SIZE, DEFAULT_PROGRESS_INTERVAL, PIPE_SETTLE_MS,
                PIPE_TRUNCATE_DELAY_MS, PIPE_CHUNK_DELAY_MS, PIPE_EXIT_TIMEOUT_SECS};
    }
    return {DEFAULT_CHUNK_SIZE, DEFAULT_PROGRESS_INTERVAL, PIPE_SETTLE_MS,
            PIPE_TRUNCATE_DELAY_MS, PIPE_CHUNK_DELAY_MS, PIPE_EXIT_TIMEOUT_SECS};
}

UploadOptions upload_options(Backend backend, const TransferSettings& settings) {
    BackendProfile profile = backend_profile(backend);

    UploadOptions opts;
    opts.chunk_size = settings.chunk_size > 0
        ? static_cast<std::size_t>(settings.chunk_size)
        : profile.chunk_size;
    opts.progress_interval = profile.progress_interval;
    opts.truncate_delay_ms = settings.pacing ? profile.truncate_delay_ms : 0;
    opts.chunk_delay_ms = settings.pacing ? profile.chunk_delay_ms : 0;
    opts.abort_on_chunk_failure = settings.abort_on_chunk_failure;
    opts.strict_verify = settings.strict_verify;
    return opts;
}

PipeCommand openssh_command(const TransferRequest& req, const std::string& ssh_program,
                            bool batch_mode) {
    PipeCommand cmd;
    cmd.program = ssh_program;
    cmd.args = {"-p", std::to_string(req.port), "-o", SSH_OPT_NO_HOSTKEY_CHECK};
    if (batch_mode) {
        cmd.args.push_back("-o");
        cmd.args.push_back(SSH_OPT_BATCH_MODE);
    }
    if (req.ssh_key_path) {
        cmd.args.push_back("-i");
        cmd.args.push_back(*req.ssh_key_path);
    }
    // No remote command: the remote login shell reads our stdin
    cmd.args.push_back("-T");
    cmd.args.push_back(req.user.empty() ? req.host : req.user + "@" + req.host);
    return cmd;
}

PipeCommand password_helper_command(const TransferRequest& req, const std::string& helper,
                                    const std::string& ssh_program) {
    PipeCommand inner = openssh_command(req, ssh_program, false);

    PipeCommand cmd;
    cmd.program = helper;
    cmd.args = {"-e", inner.program};
    cmd.args.insert(cmd.args.end(), inner.args.begin(), inner.args.end());
    if (req.password) {
        cmd.env.emplace_back(PASSWORD_HELPER_ENV, *req.password);
    }
    return cmd;
}

static PipeShellOptions pipe_options(Backend backend, const TransferSettings& settings) {
    BackendProfile profile = backend_profile(backend);
    PipeShellOptions opts;
    opts.settle_ms = settings.pacing ? profile.settle_ms : 0;
    opts.exit_timeout_secs = profile.exit_timeout_secs;
    opts.query_timeout_secs = PIPE_QUERY_TIMEOUT_SECS;
    return opts;
}

Result<std::unique_ptr<RemoteShell>> make_remote_shell(Backend backend,
                                                       const TransferRequest& req,
                                                       const TransferSettings& settings) {
    using ShellResult = Result<std::unique_ptr<RemoteShell>>;

    switch (backend) {
    case Backend::CLIENT_LIBRARY: {
        SessionTarget target;
        target.host = req.host;
        target.port = req.port;
        target.user = req.user;
        target.password = req.password.value_or("");
        target.timeout = req.timeout;
        target.ssh_key_path = req.ssh_key_path;
        return ShellResult::Ok(std::make_unique<ExecShell>(target));
    }
    case Backend::PASSWORD_HELPER:
        if (!req.password) {
            return ShellResult::Err("password-helper backend needs a password");
        }
        return ShellResult::Ok(std::make_unique<PipeShell>(
            password_helper_command(req, settings.password_helper, settings.ssh_program),
            pipe_options(backend, settings)));
    case Backend::NATIVE_OPENSSH:
        if (req.password) {
            return ShellResult::Err(
                "Native OpenSSH cannot supply a password non-interactively. "
                "Use SSH key authentication or a build with libssh2 support.");
        }
        return ShellResult::Ok(std::make_unique<PipeShell>(
            openssh_command(req, settings.ssh_program, true),
            pipe_options(backend, settings)));
    case Backend::RAW_PIPE:
        return ShellResult::Ok(std::make_unique<PipeShell>(
            openssh_command(req, settings.ssh_program, false),
            pipe_options(backend, settings)));
    }
    return ShellResult::Err(std::string("Unknown backend ") + backend_name(backend));
}
