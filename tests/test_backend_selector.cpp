#include <gtest/gtest.h>
#include <transfer/backend_selector.hpp>
#include <transfer/backend_factory.hpp>
#include <core/constants.hpp>
#include <algorithm>

using platform::HostOs;

static ToolAvailability all_tools() {
    return ToolAvailability{true, true, true};
}

TEST(BackendSelector, UnixWithPasswordPrefersHelper) {
    auto order = select_backends(HostOs::LINUX, all_tools(), true);
    EXPECT_EQ(order, (std::vector<Backend>{Backend::PASSWORD_HELPER,
                                           Backend::CLIENT_LIBRARY, Backend::RAW_PIPE}));
}

TEST(BackendSelector, UnixWithoutPasswordSkipsHelper) {
    auto order = select_backends(HostOs::MACOS, all_tools(), false);
    EXPECT_EQ(order, (std::vector<Backend>{Backend::CLIENT_LIBRARY, Backend::RAW_PIPE}));
}

TEST(BackendSelector, UnixNeverUsesNativeOpenssh) {
    auto order = select_backends(HostOs::LINUX, all_tools(), false);
    EXPECT_EQ(std::count(order.begin(), order.end(), Backend::NATIVE_OPENSSH), 0);
}

TEST(BackendSelector, WindowsOrder) {
    auto order = select_backends(HostOs::WINDOWS, all_tools(), true);
    EXPECT_EQ(order, (std::vector<Backend>{Backend::CLIENT_LIBRARY,
                                           Backend::NATIVE_OPENSSH, Backend::RAW_PIPE}));
}

TEST(BackendSelector, MissingToolsFallThroughToPipe) {
    ToolAvailability none;
    EXPECT_EQ(select_backends(HostOs::LINUX, none, true),
              (std::vector<Backend>{Backend::RAW_PIPE}));
    EXPECT_EQ(select_backends(HostOs::WINDOWS, none, false),
              (std::vector<Backend>{Backend::RAW_PIPE}));
}

TEST(BackendSelector, HelperWithoutBinarySkipped) {
    ToolAvailability tools{true, false, true};
    auto order = select_backends(HostOs::LINUX, tools, true);
    EXPECT_EQ(order.front(), Backend::CLIENT_LIBRARY);
}

TEST(BackendSelector, ForcedBackend) {
    EXPECT_EQ(select_backends(HostOs::LINUX, all_tools(), false, Backend::RAW_PIPE),
              (std::vector<Backend>{Backend::RAW_PIPE}));

    ToolAvailability no_lib{false, true, true};
    EXPECT_TRUE(select_backends(HostOs::LINUX, no_lib, false, Backend::CLIENT_LIBRARY).empty());
}

TEST(BackendSelector, DisabledBackendsReportUnavailable) {
    TransferSettings settings;
    settings.disabled_backends = {Backend::CLIENT_LIBRARY, Backend::PASSWORD_HELPER,
                                  Backend::NATIVE_OPENSSH};
    auto tools = detect_tools(settings);
    EXPECT_FALSE(tools.client_library);
    EXPECT_FALSE(tools.password_helper);
    EXPECT_FALSE(tools.openssh_client);
}

// ── Factory ───────────────────────────────────────────────

static TransferRequest sample_request() {
    TransferRequest req;
    req.host = "build.example.com";
    req.port = 2222;
    req.user = "deploy";
    req.local_path = "a.bin";
    req.remote_path = "/tmp/a.bin";
    return req;
}

TEST(BackendFactory, OpensshCommandLine) {
    auto req = sample_request();
    req.ssh_key_path = "/home/me/.ssh/deploy";

    auto cmd = openssh_command(req, "ssh", true);
    EXPECT_EQ(cmd.program, "ssh");
    EXPECT_EQ(cmd.args, (std::vector<std::string>{
        "-p", "2222", "-o", "StrictHostKeyChecking=no", "-o", "BatchMode=yes",
        "-i", "/home/me/.ssh/deploy", "-T", "deploy@build.example.com"}));
    EXPECT_TRUE(cmd.env.empty());
}

TEST(BackendFactory, RawPipeHasNoBatchMode) {
    auto cmd = openssh_command(sample_request(), "ssh", false);
    EXPECT_EQ(std::count(cmd.args.begin(), cmd.args.end(), "BatchMode=yes"), 0);
    EXPECT_EQ(cmd.args.back(), "deploy@build.example.com");
}

TEST(BackendFactory, HelperPassesPasswordInEnvironment) {
    auto req = sample_request();
    req.password = "s3cret";

    auto cmd = password_helper_command(req, "sshpass", "ssh");
    EXPECT_EQ(cmd.program, "sshpass");
    ASSERT_GE(cmd.args.size(), 2u);
    EXPECT_EQ(cmd.args[0], "-e");
    EXPECT_EQ(cmd.args[1], "ssh");
    // Never on the command line
    EXPECT_EQ(std::count(cmd.args.begin(), cmd.args.end(), "s3cret"), 0);
    ASSERT_EQ(cmd.env.size(), 1u);
    EXPECT_EQ(cmd.env[0].first, "SSHPASS");
    EXPECT_EQ(cmd.env[0].second, "s3cret");
}

TEST(BackendFactory, NativeOpensshRejectsPassword) {
    auto req = sample_request();
    req.password = "pw";
    auto shell = make_remote_shell(Backend::NATIVE_OPENSSH, req, TransferSettings{});
    EXPECT_TRUE(shell.is_err());
    EXPECT_NE(shell.error.find("key"), std::string::npos);
}

TEST(BackendFactory, HelperNeedsPassword) {
    auto shell = make_remote_shell(Backend::PASSWORD_HELPER, sample_request(),
                                   TransferSettings{});
    EXPECT_TRUE(shell.is_err());
}

TEST(BackendFactory, PipeShellsConstructWithoutSpawning) {
    auto shell = make_remote_shell(Backend::RAW_PIPE, sample_request(), TransferSettings{});
    ASSERT_TRUE(shell.is_ok());
    EXPECT_FALSE(shell.value->reports_exit_status());
}

TEST(BackendFactory, ProfilesFollowBackend) {
    EXPECT_EQ(backend_profile(Backend::CLIENT_LIBRARY).chunk_size, 800u);
    EXPECT_EQ(backend_profile(Backend::RAW_PIPE).chunk_size, 800u);
    EXPECT_EQ(backend_profile(Backend::NATIVE_OPENSSH).chunk_size, 500u);
    EXPECT_EQ(backend_profile(Backend::NATIVE_OPENSSH).progress_interval, 50u);
    EXPECT_EQ(backend_profile(Backend::PASSWORD_HELPER).settle_ms, HELPER_SETTLE_MS);
}

TEST(BackendFactory, UploadOptionsApplySettings) {
    TransferSettings settings;
    settings.pacing = false;
    settings.strict_verify = true;
    settings.abort_on_chunk_failure = false;

    auto opts = upload_options(Backend::RAW_PIPE, settings);
    EXPECT_EQ(opts.chunk_size, 800u);
    EXPECT_EQ(opts.chunk_delay_ms, 0);
    EXPECT_EQ(opts.truncate_delay_ms, 0);
    EXPECT_TRUE(opts.strict_verify);
    EXPECT_FALSE(opts.abort_on_chunk_failure);

    settings.chunk_size = 64;
    EXPECT_EQ(upload_options(Backend::NATIVE_OPENSSH, settings).chunk_size, 64u);
}

TEST(BackendFactory, PacingOnUsesProfileDelays) {
    auto opts = upload_options(Backend::NATIVE_OPENSSH, TransferSettings{});
    EXPECT_EQ(opts.chunk_delay_ms, NATIVE_CHUNK_DELAY_MS);
    EXPECT_EQ(opts.truncate_delay_ms, PIPE_TRUNCATE_DELAY_MS);
}
