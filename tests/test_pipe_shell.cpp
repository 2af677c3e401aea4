#include <gtest/gtest.h>
#include <transfer/pipe_shell.hpp>
#include <transfer/chunked_uploader.hpp>
#include <transfer/transfer_runner.hpp>
#include <platform/platform.hpp>
#include <filesystem>

namespace fs = std::filesystem;

#ifndef _WIN32

// A local sh stands in for the remote login shell
static PipeShell local_shell(int exit_timeout_secs = 5) {
    return PipeShell(PipeCommand{"sh", {}, {}}, PipeShellOptions{0, exit_timeout_secs, 5});
}

class PipeShellTest : public ::testing::Test {
protected:
    fs::path target;

    void SetUp() override {
        target = platform::temp_dir() / "shellpush_pipe_shell_test.bin";
        std::error_code ec;
        fs::remove(target, ec);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(target, ec);
    }
};

TEST_F(PipeShellTest, QueryReadsFramedReply) {
    PipeShell shell = local_shell();
    ASSERT_TRUE(shell.open().success());

    auto hello = shell.query("echo hello");
    EXPECT_EQ(hello.exit_code, 0);
    EXPECT_EQ(hello.stdout_data, "hello");

    auto failed = shell.query("false");
    EXPECT_EQ(failed.exit_code, 1);

    EXPECT_TRUE(shell.close().success());
}

TEST_F(PipeShellTest, ShellPrintfReproducesEveryByte) {
    std::string data;
    for (int b = 0; b < 256; b++) data += static_cast<char>(b);
    // The bytes most likely to break quoting, repeated across a chunk boundary
    data += std::string("\x00\x0a\x22\x5c\x25", 5);

    PipeShell shell = local_shell();
    UploadOptions opts;
    opts.chunk_size = 100;
    ChunkedUploader uploader(opts);

    auto result = uploader.upload(shell, data, target.string());

    EXPECT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.remote_size.has_value());
    EXPECT_EQ(*result.remote_size, data.size());

    auto written = read_local_file(target.string());
    ASSERT_TRUE(written.is_ok()) << written.error;
    EXPECT_EQ(written.value, data);
}

TEST_F(PipeShellTest, MissingDirectoryFails) {
    PipeShell shell = local_shell();
    ChunkedUploader uploader;

    auto missing = platform::temp_dir() / "shellpush_no_such_dir" / "x.bin";
    auto result = uploader.upload(shell, std::string(2048, 'x'), missing.string());

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.remote_size.has_value());
    EXPECT_FALSE(result.error.empty());
}

TEST_F(PipeShellTest, UnstartableProgramFailsOpen) {
    PipeShell shell(PipeCommand{"/nonexistent/shellpush-no-such-ssh", {}, {}},
                    PipeShellOptions{300, 5, 5});

    auto opened = shell.open();

    EXPECT_TRUE(opened.failed());
    EXPECT_EQ(opened.exit_code, 127);
    EXPECT_NE(opened.stderr_data.find("could not be executed"), std::string::npos);
}

TEST_F(PipeShellTest, SendAfterExitReportsDeadShell) {
    PipeShell shell = local_shell();
    ASSERT_TRUE(shell.open().success());

    ASSERT_TRUE(shell.send("exit 0").success());
    platform::sleep_ms(300);

    EXPECT_TRUE(shell.send("> /dev/null").failed());
}

TEST_F(PipeShellTest, CloseKillsChildThatIgnoresExit) {
    PipeShell shell(PipeCommand{"sleep", {"100"}, {}}, PipeShellOptions{0, 1, 1});
    ASSERT_TRUE(shell.open().success());

    auto closed = shell.close();

    EXPECT_TRUE(closed.failed());
    EXPECT_NE(closed.stderr_data.find("killed"), std::string::npos);
}

TEST_F(PipeShellTest, NonZeroExitIsFailure) {
    PipeShell shell(PipeCommand{"sh", {"-c", "cat > /dev/null; exit 3"}, {}},
                    PipeShellOptions{0, 5, 5});
    ASSERT_TRUE(shell.open().success());

    auto closed = shell.close();
    EXPECT_EQ(closed.exit_code, 3);
}

#endif
