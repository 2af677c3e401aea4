#include <gtest/gtest.h>
#include <transfer/chunked_uploader.hpp>
#include "fake_remote_shell.hpp"
#include <algorithm>

static std::string make_data(size_t n) {
    std::string data;
    data.reserve(n);
    for (size_t i = 0; i < n; i++) data += static_cast<char>((i * 7 + 3) % 256);
    return data;
}

static UploadOptions quick_options(size_t chunk_size = 800) {
    UploadOptions opts;
    opts.chunk_size = chunk_size;
    opts.progress_interval = 1;
    return opts;
}

TEST(ChunkedUploader, UploadsBinaryFile) {
    FakeRemoteShell shell;
    std::string data = make_data(2048);

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, data, "/tmp/out.bin");

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.phase, TransferPhase::SUCCESS);
    EXPECT_EQ(result.local_size, 2048u);
    ASSERT_TRUE(result.remote_size.has_value());
    EXPECT_EQ(*result.remote_size, 2048u);
    EXPECT_EQ(result.chunks_total, 3u);
    EXPECT_EQ(result.chunks_sent, 3u);
    EXPECT_EQ(shell.files["/tmp/out.bin"], data);
}

TEST(ChunkedUploader, CommandSequence) {
    FakeRemoteShell shell;
    ChunkedUploader uploader(quick_options());
    uploader.upload(shell, make_data(2048), "/tmp/out.bin");

    ASSERT_EQ(shell.commands.size(), 5u);
    EXPECT_EQ(shell.commands.front(), "> /tmp/out.bin");
    EXPECT_EQ(shell.commands.back(), "wc -c < /tmp/out.bin");
    EXPECT_EQ(shell.truncates, 1);
    EXPECT_EQ(shell.appends, 3);
    EXPECT_EQ(shell.queries, 1);
    EXPECT_EQ(shell.opens, 1);
    EXPECT_EQ(shell.closes, 1);

    // 800, 800, 448 bytes, four characters each
    std::vector<size_t> payloads;
    for (size_t i = 1; i <= 3; i++) {
        const std::string& c = shell.commands[i];
        auto end = c.find("\" >> ");
        payloads.push_back(end - 8);
    }
    EXPECT_EQ(payloads, (std::vector<size_t>{3200, 3200, 1792}));
}

TEST(ChunkedUploader, ReplacesExistingContent) {
    FakeRemoteShell shell;
    shell.files["/tmp/out.bin"] = "stale contents from a previous run";

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, "fresh", "/tmp/out.bin");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(shell.files["/tmp/out.bin"], "fresh");
}

TEST(ChunkedUploader, ZeroLengthFile) {
    FakeRemoteShell shell;
    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, "", "/tmp/empty");

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.chunks_total, 0u);
    EXPECT_EQ(shell.appends, 0);
    EXPECT_EQ(shell.truncates, 1);
    EXPECT_EQ(shell.queries, 1);
    ASSERT_TRUE(shell.files.count("/tmp/empty"));
    EXPECT_TRUE(shell.files["/tmp/empty"].empty());
}

TEST(ChunkedUploader, SizeMismatchFails) {
    FakeRemoteShell shell;
    shell.drop_bytes = 10;

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(1000), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, TransferPhase::FAILURE);
    ASSERT_TRUE(result.remote_size.has_value());
    EXPECT_EQ(*result.remote_size, 990u);
    EXPECT_NE(result.error.find("mismatch"), std::string::npos);
    EXPECT_EQ(shell.closes, 1);
}

TEST(ChunkedUploader, UnparsableSizeIsToleratedByDefault) {
    FakeRemoteShell shell;
    shell.size_reply = "wc: illegal option";

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(100), "/tmp/out.bin");

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.remote_size.has_value());
}

TEST(ChunkedUploader, UnparsableSizeFailsWhenStrict) {
    FakeRemoteShell shell;
    shell.size_reply = "";

    auto opts = quick_options();
    opts.strict_verify = true;
    ChunkedUploader uploader(opts);
    auto result = uploader.upload(shell, make_data(100), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, TransferPhase::FAILURE);
}

TEST(ChunkedUploader, OpenFailureSendsNothing) {
    FakeRemoteShell shell;
    shell.fail_open = true;

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(100), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "connection refused");
    EXPECT_TRUE(shell.commands.empty());
}

TEST(ChunkedUploader, ChunkFailureAbortsByDefault) {
    FakeRemoteShell shell;
    shell.failing_appends = {1};

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(2048), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.chunks_sent, 1u);
    EXPECT_EQ(shell.appends, 2);
    EXPECT_EQ(shell.queries, 0);
    EXPECT_EQ(shell.closes, 1);
    EXPECT_NE(result.error.find("Chunk 2/3"), std::string::npos);
}

TEST(ChunkedUploader, ChunkFailureCanBeSkipped) {
    FakeRemoteShell shell;
    shell.failing_appends = {1};

    auto opts = quick_options();
    opts.abort_on_chunk_failure = false;
    ChunkedUploader uploader(opts);
    auto result = uploader.upload(shell, make_data(2048), "/tmp/out.bin");

    // The missing chunk shows up as a size mismatch
    EXPECT_EQ(shell.appends, 3);
    EXPECT_EQ(result.failed_chunks, 1u);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.remote_size.has_value());
    EXPECT_EQ(*result.remote_size, 2048u - 800u);
}

TEST(ChunkedUploader, PipeDriverAbortsOnDeliveryFailure) {
    FakeRemoteShell shell;
    shell.exit_status = false;
    shell.failing_appends = {0};

    auto opts = quick_options();
    opts.abort_on_chunk_failure = false;
    ChunkedUploader uploader(opts);
    auto result = uploader.upload(shell, make_data(2048), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(shell.appends, 1);
}

TEST(ChunkedUploader, CloseFailureFailsTransfer) {
    FakeRemoteShell shell;
    shell.close_exit = 255;

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(10), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, TransferPhase::FAILURE);
}

TEST(ChunkedUploader, ProgressReportsEveryInterval) {
    FakeRemoteShell shell;
    auto opts = quick_options(10);
    opts.progress_interval = 4;
    ChunkedUploader uploader(opts);

    std::vector<size_t> seen;
    uploader.on_progress([&](size_t done, size_t total) {
        EXPECT_EQ(total, 10u);
        seen.push_back(done);
    });
    auto result = uploader.upload(shell, make_data(100), "/tmp/out.bin");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(seen, (std::vector<size_t>{4, 8, 10}));
}

TEST(ChunkedUploader, QuotesRemotePath) {
    FakeRemoteShell shell;
    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, "data", "/tmp/my file's");

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(shell.files["/tmp/my file's"], "data");
}

TEST(SizeVerifier, Cases) {
    EXPECT_TRUE(verify_remote_size(SSHResult{0, "2048\n", ""}, 2048, false).ok);
    EXPECT_FALSE(verify_remote_size(SSHResult{0, "2047\n", ""}, 2048, false).ok);
    EXPECT_TRUE(verify_remote_size(SSHResult{0, "total", ""}, 2048, false).ok);
    EXPECT_FALSE(verify_remote_size(SSHResult{0, "total", ""}, 2048, true).ok);
}

TEST(SizeVerifier, FailedQueryNeverPasses) {
    auto check = verify_remote_size(SSHResult{1, "", "No such file or directory"}, 2048, false);
    EXPECT_FALSE(check.ok);
    EXPECT_FALSE(check.remote_size.has_value());
    EXPECT_NE(check.message.find("No such file"), std::string::npos);

    EXPECT_FALSE(verify_remote_size(SSHResult{-1, "", "No reply within 30s"}, 0, false).ok);
}

TEST(ChunkedUploader, FailedSizeQueryFailsTransfer) {
    FakeRemoteShell shell;
    shell.exit_status = false;
    shell.query_exit = 1;

    ChunkedUploader uploader(quick_options());
    auto result = uploader.upload(shell, make_data(100), "/tmp/out.bin");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, TransferPhase::FAILURE);
    EXPECT_FALSE(result.remote_size.has_value());
    EXPECT_EQ(shell.closes, 1);
}
