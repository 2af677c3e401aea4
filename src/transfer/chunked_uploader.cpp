#include "chunked_uploader.hpp"
#include "chunk_encoder.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

SizeCheck verify_remote_size(const SSHResult& reply, std::size_t local_size, bool strict) {
    // A failed query means wc never saw the file (or the shell is gone)
    if (reply.failed()) {
        std::string detail = reply.stderr_data.empty() ? reply.stdout_data : reply.stderr_data;
        trim(detail);
        return {false, std::nullopt,
                fmt::format("Size query failed (exit {}): {}", reply.exit_code, detail)};
    }

    auto remote = parse_byte_count(reply.stdout_data);
    if (!remote) {
        std::string text = reply.stdout_data;
        trim(text);
        if (strict) {
            return {false, std::nullopt,
                    fmt::format("Could not parse remote size '{}'", text)};
        }
        return {true, std::nullopt,
                fmt::format("Could not parse remote size '{}', assuming the transfer succeeded", text)};
    }

    if (*remote == local_size) {
        return {true, remote,
                fmt::format("Sizes match: local {}, remote {}", local_size, *remote)};
    }
    return {false, remote,
            fmt::format("Size mismatch: local {}, remote {}", local_size, *remote)};
}

ChunkedUploader::ChunkedUploader(UploadOptions options)
    : options_(options) {
}

void ChunkedUploader::status(const std::string& msg) const {
    shellpush_log(msg);
    if (status_) status_(msg);
}

TransferResult ChunkedUploader::upload(RemoteShell& shell, const std::string& data,
                                       const std::string& remote_path) {
    TransferResult result;
    result.local_size = data.size();
    result.phase = TransferPhase::DISCONNECTED;

    // Plan before touching the network so a bad chunk size never half-runs
    auto spans = plan_chunks(data.size(), options_.chunk_size);
    result.chunks_total = spans.size();

    auto fail = [&](const std::string& error) {
        result.success = false;
        result.error = error;
        result.phase = TransferPhase::FAILURE;
        status(error);
        auto closed = shell.close();
        if (closed.failed()) shellpush_log("close after failure: " + closed.stderr_data);
        return result;
    };

    auto opened = shell.open(status_);
    if (opened.failed()) {
        result.error = opened.stderr_data.empty() ? "Failed to connect" : opened.stderr_data;
        result.phase = TransferPhase::FAILURE;
        status(result.error);
        auto closed = shell.close();
        if (closed.failed()) shellpush_log("close after failed open: " + closed.stderr_data);
        return result;
    }
    result.phase = TransferPhase::CONNECTED;

    auto truncated = shell.send(truncate_command(remote_path));
    if (truncated.failed()) {
        return fail("Failed to truncate " + remote_path + ": " + truncated.get_output());
    }
    result.phase = TransferPhase::TRUNCATED;
    platform::sleep_ms(options_.truncate_delay_ms);

    status(fmt::format("Streaming {} bytes in {} chunks", data.size(), spans.size()));
    result.phase = TransferPhase::STREAMING;

    for (std::size_t i = 0; i < spans.size(); i++) {
        const auto& span = spans[i];
        std::string cmd = append_command(encode_octal(data.data() + span.offset, span.length),
                                         remote_path);
        auto sent = shell.send(cmd);
        if (sent.failed()) {
            std::string detail = sent.stderr_data.empty() ? sent.get_output() : sent.stderr_data;
            trim(detail);
            std::string msg = fmt::format("Chunk {}/{} failed (exit {}): {}",
                                          i + 1, spans.size(), sent.exit_code, detail);
            // Pipe drivers only fail here when the process is gone
            if (options_.abort_on_chunk_failure || !shell.reports_exit_status()) {
                return fail(msg);
            }
            shellpush_log(msg);
            result.failed_chunks++;
        }
        result.chunks_sent = i + 1;

        std::size_t done = i + 1;
        if (progress_ && (done % options_.progress_interval == 0 || done == spans.size())) {
            progress_(done, spans.size());
        }

        platform::sleep_ms(options_.chunk_delay_ms);
    }

    result.phase = TransferPhase::VERIFYING;
    status("Transfer complete, verifying file size...");

    auto reply = shell.query(byte_count_command(remote_path));
    auto check = verify_remote_size(reply, data.size(), options_.strict_verify);
    result.remote_size = check.remote_size;
    if (!check.ok) {
        return fail(check.message);
    }
    status(check.message);

    auto closed = shell.close();
    if (closed.failed()) {
        result.success = false;
        result.error = closed.stderr_data;
        result.phase = TransferPhase::FAILURE;
        status(result.error);
        return result;
    }

    if (result.failed_chunks > 0) {
        shellpush_log(fmt::format("{} chunk(s) failed but sizes agree", result.failed_chunks));
    }
    result.success = true;
    result.phase = TransferPhase::SUCCESS;
    return result;
}
