#pragma once

#include <string>
#include <vector>
#include <cstddef>

// Contiguous slice of the source buffer sent as one append command
struct ChunkSpan {
    std::size_t offset;
    std::size_t length;
};

// Number of chunks needed for total_bytes: ceil(total_bytes / chunk_size).
// Throws std::invalid_argument for a zero chunk size.
std::size_t chunk_count(std::size_t total_bytes, std::size_t chunk_size);

// Split [0, total_bytes) into in-order, non-overlapping spans of at most
// chunk_size bytes. An empty buffer yields no spans.
std::vector<ChunkSpan> plan_chunks(std::size_t total_bytes, std::size_t chunk_size);

// Every byte as a backslash and three octal digits ("\000".."\377"), the
// form printf(1) turns back into raw bytes.
std::string encode_octal(const char* data, std::size_t len);

inline std::string encode_octal(const std::string& bytes) {
    return encode_octal(bytes.data(), bytes.size());
}

// ── Remote shell commands ────────────────────────────────────

// "> path": create or empty the target.
std::string truncate_command(const std::string& remote_path);

// printf "<escaped>" >> path. Throws std::invalid_argument for an empty
// payload so a zero-length chunk can never reach the wire.
std::string append_command(const std::string& escaped, const std::string& remote_path);

// "wc -c < path": remote byte count of the target.
std::string byte_count_command(const std::string& remote_path);
