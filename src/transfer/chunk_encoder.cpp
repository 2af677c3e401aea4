#include "chunk_encoder.hpp"
#include <core/utils.hpp>
#include <stdexcept>

std::size_t chunk_count(std::size_t total_bytes, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1");
    }
    return (total_bytes + chunk_size - 1) / chunk_size;
}

std::vector<ChunkSpan> plan_chunks(std::size_t total_bytes, std::size_t chunk_size) {
    std::vector<ChunkSpan> spans;
    spans.reserve(chunk_count(total_bytes, chunk_size));
    for (std::size_t offset = 0; offset < total_bytes; offset += chunk_size) {
        std::size_t remaining = total_bytes - offset;
        spans.push_back({offset, remaining < chunk_size ? remaining : chunk_size});
    }
    return spans;
}

std::string encode_octal(const char* data, std::size_t len) {
    std::string out;
    out.resize(len * 4);
    char* p = &out[0];
    for (std::size_t i = 0; i < len; i++) {
        auto b = static_cast<unsigned char>(data[i]);
        *p++ = '\\';
        *p++ = static_cast<char>('0' + ((b >> 6) & 0x7));
        *p++ = static_cast<char>('0' + ((b >> 3) & 0x7));
        *p++ = static_cast<char>('0' + (b & 0x7));
    }
    return out;
}

std::string truncate_command(const std::string& remote_path) {
    return "> " + shell_quote(remote_path);
}

std::string append_command(const std::string& escaped, const std::string& remote_path) {
    if (escaped.empty()) {
        throw std::invalid_argument("refusing to build an append command for an empty chunk");
    }
    return "printf \"" + escaped + "\" >> " + shell_quote(remote_path);
}

std::string byte_count_command(const std::string& remote_path) {
    return "wc -c < " + shell_quote(remote_path);
}
