#include "marker_protocol.hpp"
#include <core/utils.hpp>

std::string build_marker_command(const std::string& cmd) {
    // Shell string concatenation (BEG''IN / DO''NE) keeps the literal marker
    // out of anything that echoes the command line back.
    return "echo __SHELLPUSH_BEG''IN__; " + cmd +
           "; echo __SHELLPUSH_DO''NE__ $?\n";
}

MarkerResult parse_marker_output(const std::string& raw) {
    const std::string done_marker = SHELLPUSH_DONE_MARKER;
    const std::string begin_marker = SHELLPUSH_BEGIN_MARKER;

    auto done_pos = raw.find(done_marker);
    if (done_pos == std::string::npos) {
        return {"", 0, false};
    }

    // The exit code is only trustworthy once its line is complete
    auto code_start = done_pos + done_marker.length();
    auto line_end = raw.find('\n', code_start);
    if (line_end == std::string::npos) {
        return {"", 0, false};
    }
    std::string code_str = raw.substr(code_start, line_end - code_start);
    trim(code_str);
    int exit_code = safe_stoi(code_str, -1);

    // Extract text between BEGIN and DONE markers
    std::string clean;
    auto begin_pos = raw.rfind(begin_marker, done_pos);
    if (begin_pos != std::string::npos) {
        auto content_start = begin_pos + begin_marker.length();
        if (content_start < raw.length() && raw[content_start] == '\r')
            content_start++;
        if (content_start < raw.length() && raw[content_start] == '\n')
            content_start++;
        clean = raw.substr(content_start, done_pos - content_start);
    } else {
        clean = raw.substr(0, done_pos);
    }

    trim(clean);
    return {clean, exit_code, true};
}
