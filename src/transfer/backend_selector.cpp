#include "backend_selector.hpp"
#include <ssh/session.hpp>
#include <platform/process.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>

static bool is_disabled(const TransferSettings& settings, Backend backend) {
    const auto& d = settings.disabled_backends;
    return std::find(d.begin(), d.end(), backend) != d.end();
}

ToolAvailability detect_tools(const TransferSettings& settings) {
    ToolAvailability tools;

    if (!is_disabled(settings, Backend::CLIENT_LIBRARY)) {
        tools.client_library = client_library_available();
    }
    if (!is_disabled(settings, Backend::PASSWORD_HELPER)) {
        tools.password_helper = platform::find_executable(settings.password_helper).has_value();
    }
    if (!is_disabled(settings, Backend::NATIVE_OPENSSH)) {
        tools.openssh_client =
            platform::run_quiet(settings.ssh_program, {"-V"}, 5000, shellpush_log_path()) == 0;
    }

    shellpush_log(fmt::format("tools: client-library={} password-helper={} openssh={}",
                              tools.client_library, tools.password_helper,
                              tools.openssh_client));
    return tools;
}

bool backend_usable(Backend backend, const ToolAvailability& tools, bool has_password) {
    switch (backend) {
    case Backend::CLIENT_LIBRARY:  return tools.client_library;
    case Backend::PASSWORD_HELPER: return tools.password_helper && has_password;
    case Backend::NATIVE_OPENSSH:  return tools.openssh_client;
    case Backend::RAW_PIPE:        return true;
    }
    return false;
}

std::vector<Backend> select_backends(platform::HostOs os, const ToolAvailability& tools,
                                     bool has_password, std::optional<Backend> forced) {
    std::vector<Backend> order;
    if (forced) {
        if (backend_usable(*forced, tools, has_password)) order.push_back(*forced);
        return order;
    }

    std::vector<Backend> preference;
    if (os == platform::HostOs::WINDOWS) {
        preference = {Backend::CLIENT_LIBRARY, Backend::NATIVE_OPENSSH, Backend::RAW_PIPE};
    } else {
        preference = {Backend::PASSWORD_HELPER, Backend::CLIENT_LIBRARY, Backend::RAW_PIPE};
    }

    for (Backend b : preference) {
        if (backend_usable(b, tools, has_password)) order.push_back(b);
    }
    return order;
}
