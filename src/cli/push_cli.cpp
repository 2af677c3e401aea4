#include "push_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <transfer/transfer_runner.hpp>
#include <transfer/backend_selector.hpp>
#include <iostream>
#include <cstdlib>

Result<PushArgs> parse_push_args(const std::vector<std::string>& args) {
    PushArgs out;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        auto value = [&](std::string& dest) -> bool {
            if (i + 1 >= args.size()) return false;
            dest = args[++i];
            return true;
        };

        std::string v;
        if (a == "--host" || a == "-H") {
            if (!value(out.host)) return Result<PushArgs>::Err(a + " needs a value");
        } else if (a == "--port" || a == "-p") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a value");
            int port = safe_stoi(v, -1);
            if (port < 1 || port > 65535) {
                return Result<PushArgs>::Err("Invalid port: " + v);
            }
            out.port = port;
        } else if (a == "--user" || a == "-u") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a value");
            out.user = v;
        } else if (a == "--key" || a == "-i") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a value");
            out.ssh_key_path = v;
        } else if (a == "--password-env") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a variable name");
            out.password_env = v;
        } else if (a == "--ask-password") {
            out.ask_password = true;
        } else if (a == "--backend") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a value");
            out.backend = v;
        } else if (a == "--config") {
            if (!value(v)) return Result<PushArgs>::Err(a + " needs a path");
            out.config_path = v;
        } else if (a.size() > 1 && a[0] == '-') {
            return Result<PushArgs>::Err("Unknown option: " + a);
        } else {
            positional.push_back(a);
        }
    }

    if (positional.size() != 2) {
        return Result<PushArgs>::Err("Expected <local> and <remote> paths");
    }
    if (out.host.empty()) {
        return Result<PushArgs>::Err("--host is required");
    }
    if (out.password_env && out.ask_password) {
        return Result<PushArgs>::Err("--password-env and --ask-password are exclusive");
    }

    out.local_path = positional[0];
    out.remote_path = positional[1];
    return Result<PushArgs>::Ok(out);
}

Result<TransferRequest> build_request(const Config& config, const PushArgs& args) {
    TransferRequest req = config.make_request(args.host, args.local_path, args.remote_path);

    if (args.port) req.port = *args.port;
    if (args.user) req.user = *args.user;
    if (args.ssh_key_path) req.ssh_key_path = *args.ssh_key_path;

    if (args.password_env) {
        const char* pw = std::getenv(args.password_env->c_str());
        if (!pw || !*pw) {
            return Result<TransferRequest>::Err(
                "Environment variable " + *args.password_env + " is not set");
        }
        req.password = std::string(pw);
    } else if (args.ask_password) {
        if (!platform::stdin_is_tty()) {
            return Result<TransferRequest>::Err("--ask-password needs a terminal; use --password-env");
        }
        std::string prompt = "Password for " +
            (req.user.empty() ? req.host : req.user + "@" + req.host) + ": ";
        std::string pw = platform::read_secret(prompt);
        if (pw.empty()) {
            return Result<TransferRequest>::Err("No password entered");
        }
        req.password = pw;
    }

    return Result<TransferRequest>::Ok(req);
}

std::optional<Config> PushCLI::load_config(const std::optional<std::string>& path) {
    auto result = path ? Config::load(*path) : Config::load();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return std::nullopt;
    }
    return result.value;
}

void PushCLI::print_failure_hints(const TransferResult& result) const {
    std::cout << theme::section("Troubleshooting");
    if (!result.backend || *result.backend != Backend::CLIENT_LIBRARY) {
        std::cout << theme::step("Build with libssh2 support for the most reliable transfers");
    }
    std::cout << theme::step("Check network connectivity and that SSH is reachable");
    std::cout << theme::step("Verify the user name, password or key");
    std::cout << theme::step("Debug log: " + shellpush_log_path());
}

int PushCLI::run_push(const std::vector<std::string>& args) {
    auto parsed = parse_push_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: shellpush push <local> <remote> --host <host>");
        return 1;
    }
    const PushArgs& pa = parsed.value;

    auto config = load_config(pa.config_path);
    if (!config) return 1;

    TransferSettings settings = config->transfer();
    if (pa.backend) {
        auto backend = parse_backend(*pa.backend);
        if (!backend) {
            std::cout << theme::fail("Unknown backend: " + *pa.backend);
            return 1;
        }
        settings.forced_backend = backend;
    }

    auto req = build_request(*config, pa);
    if (req.is_err()) {
        std::cout << theme::fail(req.error);
        return 1;
    }

    std::cout << theme::step(fmt::format("{} -> {}:{}", req.value.local_path,
                                         req.value.host, req.value.remote_path));

    TransferRunner runner(settings);
    runner.on_status([](const std::string& msg) {
        std::cout << theme::log(msg) << std::flush;
    });
    runner.on_progress([](size_t done, size_t total) {
        std::cout << theme::info("Progress: " + format_progress(done, total)) << std::flush;
    });

    TransferResult result = runner.run(req.value);

    if (result.success) {
        std::string remote = result.remote_size
            ? std::to_string(*result.remote_size) : "unverified";
        std::cout << theme::ok(fmt::format("Uploaded {} bytes via {} (remote size {})",
                                           result.local_size,
                                           backend_name(*result.backend), remote));
        return 0;
    }

    std::cout << theme::fail("Upload failed: " + result.error);
    print_failure_hints(result);
    return 1;
}

int PushCLI::run_backends(const std::vector<std::string>& args) {
    bool has_password = false;
    std::optional<std::string> config_path;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--password") {
            has_password = true;
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else {
            std::cout << theme::fail("Unknown option: " + args[i]);
            return 1;
        }
    }

    auto config = load_config(config_path);
    if (!config) return 1;

    auto os = platform::host_os();
    auto tools = detect_tools(config->transfer());

    auto yes_no = [](bool v) { return v ? theme::green("found") : theme::dim("missing"); };

    std::cout << theme::section("Tools");
    std::cout << theme::kv("os", platform::os_name(os));
    std::cout << theme::kv("libssh2", yes_no(tools.client_library));
    std::cout << theme::kv("sshpass", yes_no(tools.password_helper));
    std::cout << theme::kv("ssh", yes_no(tools.openssh_client));

    std::cout << theme::section(has_password ? "Order (with password)" : "Order");
    auto order = select_backends(os, tools, has_password, config->transfer().forced_backend);
    int n = 1;
    for (Backend b : order) {
        std::cout << theme::info(fmt::format("{}. {}", n++, backend_name(b)));
    }
    std::cout << "\n";
    return 0;
}

int PushCLI::run_init(const std::vector<std::string>& args) {
    fs::path path = Config::get_config_path();
    if (args.size() == 2 && args[0] == "--config") {
        path = args[1];
    } else if (!args.empty()) {
        std::cout << theme::fail("Usage: shellpush init [--config PATH]");
        return 1;
    }

    bool existed = fs::exists(path);
    auto result = create_default_config(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    if (existed) {
        std::cout << theme::info("Config already exists: " + path.string());
    } else {
        std::cout << theme::ok("Wrote " + path.string());
    }
    return 0;
}
