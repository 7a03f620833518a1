#include "action/action.hpp"
#include "command_channel.hpp"
#include "core_context.hpp"
#include "credentials.hpp"
#include "ipc_server.hpp"
#include "logger.hpp"
#include "mcp_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

// Matches "--name value" and "--name=value".
bool take_value(int argc, char** argv, int& i, const char* name, std::string& out) {
    const size_t len = strlen(name);
    if (strcmp(argv[i], name) == 0 && i + 1 < argc) {
        out = argv[++i];
        return true;
    }
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        out = argv[i] + len + 1;
        return true;
    }
    return false;
}

bool parse_port(const std::string& text, int& port) {
    char* end = nullptr;
    long value = strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<int>(value);
    return true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config PATH       log4cplus configuration (default log4cplus.ini)\n"
              << "  --http-host HOST    tool server host (default localhost)\n"
              << "  --http-port PORT    tool server port (default 11809)\n"
              << "  --ws-host HOST      extension channel host (default localhost)\n"
              << "  --ws-port PORT      extension channel port (default 11808)\n"
              << "  --socket PATH       control socket (default /tmp/dombridge.sock)\n"
              << "  --selectors PATH    selector preset file (default llmcp_selectors.json)\n"
              << "  --timeout SECONDS   tool call timeout (default 30)\n"
              << "  --tls-cert PATH     serve HTTPS with this certificate\n"
              << "  --tls-key PATH      private key for --tls-cert\n"
              << "  --pdeathsig         exit when the parent process dies\n"
              << "  -v, --version       print version and exit\n";
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    BridgeOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string value;

        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << VERSION_STRING << std::endl;
            std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            options.enable_pdeathsig = true;
            continue;
        }

        if (take_value(argc, argv, i, "--config", options.log_config) ||
            take_value(argc, argv, i, "--http-host", options.http_host) ||
            take_value(argc, argv, i, "--ws-host", options.ws_host) ||
            take_value(argc, argv, i, "--socket", options.socket_path) ||
            take_value(argc, argv, i, "--selectors", options.selector_file) ||
            take_value(argc, argv, i, "--tls-cert", options.tls_cert) ||
            take_value(argc, argv, i, "--tls-key", options.tls_key)) {
            continue;
        }

        if (take_value(argc, argv, i, "--http-port", value)) {
            if (!parse_port(value, options.http_port)) {
                std::cerr << "Invalid --http-port: " << value << std::endl;
                return 2;
            }
            continue;
        }

        if (take_value(argc, argv, i, "--ws-port", value)) {
            int port = 0;
            if (!parse_port(value, port)) {
                std::cerr << "Invalid --ws-port: " << value << std::endl;
                return 2;
            }
            options.ws_port = static_cast<uint16_t>(port);
            continue;
        }

        if (take_value(argc, argv, i, "--timeout", value)) {
            int seconds = atoi(value.c_str());
            if (seconds <= 0) {
                std::cerr << "Invalid --timeout: " << value << std::endl;
                return 2;
            }
            options.request_timeout = std::chrono::seconds(seconds);
            continue;
        }

        std::cerr << "Unknown option: " << argv[i] << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (options.tls_cert.empty() != options.tls_key.empty()) {
        std::cerr << "--tls-cert and --tls-key must be given together" << std::endl;
        return 2;
    }

#ifdef __linux__
    if (options.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(options.log_config);

    LOG4CPLUS_INFO(core_logger(), "dombridge starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (options.enable_pdeathsig ? "enabled" : "disabled"));

    signal(SIGINT, handle_stop_signal);
    signal(SIGTERM, handle_stop_signal);
    signal(SIGPIPE, SIG_IGN);

    dombridge::CommandChannel channel(options.ws_host, options.ws_port);
    BridgeContext context(channel, options.selector_file);
    if (!context.selectors.load()) {
        LOG4CPLUS_WARN(core_logger(), "Selector file " << options.selector_file << " could not be read");
    }
    context.dispatcher.set_default_timeout(options.request_timeout);
    channel.on_result([&context](const nlohmann::json& envelope) { context.router.route(envelope); });

    if (!channel.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start extension channel on " << options.ws_host << ":"
                                                                              << options.ws_port);
        return 1;
    }
    LOG4CPLUS_INFO(core_logger(), "Extension channel: ws://" << channel.host() << ":" << channel.port());

    std::unique_ptr<dombridge::CredentialProvider> credentials;
    if (!options.tls_cert.empty()) {
        credentials = std::make_unique<dombridge::FileCredentialProvider>(options.tls_cert, options.tls_key);
    }

    dombridge::mcp::ServerConfig http_config;
    http_config.host = options.http_host;
    http_config.port = options.http_port;

    dombridge::mcp::RequestHandler rpc(context.dispatcher, context.sse);
    dombridge::mcp::HttpServer http(http_config, rpc, context.dispatcher, context.sse, credentials.get());
    if (!http.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start tool server on " << options.http_host << ":"
                                                                         << options.http_port);
        channel.stop();
        return 1;
    }
    LOG4CPLUS_INFO(core_logger(), "Tool server: " << (http.tls_enabled() ? "https" : "http") << "://"
                                                  << options.http_host << ":" << http.port());

    dombridge::ipc::IpcServer control(options.socket_path, [&context](const std::string& request_bytes) {
        return dombridge::actions::handle_action(request_bytes, context);
    });
    if (!control.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start control socket at " << options.socket_path);
        http.stop();
        channel.stop();
        return 1;
    }
    LOG4CPLUS_INFO(core_logger(), "Control socket: " << options.socket_path);

    auto last_sweep = std::chrono::steady_clock::now();
    while (!g_stop_requested.load()) {
        ::sleep(1);

        auto now = std::chrono::steady_clock::now();
        if (now - last_sweep >= options.sweep_interval) {
            last_sweep = now;
            std::size_t removed = context.correlator.sweep(options.stale_age);
            if (removed > 0) {
                LOG4CPLUS_INFO(core_logger(), "Swept " << removed << " stale requests");
            }
        }
    }

    LOG4CPLUS_INFO(core_logger(), "Shutting down");
    control.stop();
    http.stop();
    channel.stop();
    LOG4CPLUS_INFO(core_logger(), "Stopped");

    return 0;
}
