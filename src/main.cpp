#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <memory>
#include "app_config.hpp"
#include "app_log.hpp"
#include "cancel_context.hpp"
#include "completion_service.hpp"
#include "executors/binary_executor.hpp"
#include "http_server.hpp"
#include "mcp_dispatcher.hpp"

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// Very small CLI parser
struct Args {
    std::string config_file = kDefaultConfigFile;
    std::string port;  // overrides HttpPort when set
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config FILE] [--port [HOST]:PORT]\n";
    std::cout << "\nServes the generate_completion MCP tool backed by llama-cli.\n";
    std::cout << "Settings are read from FILE (default " << kDefaultConfigFile << ") and the environment.\n";
    std::cout << "Stop with Ctrl+C (SIGINT) or SIGTERM.\n";
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--config" && i + 1 < argc) { a.config_file = argv[++i]; }
        else if (s == "--port" && i + 1 < argc) { a.port = argv[++i]; }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    auto args = parse_args(argc, argv);

    EnvSource env;
    std::string error;
    if (!env.load_file(args.config_file, error)) {
        log_error("app") << "Warning: Error loading .env file: " << error;
    }

    const LlamaCliConfig llama = parse_llama_cli_config(env);
    AppConfig app = parse_app_config(env);
    if (!args.port.empty()) app.http_port = args.port;

    if (!AppLog::open(app.app_log_path, app.app_log_file_name, error)) {
        log_error("app") << "Failed to setup logging: " << error;
        return 1;
    }
    log_info("app") << "Logging initialized - writing to " << AppLog::file_path();
    log_info("app") << "Application starting...";

    if (app.llama_cli_path.empty()) {
        log_error("app") << "LLamaCliPath is not set; every completion will fail until it is configured";
    }

    ListenOptions listen;
    if (!parse_listen_address(app.http_port, app.bind_address, listen.address, listen.port, error)) {
        log_error("app") << error;
        AppLog::close();
        return 1;
    }
    listen.target = app.end_point;
    listen.use_tls = app.use_tls;
    listen.cert_file = app.tls_cert_file;
    listen.key_file = app.tls_key_file;

    // Cancelled on shutdown; every request context derives from it.
    auto root = CancelContext::background();

    CompletionService service{app, llama, std::make_shared<BinaryExecutor>(), root};
    McpDispatcher dispatcher{service};
    HttpServer server{dispatcher, root};

    if (!server.start(listen, error)) {
        log_error("app") << "Server error: " << error;
        AppLog::close();
        return 2;
    }

    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    log_info("app") << "Received shutdown signal...";

    server.stop(std::chrono::seconds(30));

    auto m = service.metrics();
    log_info("app") << "Served " << m.requests << " request(s): " << m.successes << " ok, " << m.errors
                    << " failed (" << m.timeouts << " timed out, " << m.cancellations << " cancelled)";
    log_info("app") << "Application shutdown complete";
    AppLog::close();
    return 0;
}
