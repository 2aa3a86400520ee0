// Kosha MCP Server
// JSON-RPC tool server for a support assistant's reasoning loop
//
// Reads one JSON-RPC request per line on stdin, writes one response per
// line on stdout. Diagnostics go to stderr.
//
// Usage:
//   kosha_mcp [options]
//
// Options:
//   --path PATH         Knowledge base directory
//   --max-calls N       Tool calls per conversation
//   --max-unproductive N  Consecutive weak retrievals before the budget trips
//   --no-seed           Do not seed an empty knowledge base
//   --model PATH        Path to ONNX model file
//   --vocab PATH        Path to vocabulary file

#include <kosha/kosha.hpp>
#include <kosha/rpc/handler.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <pthread.h>
#include <stdexcept>
#include <thread>

// SIGTERM/SIGINT/SIGHUP are blocked in every thread and taken by one
// waiter with sigwait(), so persisting runs outside signal context and
// waits for an ingest in progress instead of deadlocking on it.
static std::atomic<bool> g_stopping{false};

std::thread start_shutdown_waiter(kosha::Backend& backend, sigset_t signals) {
    return std::thread([&backend, signals]() {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0 || g_stopping.load()) return;
        try {
            backend.close();
            std::cerr << "[kosha_mcp] Signal " << sig << " received, state saved\n";
        } catch (const std::exception& e) {
            std::cerr << "[kosha_mcp] Signal " << sig << " received, save failed: " << e.what() << "\n";
        }
        std::_Exit(0);
    });
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --path PATH             Knowledge base directory (default: ./knowledge_base)\n"
              << "  --max-calls N           Tool calls per conversation (default: 12)\n"
              << "  --max-unproductive N    Weak retrievals in a row before stopping (default: 3)\n"
              << "  --no-seed               Do not seed an empty knowledge base with samples\n"
#ifdef KOSHA_WITH_ONNX
              << "  --model PATH            Path to ONNX model file\n"
              << "  --vocab PATH            Path to vocabulary file\n"
#endif
              << "  --help                  Show this help message\n"
              << "\n"
              << "Environment: KOSHA_DATA_DIR, KOSHA_SEARCH_API_URL, KOSHA_MAX_TOOL_CALLS, ...\n";
}

int run(const kosha::BackendConfig& config) {
    // Block before any thread exists so every worker inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGHUP);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        throw std::runtime_error("cannot block shutdown signals");
    }

    kosha::Backend backend(config);

#ifdef KOSHA_WITH_ONNX
    if (!config.model_path.empty() && !config.vocab_path.empty()) {
        backend.attach_embedder(kosha::create_onnx_embedder(config.model_path, config.vocab_path));
        std::cerr << "[kosha_mcp] Embedder attached: " << config.model_path << "\n";
    }
#endif

    backend.open();

    std::thread waiter = start_shutdown_waiter(backend, signals);

    std::cerr << "[kosha_mcp] Knowledge base: " << backend.stats().passages << " passages at "
              << config.data_dir << "\n";
    std::cerr << "[kosha_mcp] Listening on stdin...\n";

    kosha::rpc::Handler handler(&backend);
    std::string line;
    while (!handler.shutdown_requested() && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::string response = handler.handle(line);
        if (response.empty()) continue;
        std::cout << response << "\n";
        std::cout.flush();
    }

    int status = 0;
    try {
        backend.close();
    } catch (const std::exception& e) {
        std::cerr << "[kosha_mcp] Save on shutdown failed: " << e.what() << "\n";
        status = 1;
    }

    // Wake the waiter so it exits before backend goes away
    g_stopping.store(true);
    pthread_kill(waiter.native_handle(), SIGHUP);
    waiter.join();

    std::cerr << "[kosha_mcp] Shutdown complete\n";
    return status;
}

int main(int argc, char* argv[]) {
    try {
        kosha::BackendConfig config = kosha::BackendConfig::from_env();

        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
                config.data_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--max-calls") == 0 && i + 1 < argc) {
                config.max_calls = kosha::config_detail::parse_count("--max-calls", argv[++i]);
            } else if (std::strcmp(argv[i], "--max-unproductive") == 0 && i + 1 < argc) {
                config.max_unproductive = kosha::config_detail::parse_count("--max-unproductive", argv[++i]);
            } else if (std::strcmp(argv[i], "--no-seed") == 0) {
                config.seed_samples = false;
            } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
                config.model_path = argv[++i];
            } else if (std::strcmp(argv[i], "--vocab") == 0 && i + 1 < argc) {
                config.vocab_path = argv[++i];
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        return run(config);
    } catch (const std::exception& e) {
        std::cerr << "[kosha_mcp] Error: " << e.what() << "\n";
        return 1;
    }
}
