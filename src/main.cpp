/*
 * Mockrun - Sandboxed execution of user-defined mock endpoints
 * Light (embedded QuickJS) and Heavy (isolated node) strategies
 */

#include "http_server.h"
#include "api_routes.h"
#include "config.h"
#include "memory_store.h"
#include "environment_manager.h"
#include "code_executor.h"
#include "rate_limiter.h"
#include "orchestrator.h"
#include "errors.h"
#include <iostream>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <csignal>

using namespace mockrun;

namespace {

HttpServer* g_server = nullptr;

void handle_shutdown_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::load(argc, argv);
    } catch (const ExecutionError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        std::cerr << ServiceConfig::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << ServiceConfig::usage(argv[0]);
        return 0;
    }

    std::cout << "🏃 Mockrun - Sandboxed Mock Endpoint Execution" << std::endl;
    std::cout << "   Light (QuickJS) • Heavy (isolated node) • Audited" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    MemoryStore store;
    if (!config.data_file.empty()) {
        try {
            store.load_file(config.data_file);
            std::cout << "Loaded fixture: " << config.data_file << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "❌ Failed to load fixture " << config.data_file << ": " << e.what() << std::endl;
            return 1;
        }
    }

    EnvironmentManager environments(config.environment_config());
    environments.start_sweeper();

    EnvironmentHealth heavy = environments.health_check();
    if (heavy.healthy) {
        std::cout << "Heavy isolation: available (" << heavy.max_environments
                  << " environments max)" << std::endl;
    } else {
        std::cout << "Heavy isolation: unavailable (" << heavy.reason << ")" << std::endl;
        if (config.strict_isolation) {
            std::cout << "  Strict mode: Heavy requests will be refused" << std::endl;
        }
    }

    CodeExecutor executor(environments, config.executor_config());
    RateLimiter rate_limiter(config.rate_limit_config());
    Orchestrator orchestrator(executor, environments, rate_limiter,
                              Orchestrator::Collaborators{store, store, store, store, store});

    HttpServer server(config.port);
    register_routes(server, orchestrator);

    g_server = &server;
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
    std::signal(SIGPIPE, SIG_IGN);

    // Forget idle rate-limit windows periodically
    std::mutex maintenance_mutex;
    std::condition_variable maintenance_cv;
    bool maintenance_stop = false;
    std::thread maintenance([&]() {
        std::unique_lock<std::mutex> lock(maintenance_mutex);
        while (!maintenance_cv.wait_for(lock, std::chrono::minutes(1),
                                        [&] { return maintenance_stop; })) {
            rate_limiter.cleanup_old_entries();
        }
    });

    std::cout << "Starting server on port " << config.port << "..." << std::endl;
    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /endpoints/{id}/execute  - Execute endpoint code" << std::endl;
    std::cout << "  GET  /endpoints/{id}/history  - Recent executions" << std::endl;
    std::cout << "  GET  /health                  - Service health" << std::endl;
    std::cout << std::endl;

    int exit_code = 0;
    try {
        // Blocks until stop()
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "❌ Server failed: " << e.what() << std::endl;
        exit_code = 1;
    }
    g_server = nullptr;

    {
        std::lock_guard<std::mutex> lock(maintenance_mutex);
        maintenance_stop = true;
    }
    maintenance_cv.notify_all();
    maintenance.join();

    environments.stop_sweeper();
    std::cout << "Shut down" << std::endl;
    return exit_code;
}
