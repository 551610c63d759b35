/**
 * @file server.h
 * @brief DeeStudio HTTP server
 *
 * Endpoints:
 *   GET  /                            - Web UI (if configured) or API info
 *   GET  /api/health                  - Health, accelerator and cache slot status
 *   GET  /api/models                  - Family availability list
 *   GET  /api/models/config           - Family parameter ranges and defaults
 *   POST /api/models/unload           - Drain the cache slot
 *   POST /api/{sdxl,flux}/generate    - Text-to-image (JSON)
 *   POST /api/{sdxl,flux}/transform   - Image-to-image (multipart, or JSON with base64 image)
 *   GET  /images/<file>               - Persisted artifacts
 */

#pragma once

#include "config.h"
#include "generation_orchestrator.h"
#include "outcome.h"
#include "resource_guard.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// Forward declarations
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace deestudio {

/**
 * @brief DeeStudio HTTP Server
 *
 * Usage:
 *   StudioServer server(config, orchestrator, guard);
 *   server.start();   // blocking
 */
class StudioServer {
public:
    StudioServer(const StudioConfig& config,
                 std::shared_ptr<GenerationOrchestrator> orchestrator,
                 std::shared_ptr<ResourceGuard> guard);

    ~StudioServer();

    // Non-copyable
    StudioServer(const StudioServer&) = delete;
    StudioServer& operator=(const StudioServer&) = delete;

    /**
     * @brief Start the HTTP server (blocking until stop())
     * @return false if the socket could not be bound
     */
    bool start();

    /**
     * @brief Stop the server; safe to call from another thread
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Port the listener is bound to, 0 before start() has bound
     */
    int port() const;

private:
    StudioConfig config_;
    std::shared_ptr<GenerationOrchestrator> orchestrator_;
    std::shared_ptr<ResourceGuard> guard_;

    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};

    std::chrono::steady_clock::time_point start_time_;
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_images_{0};
    std::atomic<uint64_t> total_errors_{0};

    // Route setup
    void setup_routes();
    void setup_middleware();
    bool dispatch_post(const httplib::Request& req, httplib::Response& res);

    // Endpoint handlers
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);
    void handle_models_config(const httplib::Request& req, httplib::Response& res);
    void handle_unload(const httplib::Request& req, httplib::Response& res);
    void handle_generate(const httplib::Request& req, httplib::Response& res, ModelFamily family);
    void handle_transform(const httplib::Request& req, httplib::Response& res, ModelFamily family);

    void run_and_respond(const httplib::Request& req, httplib::Response& res,
                         const GenerationRequest& request);

    // Response utilities
    void send_json(httplib::Response& res, const std::string& json_str, int status = 200);
    void send_error(httplib::Response& res, const std::string& message,
                    const std::string& error_type = "validation_error", int status = 400);
    void send_error(httplib::Response& res, const Error& error);
};

} // namespace deestudio
