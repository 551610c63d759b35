/**
 * @file server.cpp
 * @brief DeeStudio HTTP Server Implementation
 *
 * Uses cpp-httplib for HTTP and nlohmann/json for JSON parsing.
 */

// httplib tuning macros (payload limit, backlog, TCP_NODELAY) are set on the
// deestudio_server target

#include "deestudio/server.h"
#include "deestudio/request_codec.h"

#include <filesystem>
namespace fs = std::filesystem;

#include "cpp-httplib/httplib.h"
#include "nlohmann/json.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace deestudio {

static constexpr const char* MIMETYPE_JSON = "application/json; charset=utf-8";
static constexpr const char* DEESTUDIO_VERSION = "1.0.0";

// Uploaded source images can be large PNGs
static constexpr size_t kMaxPayloadBytes = 64 * 1024 * 1024;

// ============================================================================
// Constructor / Destructor
// ============================================================================

StudioServer::StudioServer(const StudioConfig& config,
                           std::shared_ptr<GenerationOrchestrator> orchestrator,
                           std::shared_ptr<ResourceGuard> guard)
    : config_(config)
    , orchestrator_(std::move(orchestrator))
    , guard_(std::move(guard))
    , svr_(std::make_unique<httplib::Server>())
    , start_time_(std::chrono::steady_clock::now())
{
    try {
        fs::create_directories(config_.output_dir);
    } catch (const std::exception& e) {
        std::cerr << "[Server] Warning: Failed to create output directory: "
                  << e.what() << std::endl;
    }

    const int pool_size = config_.thread_pool_size;
    svr_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };
    svr_->set_payload_max_length(kMaxPayloadBytes);

    setup_middleware();
    setup_routes();
}

StudioServer::~StudioServer() {
    stop();
}

// ============================================================================
// Server Lifecycle
// ============================================================================

bool StudioServer::start() {
    std::cout << "\n";
    std::cout << "================================================================\n";
    std::cout << "  DeeStudio HTTP Server v" << DEESTUDIO_VERSION << "\n";
    std::cout << "================================================================\n";
    std::cout << "  Listening on: http://" << config_.host << ":" << config_.port << "\n";
    std::cout << "  Models:       " << config_.models_root << "\n";
    std::cout << "  Outputs:      " << config_.output_dir << " -> " << config_.images_url_prefix << "\n";
    std::cout << "  Device:       " << guard_->memory().describe() << "\n";
    std::cout << "  CORS:         " << (config_.cors_enabled ? "enabled" : "disabled") << "\n";
    if (!config_.ui_dir.empty()) {
        std::cout << "  Web UI:       http://" << config_.host << ":" << config_.port << "/\n";
        std::cout << "  UI Files:     " << config_.ui_dir << "\n";
    }
    std::cout << "================================================================\n";
    std::cout << "\n";
    std::cout << "  API Endpoints:\n";
    std::cout << "    GET  /api/health                  - Health check\n";
    std::cout << "    GET  /api/models                  - List families\n";
    std::cout << "    GET  /api/models/config           - Family parameters\n";
    std::cout << "    POST /api/models/unload           - Unload resident pipeline\n";
    std::cout << "    POST /api/sdxl/generate           - SDXL text-to-image\n";
    std::cout << "    POST /api/sdxl/transform          - SDXL image-to-image\n";
    std::cout << "    POST /api/flux/generate           - FLUX text-to-image\n";
    std::cout << "    POST /api/flux/transform          - FLUX image-to-image\n";
    std::cout << "    GET  " << config_.images_url_prefix << "/<file>              - Generated images\n";
    std::cout << "\n";
    std::cout << "  Press Ctrl+C to stop the server.\n";
    std::cout << "================================================================\n\n";

    if (!svr_->set_mount_point(config_.images_url_prefix, config_.output_dir)) {
        std::cerr << "[Server] Warning: Failed to mount output directory: " << config_.output_dir << std::endl;
    }

    // Mount Web UI static files directory if configured
    if (!config_.ui_dir.empty()) {
        if (svr_->set_mount_point("/", config_.ui_dir)) {
            std::cout << "[Server] Serving Web UI from: " << config_.ui_dir << std::endl;
        } else {
            std::cerr << "[Server] Warning: Failed to mount UI directory: " << config_.ui_dir << std::endl;
        }
    }

    // Port 0 picks a free port (see port())
    int port = config_.port;
    if (port == 0) {
        port = svr_->bind_to_any_port(config_.host.c_str());
    } else if (!svr_->bind_to_port(config_.host.c_str(), port)) {
        port = -1;
    }
    if (port < 0) {
        std::cerr << "[Server] Failed to start server on "
                  << config_.host << ":" << config_.port << std::endl;
        return false;
    }

    running_ = true;
    bound_port_ = port;
    bool result = svr_->listen_after_bind();
    running_ = false;
    bound_port_ = 0;

    if (!result) {
        std::cerr << "[Server] Listener on port " << port << " exited with an error" << std::endl;
    }

    return result;
}

void StudioServer::stop() {
    if (running_) {
        std::cout << "\n[Server] Shutting down...\n";
        svr_->stop();
        running_ = false;
    }
}

bool StudioServer::is_running() const {
    return running_;
}

int StudioServer::port() const {
    return bound_port_;
}

// ============================================================================
// Middleware Setup
// ============================================================================

void StudioServer::setup_middleware() {
    // Pre-routing handler for CORS and OPTIONS preflight
    svr_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (config_.cors_enabled) {
            std::string origin = req.get_header_value("Origin");
            res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
            res.set_header("Access-Control-Allow-Credentials", "true");
        }

        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res.set_header("Access-Control-Max-Age", "86400");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }

        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Error handler (also serves SPA fallback for Web UI). Runs for every
    // status >= 400; responses a handler already filled are left alone.
    svr_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        if (!config_.ui_dir.empty() && res.status == 404 && req.method == "GET" &&
            req.path.find("/api/") == std::string::npos &&
            req.path.rfind(config_.images_url_prefix, 0) != 0) {
            auto index_path = fs::path(config_.ui_dir) / "index.html";
            if (fs::exists(index_path)) {
                std::ifstream file(index_path, std::ios::binary);
                if (file) {
                    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
                    res.status = 200;
                    res.set_content(content, "text/html");
                    return;
                }
            }
        }
        if (res.status == 404) {
            send_error(res, "Not found: " + req.path, "not_found", 404);
        }
    });

    // Exception handler
    svr_->set_exception_handler([this](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[Server] Unhandled exception: " << e.what() << std::endl;
            send_error(res, std::string("Server error: ") + e.what(), "server_error", 500);
        } catch (...) {
            std::cerr << "[Server] Unhandled non-standard exception" << std::endl;
            send_error(res, "Unknown server error", "server_error", 500);
        }
    });
}

// ============================================================================
// Route Setup
// ============================================================================

bool StudioServer::dispatch_post(const httplib::Request& req, httplib::Response& res) {
    const std::string& path = req.path;

    if (path == "/api/models/unload") {
        handle_unload(req, res);
        return true;
    }

    // /api/{family}/{generate|transform}
    static const std::string kApiPrefix = "/api/";
    if (path.rfind(kApiPrefix, 0) != 0) {
        return false;
    }
    std::string suffix = path.substr(kApiPrefix.size());
    size_t slash_pos = suffix.find('/');
    if (slash_pos == std::string::npos) {
        return false;
    }

    auto family = parse_family(suffix.substr(0, slash_pos));
    if (!family) {
        return false;
    }
    std::string action = suffix.substr(slash_pos + 1);
    if (action == "generate") {
        handle_generate(req, res, *family);
        return true;
    }
    if (action == "transform") {
        handle_transform(req, res, *family);
        return true;
    }
    return false;
}

void StudioServer::setup_routes() {
    std::cout << "[Server] Registering routes..." << std::endl;

    svr_->Post(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!dispatch_post(req, res)) {
            send_error(res, "Not found: " + req.path, "not_found", 404);
        }
    });

    svr_->Get("/api", [this](const httplib::Request&, httplib::Response& res) {
        json response = {
            {"name", "DeeStudio API"},
            {"version", DEESTUDIO_VERSION},
            {"status", "running"},
            {"description", "Image generation with SDXL and FLUX"},
            {"endpoints", {
                {"health", "/api/health"},
                {"models", "/api/models"},
                {"models_config", "/api/models/config"},
                {"unload", "/api/models/unload"},
                {"sdxl", "/api/sdxl/generate"},
                {"flux", "/api/flux/generate"},
                {"images", config_.images_url_prefix}
            }}
        };
        send_json(res, response.dump());
    });

    // Root path - Web UI index.html if available, otherwise API info
    svr_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        if (!config_.ui_dir.empty()) {
            auto index_path = fs::path(config_.ui_dir) / "index.html";
            if (fs::exists(index_path)) {
                std::ifstream file(index_path, std::ios::binary);
                if (file) {
                    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
                    res.set_content(content, "text/html");
                    return;
                }
            }
        }
        json response = {
            {"message", "DeeStudio API"},
            {"version", DEESTUDIO_VERSION},
            {"health", "/api/health"},
            {"ui", config_.ui_dir.empty() ? "not configured" : "enabled at /"}
        };
        send_json(res, response.dump());
    });

    svr_->Get("/api/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr_->Get("/api/models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });
    svr_->Get("/api/models/config", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models_config(req, res);
    });

    std::cout << "[Server] Routes registered" << std::endl;
}

// ============================================================================
// Health & Models
// ============================================================================

void StudioServer::handle_health(const httplib::Request&, httplib::Response& res) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%SZ");

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();

    const DeviceMemory& memory = guard_->memory();
    SlotStatus slot = orchestrator_->cache().status();

    json response = {
        {"status", "healthy"},
        {"version", DEESTUDIO_VERSION},
        {"timestamp", ss.str()},
        {"uptime_seconds", uptime},
        {"cuda_available", memory.is_accelerator()},
        {"device", memory.describe()},
        {"device_total_bytes", memory.total_bytes()},
        {"model_loaded", slot.state == SlotState::Resident},
        {"resident_model", slot.family ? json(family_to_string(*slot.family)) : json(nullptr)},
        {"cache", slot_status_to_json(slot)},
        {"guard", guard_stats_to_json(guard_->stats(), guard_->threshold_bytes())},
        {"requests", total_requests_.load()},
        {"images_generated", total_images_.load()},
        {"errors", total_errors_.load()}
    };

    send_json(res, response.dump());
}

void StudioServer::handle_models(const httplib::Request&, httplib::Response& res) {
    json models = json::array();
    for (const auto& capability : orchestrator_->capabilities()) {
        models.push_back({
            {"id", capability.traits->id},
            {"name", capability.traits->display_name},
            {"available", capability.available},
            {"features", capability.features}
        });
    }
    send_json(res, json{{"models", models}}.dump());
}

void StudioServer::handle_models_config(const httplib::Request&, httplib::Response& res) {
    send_json(res, capabilities_to_json(orchestrator_->capabilities()).dump());
}

void StudioServer::handle_unload(const httplib::Request& req, httplib::Response& res) {
    total_requests_++;
    CancellationToken cancel([&req]() {
        return req.is_connection_closed && req.is_connection_closed();
    });

    Status released = orchestrator_->cache().release(cancel);
    if (!released) {
        send_error(res, released.error());
        return;
    }

    json response = {
        {"status", "success"},
        {"cache", slot_status_to_json(orchestrator_->cache().status())}
    };
    send_json(res, response.dump());
}

// ============================================================================
// Generation
// ============================================================================

void StudioServer::run_and_respond(const httplib::Request& req, httplib::Response& res,
                                   const GenerationRequest& request) {
    // Client disconnect cancels the remaining images
    CancellationToken cancel([&req]() {
        return req.is_connection_closed && req.is_connection_closed();
    });

    auto result = orchestrator_->run(request, cancel);
    if (!result) {
        send_error(res, result.error());
        return;
    }

    total_images_ += result.value().artifacts.size();
    send_json(res, result_to_json(result.value()).dump());
}

void StudioServer::handle_generate(const httplib::Request& req, httplib::Response& res, ModelFamily family) {
    total_requests_++;

    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::exception& e) {
        send_error(res, std::string("JSON parse error: ") + e.what());
        return;
    }

    auto parsed = parse_generation_json(family, GenerationMode::TEXT_TO_IMAGE, body);
    if (!parsed) {
        send_error(res, parsed.error());
        return;
    }
    run_and_respond(req, res, parsed.value());
}

void StudioServer::handle_transform(const httplib::Request& req, httplib::Response& res, ModelFamily family) {
    total_requests_++;

    if (req.is_multipart_form_data()) {
        std::map<std::string, std::string> fields;
        std::vector<uint8_t> image_bytes;
        for (const auto& entry : req.files) {
            if (entry.first == "image") {
                image_bytes.assign(entry.second.content.begin(), entry.second.content.end());
            } else {
                fields[entry.first] = entry.second.content;
            }
        }

        auto parsed = parse_generation_form(family, fields, image_bytes);
        if (!parsed) {
            send_error(res, parsed.error());
            return;
        }
        run_and_respond(req, res, parsed.value());
        return;
    }

    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::exception& e) {
        send_error(res, std::string("JSON parse error: ") + e.what());
        return;
    }

    auto parsed = parse_generation_json(family, GenerationMode::IMAGE_TO_IMAGE, body);
    if (!parsed) {
        send_error(res, parsed.error());
        return;
    }
    run_and_respond(req, res, parsed.value());
}

// ============================================================================
// Response Utilities
// ============================================================================

void StudioServer::send_json(httplib::Response& res, const std::string& json_str, int status) {
    res.status = status;
    res.set_content(json_str, MIMETYPE_JSON);
}

void StudioServer::send_error(httplib::Response& res, const std::string& message,
                              const std::string& error_type, int status) {
    total_errors_++;
    json error = {
        {"error", {
            {"message", message},
            {"type", error_type},
            {"code", status}
        }}
    };
    res.status = status;
    res.set_content(error.dump(), MIMETYPE_JSON);
}

void StudioServer::send_error(httplib::Response& res, const Error& error) {
    total_errors_++;
    res.status = error.http_status;
    res.set_content(error_to_json(error).dump(), MIMETYPE_JSON);
}

} // namespace deestudio
