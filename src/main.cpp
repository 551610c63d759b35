/**
 * @file main.cpp
 * @brief DeeStudio CLI - SDXL / FLUX image studio
 */

#include "deestudio/artifact_store.h"
#include "deestudio/config.h"
#include "deestudio/device_memory.h"
#include "deestudio/generation_orchestrator.h"
#include "deestudio/model_registry.h"
#include "deestudio/pipeline_cache.h"
#include "deestudio/resource_guard.h"
#include "deestudio/sd_pipeline_loader.h"
#include "deestudio/server.h"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace deestudio;

namespace {

StudioServer* g_server = nullptr;

void handle_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

void print_banner() {
    std::cout << "\n";
    std::cout << "  DeeStudio v1.0.0\n";
    std::cout << "  SDXL / FLUX image generation with a single resident pipeline\n";
    std::cout << std::endl;
}

void print_usage() {
    std::cout << "Usage: deestudio [OPTIONS]\n\n";
    std::cout << "General Options:\n";
    std::cout << "  --config PATH               JSON config file (default: ~/.config/deestudio/config.json)\n";
    std::cout << "  --models-root PATH          Root directory of model weights (default: models)\n";
    std::cout << "  --output-dir PATH           Directory for generated images (default: outputs/images)\n";
    std::cout << "  --system-info               Print backend build information\n";
    std::cout << "\nServer Mode:\n";
    std::cout << "  --server                    Start HTTP server mode\n";
    std::cout << "  --host HOST                 Server host (default: 127.0.0.1)\n";
    std::cout << "  --port PORT                 Server port (default: 8000)\n";
    std::cout << "  --ui-dir PATH               Serve a static Web UI from PATH\n";
    std::cout << "  --threads N                 HTTP worker threads (default: 8)\n";
    std::cout << "  --max-queued N              Requests allowed to wait for the GPU (default: threads - 2)\n";
    std::cout << "\nImage Generation Options:\n";
    std::cout << "  --generate-image PROMPT     Generate image(s) from prompt and exit\n";
    std::cout << "  --family NAME               sdxl or flux (default: flux)\n";
    std::cout << "  --width N                   Image width (default: family default)\n";
    std::cout << "  --height N                  Image height (default: family default)\n";
    std::cout << "  --steps N                   Sampling steps (default: family default)\n";
    std::cout << "  --guidance N                CFG scale (sdxl) or guidance (flux)\n";
    std::cout << "  --count N                   Number of images, 1-4 (default: 1)\n";
    std::cout << "  --seed N                    Random seed (-1 for random)\n";
    std::cout << "  --negative PROMPT           Negative prompt (sdxl only)\n";
    std::cout << "  --help                      Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  deestudio --server --port 8000 --models-root /data/models\n";
    std::cout << "  deestudio --generate-image \"a lighthouse at dusk\" --family sdxl --seed 42 --count 2\n\n";
}

int run_one_shot(GenerationOrchestrator& orchestrator, const GenerationRequest& request) {
    const FamilyTraits& traits = family_traits(request.family);

    std::cout << "\n=== Image Generation ===\n";
    std::cout << "Family: " << traits.display_name << "\n";
    std::cout << "Prompt: " << request.prompt << "\n";
    std::cout << "Size: " << request.size.width << "x" << request.size.height << "\n";
    std::cout << "Steps: " << request.steps << "\n";
    std::cout << (traits.guidance_kind == GuidanceKind::CFG ? "CFG Scale: " : "Guidance: ")
              << request.guidance << "\n";
    std::cout << "Count: " << request.num_images << "\n";
    std::cout << "\nGenerating...\n";

    auto result = orchestrator.run(request);
    if (!result) {
        const Error& error = result.error();
        std::cerr << "Image generation failed: " << error.to_string() << "\n";
        if (error.images_completed > 0) {
            std::cerr << "  Images completed before failure: " << error.images_completed << "\n";
        }
        return 1;
    }

    const GenerationResult& generated = result.value();
    std::cout << "=== Image Generated Successfully ===\n";
    for (size_t i = 0; i < generated.artifacts.size(); ++i) {
        const Artifact& artifact = generated.artifacts[i];
        std::cout << "  [" << i << "] " << artifact.path << " (seed " << artifact.seed << ")\n";
    }
    std::cout << "  Time: " << std::fixed << std::setprecision(2) << generated.generation_time_s << " s\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    print_banner();

    if (argc == 1) {
        std::cout << "No arguments provided. Showing help:\n\n";
        print_usage();
        return 0;
    }

    // First pass: locate the config file so flags can override it
    std::string config_path = default_config_path();
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }

    StudioConfig config;
    std::string config_error;
    if (!load_config_file(config_path, config, config_error) && !config_error.empty()) {
        std::cerr << "[Config] " << config_error << "\n";
        return 1;
    }
    apply_env_overrides(config);

    bool server_mode = false;
    bool system_info_mode = false;
    std::string image_prompt;
    std::string family_name = "flux";
    int img_width = 0;
    int img_height = 0;
    int steps = 0;
    float guidance = -1.0f;
    int count = 1;
    long long seed = -1;
    std::string negative_prompt;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            else if (arg == "--config" && i + 1 < argc) {
                ++i;
            }
            else if (arg == "--server") {
                server_mode = true;
            }
            else if (arg == "--system-info") {
                system_info_mode = true;
            }
            else if (arg == "--host" && i + 1 < argc) {
                config.host = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc) {
                config.port = std::stoi(argv[++i]);
            }
            else if (arg == "--threads" && i + 1 < argc) {
                config.thread_pool_size = std::stoi(argv[++i]);
            }
            else if (arg == "--max-queued" && i + 1 < argc) {
                config.max_queued_requests = std::stoi(argv[++i]);
            }
            else if (arg == "--ui-dir" && i + 1 < argc) {
                config.ui_dir = argv[++i];
            }
            else if (arg == "--models-root" && i + 1 < argc) {
                config.models_root = argv[++i];
            }
            else if (arg == "--output-dir" && i + 1 < argc) {
                config.output_dir = argv[++i];
            }
            else if (arg == "--generate-image" && i + 1 < argc) {
                image_prompt = argv[++i];
            }
            else if (arg == "--family" && i + 1 < argc) {
                family_name = argv[++i];
            }
            else if (arg == "--width" && i + 1 < argc) {
                img_width = std::stoi(argv[++i]);
            }
            else if (arg == "--height" && i + 1 < argc) {
                img_height = std::stoi(argv[++i]);
            }
            else if (arg == "--steps" && i + 1 < argc) {
                steps = std::stoi(argv[++i]);
            }
            else if ((arg == "--guidance" || arg == "--cfg-scale") && i + 1 < argc) {
                guidance = std::stof(argv[++i]);
            }
            else if (arg == "--count" && i + 1 < argc) {
                count = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
            }
            else if (arg == "--negative" && i + 1 < argc) {
                negative_prompt = argv[++i];
            }
            else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    if (system_info_mode) {
        std::cout << SdPipelineLoader::system_info() << "\n";
        return 0;
    }

    std::string config_problem = validate_config(config);
    if (!config_problem.empty()) {
        std::cerr << "[Config] Invalid configuration: " << config_problem << "\n";
        return 1;
    }

    // Assemble the service graph
    auto memory = create_device_memory();
    auto guard = std::make_shared<ResourceGuard>(memory, config.admission_threshold_bytes());
    auto registry = std::make_shared<ModelRegistry>(config.registry_config());
    auto loader = std::make_shared<SdPipelineLoader>(config.loader_config());
    auto cache = std::make_shared<PipelineCache>(loader, guard, registry, config.cache_options());
    auto store = std::make_shared<ArtifactStore>(config.artifact_config());
    auto orchestrator = std::make_shared<GenerationOrchestrator>(
        cache, store, registry, config.orchestrator_options());

    std::cout << "[Main] Device: " << memory->describe() << "\n";
    std::cout << "[Main] Models root: " << config.models_root << "\n";
    for (ModelFamily family : all_families()) {
        std::cout << "[Main]   " << family_to_string(family) << ": "
                  << (registry->is_available(family) ? "available" : "missing weights") << "\n";
    }

    // =========================================================================
    // Server Mode - Start HTTP server and block
    // =========================================================================
    if (server_mode) {
        StudioServer server(config, orchestrator, guard);
        g_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        bool started = server.start();
        g_server = nullptr;

        if (!started) {
            std::cerr << "[Server] Failed to start HTTP server\n";
            return 1;
        }
        return 0;
    }

    if (!image_prompt.empty()) {
        auto family = parse_family(family_name);
        if (!family) {
            std::cerr << "Unknown family: " << family_name << " (expected sdxl or flux)\n";
            return 1;
        }
        const FamilyTraits& traits = family_traits(*family);

        GenerationRequest request;
        request.family = *family;
        request.mode = GenerationMode::TEXT_TO_IMAGE;
        request.prompt = image_prompt;
        request.size.width = img_width > 0 ? img_width : traits.default_size.width;
        request.size.height = img_height > 0 ? img_height : traits.default_size.height;
        request.steps = steps > 0 ? steps : traits.default_steps;
        request.guidance = guidance >= 0.0f ? guidance : traits.default_guidance;
        request.num_images = count;
        if (seed != -1) {
            request.seed = static_cast<int64_t>(seed);
        }
        if (!negative_prompt.empty()) {
            request.negative_prompt = negative_prompt;
        }
        return run_one_shot(*orchestrator, request);
    }

    std::cout << "Nothing to do. Use --server or --generate-image (see --help).\n";
    return 0;
}
