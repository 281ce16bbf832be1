#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <filesystem>

#include "batch_processor.hpp"
#include "config_manager.hpp"
#include "root_pipeline.hpp"

using namespace RootVision;

static std::string getenv_str(const char* key, const char* def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string(def);
}

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [input] [output_dir] [config.json]\n"
              << "  input       image file or directory of images (env INPUT_PATH)\n"
              << "  output_dir  where masks and trees are written (env OUTPUT_DIR)\n"
              << "  config.json pipeline configuration (env CONFIG_PATH)\n"
              << "  --params    print the pipeline parameters and exit" << std::endl;
}

int main(int argc, char** argv) {
    bool list_params = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--params") {
            list_params = true;
            continue;
        }
        positional.push_back(arg);
    }

    std::string input_path = getenv_str("INPUT_PATH", "");
    std::string output_dir = getenv_str("OUTPUT_DIR", "");
    std::string config_path = getenv_str("CONFIG_PATH", "");
    if (positional.size() > 0) input_path = positional[0];
    if (positional.size() > 1) output_dir = positional[1];
    if (positional.size() > 2) config_path = positional[2];

    ConfigManager config;
    if (!config_path.empty()) {
        if (!config.loadConfig(config_path)) {
            return 1;
        }
    } else {
        std::cout << "No configuration file given, using defaults" << std::endl;
    }

    if (!config.validateConfig()) {
        for (const auto& error : config.getValidationErrors()) {
            std::cerr << "Invalid configuration: " << error << std::endl;
        }
        return 1;
    }

    const PipelineConfig& cfg = config.getPipelineConfig();
    Pipeline pipeline = makeRootPipeline(cfg.plate, cfg.segment, cfg.leaves);

    if (list_params) {
        std::cout << pipeline.parameters().dump(2) << std::endl;
        return 0;
    }

    if (input_path.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    OutputConfig output = cfg.output;
    if (!output_dir.empty()) output.directory = output_dir;

    std::vector<std::string> files = listImages(input_path);
    if (files.empty()) {
        std::cerr << "No image to process in " << input_path << std::endl;
        return 1;
    }

    BatchResult result = processBatch(files, pipeline, output, cfg.segment.verbose);

    std::cout << "Processed " << result.processed << "/" << files.size() << " images" << std::endl;
    if (!result.failed.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(output.directory, ec);
        const std::string report = (std::filesystem::path(output.directory) / "failed_files.json").string();
        std::ofstream f(report);
        if (f) {
            f << result.toJson().dump(2);
            std::cout << "Failures recorded in " << report << std::endl;
        } else {
            std::cerr << "Failed to write failure report " << report << std::endl;
        }
        return 2;
    }
    return 0;
}
