#include "config_manager.hpp"
#include <iostream>
#include <fstream>
#include <stdexcept>

namespace RootVision {

ConfigManager::ConfigManager() : is_loaded(false) {}

ConfigManager::~ConfigManager() {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    config_file_path = config_path;

    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "Failed to open config file: " << config_path << std::endl;
            return false;
        }

        nlohmann::json parsed;
        config_file >> parsed;
        config_file.close();

        if (!loadFromJson(parsed)) {
            return false;
        }

        std::cout << "Configuration loaded successfully from: " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromJson(const nlohmann::json& config) {
    if (!config.is_object()) {
        std::cerr << "Error loading configuration: top level must be an object" << std::endl;
        return false;
    }

    const PipelineConfig previous = pipeline_config;
    const nlohmann::json previous_json = config_json;
    try {
        config_json = config;
        pipeline_config = PipelineConfig();
        parseConfig();
    } catch (const std::exception& e) {
        std::cerr << "Error parsing configuration: " << e.what() << std::endl;
        pipeline_config = previous;
        config_json = previous_json;
        return false;
    }

    is_loaded = true;
    return true;
}

bool ConfigManager::reloadConfig() {
    if (config_file_path.empty()) {
        std::cerr << "No config file path set for reload" << std::endl;
        return false;
    }
    return loadConfig(config_file_path);
}

void ConfigManager::parseConfig() {
    parsePlateConfig();
    parseSegmentConfig();
    parseLeavesConfig();
    parseOutputConfig();
}

void ConfigManager::parsePlateConfig() {
    if (!config_json.contains("plate")) return;
    const auto& plate = config_json["plate"];

    pipeline_config.plate.border_width = plate.value("border_width", pipeline_config.plate.border_width);
    pipeline_config.plate.shape = plate.value("shape", pipeline_config.plate.shape);
    pipeline_config.plate.smooth = plate.value("smooth", pipeline_config.plate.smooth);
}

void ConfigManager::parseSegmentConfig() {
    if (!config_json.contains("segment")) return;
    const auto& segment = config_json["segment"];
    auto& options = pipeline_config.segment;

    options.root_max_radius = segment.value("root_max_radius", options.root_max_radius);
    options.min_dimension = segment.value("min_dimension", options.min_dimension);
    options.smooth = segment.value("smooth", options.smooth);
    options.verbose = segment.value("verbose", options.verbose);
}

void ConfigManager::parseLeavesConfig() {
    if (!config_json.contains("leaves")) return;
    const auto& leaves = config_json["leaves"];
    auto& options = pipeline_config.leaves;

    options.plant_number = leaves.value("plant_number", options.plant_number);
    options.root_min_radius = leaves.value("root_min_radius", options.root_min_radius);
    options.sort = leaves.value("sort", options.sort);

    if (leaves.contains("leaf_height")) {
        const auto& band = leaves["leaf_height"];
        if (!band.is_array() || band.size() != 2) {
            throw std::invalid_argument("leaves.leaf_height must be a pair of numbers");
        }
        options.leaf_height = {band[0].get<double>(), band[1].get<double>()};
    }
}

void ConfigManager::parseOutputConfig() {
    if (!config_json.contains("output")) return;
    const auto& output = config_json["output"];

    pipeline_config.output.directory = output.value("directory", pipeline_config.output.directory);
    pipeline_config.output.save_masks = output.value("save_masks", pipeline_config.output.save_masks);
    pipeline_config.output.save_tree = output.value("save_tree", pipeline_config.output.save_tree);
}

bool ConfigManager::validateConfig() const {
    return getValidationErrors().empty();
}

std::vector<std::string> ConfigManager::getValidationErrors() const {
    std::vector<std::string> errors;
    const auto& plate = pipeline_config.plate;
    const auto& segment = pipeline_config.segment;
    const auto& leaves = pipeline_config.leaves;

    if (plate.border_width < 0 || plate.border_width >= 0.5) {
        errors.push_back("plate.border_width must be in [0, 0.5)");
    }
    if (plate.shape != "contour" && plate.shape != "convex") {
        errors.push_back("plate.shape must be 'contour' or 'convex'");
    }
    if (segment.root_max_radius <= 0) {
        errors.push_back("segment.root_max_radius must be positive");
    }
    if (segment.min_dimension < 0) {
        errors.push_back("segment.min_dimension must not be negative");
    }
    if (segment.smooth < 0) {
        errors.push_back("segment.smooth must not be negative");
    }
    if (leaves.plant_number <= 0) {
        errors.push_back("leaves.plant_number must be positive");
    }
    if (leaves.root_min_radius <= 0) {
        errors.push_back("leaves.root_min_radius must be positive");
    }
    if (leaves.leaf_height.first < 0 || leaves.leaf_height.second > 1 ||
        leaves.leaf_height.first > leaves.leaf_height.second) {
        errors.push_back("leaves.leaf_height must be an ordered pair in [0, 1]");
    }
    if (pipeline_config.output.directory.empty()) {
        errors.push_back("output.directory must not be empty");
    }

    return errors;
}

const PipelineConfig& ConfigManager::getPipelineConfig() const {
    return pipeline_config;
}

const OutputConfig& ConfigManager::getOutputConfig() const {
    return pipeline_config.output;
}

nlohmann::json ConfigManager::toJson() const {
    const auto& c = pipeline_config;
    nlohmann::json j;
    j["plate"] = {
        {"border_width", c.plate.border_width},
        {"shape", c.plate.shape},
        {"smooth", c.plate.smooth}
    };
    j["segment"] = {
        {"root_max_radius", c.segment.root_max_radius},
        {"min_dimension", c.segment.min_dimension},
        {"smooth", c.segment.smooth},
        {"verbose", c.segment.verbose}
    };
    j["leaves"] = {
        {"plant_number", c.leaves.plant_number},
        {"root_min_radius", c.leaves.root_min_radius},
        {"leaf_height", {c.leaves.leaf_height.first, c.leaves.leaf_height.second}},
        {"sort", c.leaves.sort}
    };
    j["output"] = {
        {"directory", c.output.directory},
        {"save_masks", c.output.save_masks},
        {"save_tree", c.output.save_tree}
    };
    return j;
}

bool ConfigManager::exportConfig(const std::string& export_path) const {
    try {
        std::ofstream export_file(export_path);
        if (!export_file.is_open()) {
            std::cerr << "Failed to open export file: " << export_path << std::endl;
            return false;
        }

        export_file << toJson().dump(2);
        export_file.close();

        std::cout << "Configuration exported to: " << export_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error exporting configuration: " << e.what() << std::endl;
        return false;
    }
}

} // namespace RootVision
