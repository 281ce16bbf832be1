#ifndef ROOTVISION_CONFIG_MANAGER_HPP
#define ROOTVISION_CONFIG_MANAGER_HPP

#include "plate_detection.hpp"
#include "root_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace RootVision {

struct OutputConfig {
    std::string directory = "output";
    bool save_masks = true;
    bool save_tree = true;
};

struct PipelineConfig {
    PlateDetectionOptions plate;
    SegmentImageOptions segment;
    DetectLeavesOptions leaves;
    OutputConfig output;
};

class ConfigManager {
private:
    nlohmann::json config_json;
    std::string config_file_path;

    PipelineConfig pipeline_config;
    bool is_loaded;

public:
    ConfigManager();
    ~ConfigManager();

    // Configuration loading and validation
    bool loadConfig(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& config);
    bool reloadConfig();
    bool validateConfig() const;
    std::vector<std::string> getValidationErrors() const;

    // Configuration access
    bool isLoaded() const { return is_loaded; }
    const PipelineConfig& getPipelineConfig() const;
    const OutputConfig& getOutputConfig() const;

    // Configuration persistence
    nlohmann::json toJson() const;
    bool exportConfig(const std::string& export_path) const;

private:
    void parseConfig();
    void parsePlateConfig();
    void parseSegmentConfig();
    void parseLeavesConfig();
    void parseOutputConfig();
};

} // namespace RootVision

#endif // ROOTVISION_CONFIG_MANAGER_HPP
