#include "config_manager.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace RootVision;

namespace fs = std::filesystem;

TEST(ConfigManagerTest, DefaultsBeforeLoading) {
    ConfigManager config;
    EXPECT_FALSE(config.isLoaded());

    const PipelineConfig& c = config.getPipelineConfig();
    EXPECT_DOUBLE_EQ(c.plate.border_width, 0.05);
    EXPECT_EQ(c.plate.shape, "contour");
    EXPECT_DOUBLE_EQ(c.segment.root_max_radius, 15.0);
    EXPECT_EQ(c.segment.min_dimension, 50);
    EXPECT_DOUBLE_EQ(c.segment.smooth, 1.0);
    EXPECT_EQ(c.leaves.plant_number, 1);
    EXPECT_DOUBLE_EQ(c.leaves.root_min_radius, 3.0);
    EXPECT_DOUBLE_EQ(c.leaves.leaf_height.first, 0.0);
    EXPECT_DOUBLE_EQ(c.leaves.leaf_height.second, 0.2);
    EXPECT_TRUE(c.leaves.sort);
    EXPECT_EQ(config.getOutputConfig().directory, "output");
    EXPECT_TRUE(config.validateConfig());
}

TEST(ConfigManagerTest, PartialJsonKeepsOtherDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson({
        {"segment", {{"root_max_radius", 8}, {"verbose", true}}},
        {"leaves", {{"plant_number", 5}, {"leaf_height", {0.1, 0.3}}}},
        {"output", {{"directory", "results"}, {"save_masks", false}}}
    }));
    EXPECT_TRUE(config.isLoaded());

    const PipelineConfig& c = config.getPipelineConfig();
    EXPECT_DOUBLE_EQ(c.segment.root_max_radius, 8.0);
    EXPECT_TRUE(c.segment.verbose);
    EXPECT_EQ(c.segment.min_dimension, 50);
    EXPECT_EQ(c.leaves.plant_number, 5);
    EXPECT_DOUBLE_EQ(c.leaves.leaf_height.first, 0.1);
    EXPECT_DOUBLE_EQ(c.leaves.leaf_height.second, 0.3);
    EXPECT_EQ(c.plate.shape, "contour");
    EXPECT_EQ(c.output.directory, "results");
    EXPECT_FALSE(c.output.save_masks);
    EXPECT_TRUE(c.output.save_tree);
}

TEST(ConfigManagerTest, MalformedValuesKeepPreviousConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson({{"leaves", {{"plant_number", 2}}}}));

    EXPECT_FALSE(config.loadFromJson({{"leaves", {{"leaf_height", {0.1}}}}}));
    EXPECT_FALSE(config.loadFromJson({{"segment", {{"root_max_radius", "wide"}}}}));
    EXPECT_FALSE(config.loadFromJson(nlohmann::json::array()));

    EXPECT_EQ(config.getPipelineConfig().leaves.plant_number, 2);
}

TEST(ConfigManagerTest, ReportsValidationErrors) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson({
        {"plate", {{"shape", "square"}}},
        {"segment", {{"root_max_radius", 0}}},
        {"leaves", {{"plant_number", 0}, {"leaf_height", {0.6, 0.2}}}}
    }));

    EXPECT_FALSE(config.validateConfig());
    EXPECT_EQ(config.getValidationErrors().size(), 4u);
}

TEST(ConfigManagerTest, ExportThenReload) {
    const fs::path dir = fs::temp_directory_path() / "rootvision_config_test";
    fs::create_directories(dir);
    const std::string path = (dir / "config.json").string();

    ConfigManager original;
    ASSERT_TRUE(original.loadFromJson({
        {"plate", {{"shape", "convex"}}},
        {"leaves", {{"plant_number", 3}, {"sort", false}}}
    }));
    ASSERT_TRUE(original.exportConfig(path));

    ConfigManager restored;
    ASSERT_TRUE(restored.loadConfig(path));
    EXPECT_EQ(restored.toJson(), original.toJson());
    EXPECT_EQ(restored.getPipelineConfig().plate.shape, "convex");
    EXPECT_FALSE(restored.getPipelineConfig().leaves.sort);

    std::ofstream(path) << R"({"leaves": {"plant_number": 6}})";
    ASSERT_TRUE(restored.reloadConfig());
    EXPECT_EQ(restored.getPipelineConfig().leaves.plant_number, 6);
    EXPECT_EQ(restored.getPipelineConfig().plate.shape, "contour");

    fs::remove_all(dir);
}

TEST(ConfigManagerTest, MissingFileFailsToLoad) {
    ConfigManager config;
    EXPECT_FALSE(config.loadConfig("/nonexistent/rootvision.json"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_FALSE(ConfigManager().reloadConfig());
}
