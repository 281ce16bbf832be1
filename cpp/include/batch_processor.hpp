#ifndef ROOTVISION_BATCH_PROCESSOR_HPP
#define ROOTVISION_BATCH_PROCESSOR_HPP

#include "config_manager.hpp"
#include "pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace RootVision {

struct FailedFile {
    std::string filename;
    std::string error;
};

struct BatchResult {
    int processed = 0;
    std::vector<FailedFile> failed;

    nlohmann::json toJson() const;
};

/**
 * @brief Image files to process for an input path
 *
 * A regular file is returned as is; a directory yields its image files
 * (png, jpg, jpeg, tif, tiff, bmp), sorted by name.
 */
std::vector<std::string> listImages(const std::string& input_path);

/**
 * @brief Write the artifacts of one pipeline run
 *
 * Masks are written as <stem>_rmask.png and <stem>_seed_map.png with their
 * serialization policy, the tree as <stem>_tree.json.
 *
 * @return false if any artifact could not be written
 */
bool saveArtifacts(const StageContext& context, const std::string& stem, const OutputConfig& output);

/**
 * @brief Run the pipeline on every file
 *
 * A failing file is reported and recorded, the remaining files are still
 * processed.
 */
BatchResult processBatch(const std::vector<std::string>& files, const Pipeline& pipeline,
                         const OutputConfig& output, bool verbose = false);

} // namespace RootVision

#endif // ROOTVISION_BATCH_PROCESSOR_HPP
