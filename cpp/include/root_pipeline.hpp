#ifndef ROOTVISION_ROOT_PIPELINE_HPP
#define ROOTVISION_ROOT_PIPELINE_HPP

#include "pipeline.hpp"
#include "plate_detection.hpp"
#include "serializable_mask.hpp"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace RootVision {

// Parameters of segment_image listed at pipeline level
struct SegmentImageParams {
    // Structuring radius for background removal and plate border erosion
    double root_max_radius = 15.0;
};

// Full segment_image configuration for direct calls
struct SegmentImageOptions : SegmentImageParams {
    // Clusters whose bounding box largest side is below this are dropped, 0 keeps all
    int min_dimension = 50;
    // Gaussian sigma applied inside the plate, 0 disables smoothing
    double smooth = 1.0;
    bool verbose = false;
};

// Parameters of detect_leaves listed at pipeline level
struct DetectLeavesParams {
    int plant_number = 1;
    double root_min_radius = 3.0;
    // Vertical band, as fractions of the plate height, where seeds are searched
    std::pair<double, double> leaf_height{0.0, 0.2};
};

// Full detect_leaves configuration for direct calls
struct DetectLeavesOptions : DetectLeavesParams {
    // Number seeds from left to right
    bool sort = true;
};

struct SegmentationResult {
    SerializableMask rmask;
    // Plate bounding box in the coordinates of the original image
    cv::Rect bbox;
};

nlohmann::json toJson(const SegmentImageParams& params);
nlohmann::json toJson(const DetectLeavesParams& params);

/**
 * @brief Load an image as CV_32F grey values in [0,1]
 * @throws std::runtime_error if the file cannot be read
 */
cv::Mat loadImage(const std::string& filename);

/**
 * @brief Segment the root pixels of a plate image
 *
 * The image is cropped to the plate bounding box, optionally smoothed inside
 * the plate, freed from its background and binarized. Pixels outside the
 * plate are always false and small clusters are removed.
 *
 * @param image Greyscale image
 * @param pmask Plate mask, the plate being the pixels equal to its maximum
 * @return Root mask in cropped coordinates (policy PNG/uint8/255) and the crop box
 * @throws ShapeError if the plate mask has no true pixel
 * @throws ValueError on invalid options or mismatched inputs
 */
SegmentationResult segmentImage(const cv::Mat& image, const cv::Mat& pmask,
                                const SegmentImageOptions& options = SegmentImageOptions());

/**
 * @brief Detect the seed of each plant
 *
 * @param rmask Root mask returned by segmentImage
 * @param image Uncropped image
 * @param bbox Crop box returned by segmentImage
 * @return Seed label map (policy PNG/uint8/255/plant_number)
 * @throws ValueError on invalid options or mismatched inputs
 */
SerializableMask detectLeaves(const cv::Mat& rmask, const cv::Mat& image, const cv::Rect& bbox,
                              const DetectLeavesOptions& options = DetectLeavesOptions());

class LoadImageStage : public Stage {
public:
    std::string name() const override { return "load_image"; }
    std::vector<std::string> inputs() const override { return {"filename"}; }
    std::vector<std::string> outputs() const override { return {"image"}; }
    StageOutputs invoke(const StageContext& context) const override;
};

class DetectFrameStage : public Stage {
public:
    explicit DetectFrameStage(const PlateDetectionOptions& options = PlateDetectionOptions())
        : options_(options) {}

    std::string name() const override { return "detect_frame"; }
    std::vector<std::string> inputs() const override { return {"image"}; }
    std::vector<std::string> outputs() const override { return {"pmask"}; }
    nlohmann::json parameters() const override;
    StageOutputs invoke(const StageContext& context) const override;

private:
    PlateDetectionOptions options_;
};

class SegmentImageStage : public Stage {
public:
    explicit SegmentImageStage(const SegmentImageOptions& options = SegmentImageOptions())
        : options_(options) {}

    std::string name() const override { return "segment_image"; }
    std::vector<std::string> inputs() const override { return {"image", "pmask"}; }
    std::vector<std::string> outputs() const override { return {"rmask", "bbox"}; }
    nlohmann::json parameters() const override { return toJson(static_cast<const SegmentImageParams&>(options_)); }
    StageOutputs invoke(const StageContext& context) const override;

    const SegmentImageOptions& options() const { return options_; }

private:
    SegmentImageOptions options_;
};

class DetectLeavesStage : public Stage {
public:
    explicit DetectLeavesStage(const DetectLeavesOptions& options = DetectLeavesOptions())
        : options_(options) {}

    std::string name() const override { return "detect_leaves"; }
    std::vector<std::string> inputs() const override { return {"rmask", "image", "bbox"}; }
    std::vector<std::string> outputs() const override { return {"seed_map"}; }
    nlohmann::json parameters() const override { return toJson(static_cast<const DetectLeavesParams&>(options_)); }
    StageOutputs invoke(const StageContext& context) const override;

    const DetectLeavesOptions& options() const { return options_; }

private:
    DetectLeavesOptions options_;
};

class ComputeGraphStage : public Stage {
public:
    std::string name() const override { return "compute_graph"; }
    std::vector<std::string> inputs() const override { return {"rmask", "seed_map"}; }
    std::vector<std::string> outputs() const override { return {"graph"}; }
    StageOutputs invoke(const StageContext& context) const override;
};

class ComputeTreeStage : public Stage {
public:
    std::string name() const override { return "compute_tree"; }
    std::vector<std::string> inputs() const override { return {"graph"}; }
    std::vector<std::string> outputs() const override { return {"tree"}; }
    StageOutputs invoke(const StageContext& context) const override;
};

/**
 * @brief Build the six-stage root image pipeline
 *
 * load_image -> detect_frame -> segment_image -> detect_leaves ->
 * compute_graph -> compute_tree. Run it with a context holding "filename",
 * or holding "image" after dropping the first stage.
 */
Pipeline makeRootPipeline(const PlateDetectionOptions& plate = PlateDetectionOptions(),
                          const SegmentImageOptions& segment = SegmentImageOptions(),
                          const DetectLeavesOptions& leaves = DetectLeavesOptions());

} // namespace RootVision

#endif // ROOTVISION_ROOT_PIPELINE_HPP
