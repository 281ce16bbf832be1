#include "root_pipeline.hpp"
#include "errors.hpp"
#include "image_ops.hpp"
#include "reporting.hpp"
#include "root_graph.hpp"
#include "root_image.hpp"
#include "root_tree.hpp"
#include "seed_detection.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace RootVision {

nlohmann::json toJson(const SegmentImageParams& params) {
    return {{"root_max_radius", params.root_max_radius}};
}

nlohmann::json toJson(const DetectLeavesParams& params) {
    return {
        {"plant_number", params.plant_number},
        {"root_min_radius", params.root_min_radius},
        {"leaf_height", {params.leaf_height.first, params.leaf_height.second}}
    };
}

cv::Mat loadImage(const std::string& filename) {
    cv::Mat raw = cv::imread(filename, cv::IMREAD_GRAYSCALE | cv::IMREAD_ANYDEPTH);
    if (raw.empty()) {
        throw std::runtime_error("loadImage: cannot read image '" + filename + "'");
    }

    double scale = 1.0;
    if (raw.depth() == CV_8U) {
        scale = 1.0 / 255.0;
    } else if (raw.depth() == CV_16U) {
        scale = 1.0 / 65535.0;
    }
    cv::Mat image;
    raw.convertTo(image, CV_32F, scale);
    return image;
}

SegmentationResult segmentImage(const cv::Mat& image, const cv::Mat& pmask,
                                const SegmentImageOptions& options) {
    if (image.empty() || pmask.empty()) {
        throw ValueError("segmentImage: empty image or plate mask");
    }
    if (image.size() != pmask.size()) {
        throw ValueError("segmentImage: image and plate mask sizes differ");
    }
    if (image.channels() != 1 || pmask.channels() != 1) {
        throw ValueError("segmentImage: expected single channel image and plate mask");
    }
    if (options.root_max_radius <= 0) {
        throw ValueError("segmentImage: root_max_radius must be positive");
    }
    if (options.min_dimension < 0) {
        throw ValueError("segmentImage: min_dimension must not be negative");
    }
    if (options.smooth < 0) {
        throw ValueError("segmentImage: smooth must not be negative");
    }
    if (cv::countNonZero(pmask) == 0) {
        throw ShapeError("segmentImage: no plate found in plate mask");
    }

    // Plate = brightest level of the mask
    cv::Mat plate = ImageOps::binarizeAtMax(pmask);
    const cv::Rect bbox = ImageOps::boundingBox(plate);
    plate = ImageOps::crop(plate, bbox);

    cv::Mat img;
    ImageOps::crop(image, bbox).convertTo(img, CV_32F);

    if (options.smooth > 0) {
        cv::Mat smoothed = ImageOps::maskedGaussian(img, plate, options.smooth);
        smoothed.copyTo(img, plate);
    }

    printState(options.verbose, "remove background");
    img = removeBackground(img, options.root_max_radius, 1.0);

    // Background removal is unreliable close to the plate border
    const int border = static_cast<int>(std::floor(options.root_max_radius));
    cv::Mat inner = ImageOps::binaryErosion(plate, border);
    cv::Mat border_band = inner == 0;
    img.setTo(0, border_band);

    printState(options.verbose, "segment binary mask");
    cv::Mat rmask = segmentRootImage(img);
    cv::Mat outside = plate == 0;
    rmask.setTo(0, outside);

    if (options.min_dimension > 0) {
        cv::Mat clusters = ImageOps::labelComponents(rmask);
        clusters = ImageOps::cleanLabel(clusters, 1, options.min_dimension);
        rmask = clusters > 0;
    }

    return {SerializableMask(rmask, booleanMaskPolicy()), bbox};
}

SerializableMask detectLeaves(const cv::Mat& rmask, const cv::Mat& image, const cv::Rect& bbox,
                              const DetectLeavesOptions& options) {
    if (options.plant_number <= 0) {
        throw ValueError("detectLeaves: plant_number must be positive");
    }
    if (options.root_min_radius <= 0) {
        throw ValueError("detectLeaves: root_min_radius must be positive");
    }
    const auto& band = options.leaf_height;
    if (band.first < 0 || band.second > 1 || band.first > band.second) {
        throw ValueError("detectLeaves: leaf_height must be an ordered pair in [0,1]");
    }
    if (rmask.empty()) {
        throw ValueError("detectLeaves: empty root mask");
    }
    if (bbox.size() != rmask.size()) {
        throw ValueError("detectLeaves: bounding box and root mask sizes differ");
    }

    cv::Mat cropped = ImageOps::crop(image, bbox);
    cv::Mat seed_map = detectSeeds(rmask, cropped, options.plant_number, options.root_min_radius,
                                   options.leaf_height, options.sort);
    return SerializableMask(seed_map, labelMapPolicy(options.plant_number));
}

StageOutputs LoadImageStage::invoke(const StageContext& context) const {
    return {{"image", loadImage(context.get<std::string>("filename"))}};
}

nlohmann::json DetectFrameStage::parameters() const {
    return {{"border_width", options_.border_width}, {"shape", options_.shape}};
}

StageOutputs DetectFrameStage::invoke(const StageContext& context) const {
    return {{"pmask", detectPetriPlate(context.get<cv::Mat>("image"), options_)}};
}

StageOutputs SegmentImageStage::invoke(const StageContext& context) const {
    SegmentationResult result = segmentImage(context.get<cv::Mat>("image"),
                                             context.get<cv::Mat>("pmask"), options_);
    return {{"rmask", result.rmask}, {"bbox", result.bbox}};
}

StageOutputs DetectLeavesStage::invoke(const StageContext& context) const {
    const SerializableMask& rmask = context.get<SerializableMask>("rmask");
    return {{"seed_map", detectLeaves(rmask.data(), context.get<cv::Mat>("image"),
                                      context.get<cv::Rect>("bbox"), options_)}};
}

StageOutputs ComputeGraphStage::invoke(const StageContext& context) const {
    const SerializableMask& rmask = context.get<SerializableMask>("rmask");
    const SerializableMask& seed_map = context.get<SerializableMask>("seed_map");
    return {{"graph", computeGraph(rmask.data(), seed_map.data())}};
}

StageOutputs ComputeTreeStage::invoke(const StageContext& context) const {
    return {{"tree", computeTree(context.get<RootGraph>("graph"))}};
}

Pipeline makeRootPipeline(const PlateDetectionOptions& plate,
                          const SegmentImageOptions& segment,
                          const DetectLeavesOptions& leaves) {
    Pipeline pipeline;
    pipeline.add(std::make_shared<LoadImageStage>())
            .add(std::make_shared<DetectFrameStage>(plate))
            .add(std::make_shared<SegmentImageStage>(segment))
            .add(std::make_shared<DetectLeavesStage>(leaves))
            .add(std::make_shared<ComputeGraphStage>())
            .add(std::make_shared<ComputeTreeStage>());
    return pipeline;
}

} // namespace RootVision
