#ifndef ROOTVISION_PLATE_DETECTION_HPP
#define ROOTVISION_PLATE_DETECTION_HPP

#include <opencv2/core.hpp>
#include <string>

namespace RootVision {

struct PlateDetectionOptions {
    // Fraction of the plate's smaller side removed from its border
    double border_width = 0.05;
    // "contour" fills the plate outline, "convex" fills its convex hull
    std::string shape = "contour";
    // Gaussian sigma applied before thresholding
    double smooth = 2.0;
};

/**
 * @brief Locate the petri plate in a greyscale image
 *
 * The plate is taken as the largest bright region after an Otsu threshold.
 *
 * @return CV_8U mask, 255 inside the plate
 * @throws ShapeError if no bright region is found
 */
cv::Mat detectPetriPlate(const cv::Mat& image, const PlateDetectionOptions& options = PlateDetectionOptions());

} // namespace RootVision

#endif // ROOTVISION_PLATE_DETECTION_HPP
