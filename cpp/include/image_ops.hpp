#ifndef ROOTVISION_IMAGE_OPS_HPP
#define ROOTVISION_IMAGE_OPS_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace RootVision {
namespace ImageOps {

// Smallest weight used when normalizing a masked Gaussian blur (2^-10)
constexpr double MASK_WEIGHT_FLOOR = 1.0 / 1024.0;

/**
 * @brief Mark the pixels equal to the array maximum
 * @return CV_8U mask, 255 where mask == max(mask), 0 elsewhere
 */
cv::Mat binarizeAtMax(const cv::Mat& mask);

/**
 * @brief Minimal rectangle enclosing all non-zero pixels
 * @throws ShapeError if the mask has no non-zero pixel
 */
cv::Rect boundingBox(const cv::Mat& mask);

// Bounding boxes of labels 1..max(label), empty rect for missing labels
std::vector<cv::Rect> findObjects(const cv::Mat& labels);

/**
 * @brief Deep copy of the region of an array
 * @throws ValueError if the box does not fit inside the array
 */
cv::Mat crop(const cv::Mat& image, const cv::Rect& box);

/**
 * @brief Gaussian filter with scipy.ndimage semantics
 *
 * Kernel radius is int(4*sigma + 0.5), borders are mirrored (d c b a | a b c d).
 * The result is CV_32F.
 */
cv::Mat gaussianFilter(const cv::Mat& image, double sigma);

/**
 * @brief Blur an image using only the pixels inside a mask
 *
 * Returns G(image*mask) / max(G(mask), MASK_WEIGHT_FLOOR) as CV_32F.
 */
cv::Mat maskedGaussian(const cv::Mat& image, const cv::Mat& mask, double sigma);

/**
 * @brief Binary erosion with the 3x3 cross, repeated @p iterations times
 *
 * Pixels beyond the border count as false, so the mask also shrinks from the
 * array border. iterations <= 0 returns a copy.
 */
cv::Mat binaryErosion(const cv::Mat& mask, int iterations);

/**
 * @brief 4-connected component labeling
 * @param count Set to the number of labels (background excluded)
 * @return CV_32S label array, 0 for background
 */
cv::Mat labelComponents(const cv::Mat& mask, int* count = nullptr);

/**
 * @brief Remove labels that are too small, then renumber the rest 1..K
 *
 * A label is removed when its pixel count is below @p min_size or when the
 * largest side of its bounding box is below @p min_dim. Kept labels are
 * renumbered in order of their original label value.
 */
cv::Mat cleanLabel(const cv::Mat& labels, int min_size = 1, int min_dim = 0);

} // namespace ImageOps
} // namespace RootVision

#endif // ROOTVISION_IMAGE_OPS_HPP
