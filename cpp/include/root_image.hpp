#ifndef ROOTVISION_ROOT_IMAGE_HPP
#define ROOTVISION_ROOT_IMAGE_HPP

#include <opencv2/core.hpp>

namespace RootVision {

/**
 * @brief Suppress the slowly varying plate background
 *
 * The background is estimated by a grey opening with an elliptic element of
 * diameter 2*distance+1, so bright structures thinner than that element are
 * kept. The image is first smoothed with a Gaussian of sigma @p smooth
 * (0 disables it).
 *
 * @return CV_32F image, max(image - background, 0)
 */
cv::Mat removeBackground(const cv::Mat& image, double distance, double smooth = 1.0);

/**
 * @brief Binary segmentation of a background-free root image
 *
 * Otsu threshold computed on the non-zero pixels only, since large zeroed
 * areas (outside the plate) would otherwise pull the threshold down.
 *
 * @return CV_8U mask, 255 for root candidates
 */
cv::Mat segmentRootImage(const cv::Mat& image);

} // namespace RootVision

#endif // ROOTVISION_ROOT_IMAGE_HPP
