#ifndef ROOTVISION_SEED_DETECTION_HPP
#define ROOTVISION_SEED_DETECTION_HPP

#include <opencv2/core.hpp>
#include <utility>

namespace RootVision {

/**
 * @brief Locate the leaf/seed region of each plant in a root mask
 *
 * Only rows in [floor(h*leaf_height.first), ceil(h*leaf_height.second)) are
 * searched. Structures thinner than a root (opening with an ellipse of
 * diameter 2*root_radius+1) are discarded, then the @p leaf_number largest
 * 4-connected components become the seeds. Components of equal area are
 * ranked by their mean intensity in @p image, brightest first.
 *
 * @param mask Root mask (non-zero = root)
 * @param image Image aligned with the mask, may be empty (no intensity ranking)
 * @param leaf_number Expected number of plants
 * @param root_radius Radius of the thickest root, in pixels
 * @param leaf_height Vertical search band as fractions of the mask height
 * @param sort Label seeds from left to right (otherwise by decreasing size)
 * @return CV_32S label map, 0 = no seed, 1..leaf_number for the seeds found
 */
cv::Mat detectSeeds(const cv::Mat& mask, const cv::Mat& image, int leaf_number,
                    double root_radius, const std::pair<double, double>& leaf_height,
                    bool sort = true);

} // namespace RootVision

#endif // ROOTVISION_SEED_DETECTION_HPP
