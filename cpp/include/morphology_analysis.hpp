#ifndef ROOTVISION_MORPHOLOGY_ANALYSIS_HPP
#define ROOTVISION_MORPHOLOGY_ANALYSIS_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace RootVision {
namespace Morphology {

/**
 * @brief Skeleton extraction and skeleton pixel classification
 *
 * Skeletons are CV_8U arrays holding 0 or 1; pixels beyond the border count
 * as empty. Pixels are classified by their crossing number (number of 0->1
 * transitions around the 8-neighborhood), which ignores the extra neighbor
 * of staircase corners: 1 for tips, 2 along a branch, 3 or more at junctions.
 */
class SkeletonAnalyzer {
public:
    SkeletonAnalyzer() = default;

    // Zhang-Suen thinning of a binary mask (non-zero = foreground)
    cv::Mat skeletonize(const cv::Mat& binary_mask) const;

    std::vector<cv::Point> findBranchPoints(const cv::Mat& skeleton) const;
    std::vector<cv::Point> findTipPoints(const cv::Mat& skeleton) const;

    static int countNeighbors(const cv::Mat& skeleton, int x, int y);
    static int crossingNumber(const cv::Mat& skeleton, int x, int y);
    static double calculatePathLength(const std::vector<cv::Point>& path);

    // Upper bound on thinning passes, reached only on degenerate input
    static constexpr int MAX_THINNING_ITERATIONS = 10000;

private:
    bool thinningPass(cv::Mat& skeleton, int step) const;
};

} // namespace Morphology
} // namespace RootVision

#endif // ROOTVISION_MORPHOLOGY_ANALYSIS_HPP
