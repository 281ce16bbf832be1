#include "seed_detection.hpp"
#include "errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace RootVision {

namespace {

struct SeedCandidate {
    int label;
    int area;
    double centroid_x;
    double intensity;
};

} // namespace

cv::Mat detectSeeds(const cv::Mat& mask, const cv::Mat& image, int leaf_number,
                    double root_radius, const std::pair<double, double>& leaf_height,
                    bool sort) {
    if (mask.empty()) {
        throw ValueError("detectSeeds: empty mask");
    }
    if (!image.empty() && image.size() != mask.size()) {
        throw ValueError("detectSeeds: image and mask sizes differ");
    }
    if (leaf_number <= 0) {
        throw ValueError("detectSeeds: leaf_number must be positive");
    }
    if (root_radius <= 0) {
        throw ValueError("detectSeeds: root_radius must be positive");
    }

    const int rows = mask.rows;
    const int top = std::max(0, static_cast<int>(std::floor(rows * leaf_height.first)));
    const int bottom = std::min(rows, static_cast<int>(std::ceil(rows * leaf_height.second)));

    cv::Mat seed_map = cv::Mat::zeros(mask.size(), CV_32S);
    if (bottom <= top) return seed_map;

    cv::Mat band = cv::Mat::zeros(mask.size(), CV_8U);
    cv::Mat binary = mask != 0;
    binary.rowRange(top, bottom).copyTo(band.rowRange(top, bottom));

    // Remove root-thin structures, leaving the leaves
    const int radius = static_cast<int>(std::floor(root_radius));
    cv::Mat element = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                                cv::Size(2 * radius + 1, 2 * radius + 1));
    cv::morphologyEx(band, band, cv::MORPH_OPEN, element,
                     cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));

    cv::Mat labels, stats, centroids;
    int n = cv::connectedComponentsWithStats(band, labels, stats, centroids, 4, CV_32S);

    std::vector<SeedCandidate> candidates;
    for (int i = 1; i < n; ++i) {
        const double intensity = image.empty() ? 0.0 : cv::mean(image, labels == i)[0];
        candidates.push_back({i, stats.at<int>(i, cv::CC_STAT_AREA), centroids.at<double>(i, 0), intensity});
    }

    // Equal areas: the brighter leaf wins
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const SeedCandidate& a, const SeedCandidate& b) {
            if (a.area != b.area) return a.area > b.area;
            return a.intensity > b.intensity;
        });
    if (static_cast<int>(candidates.size()) > leaf_number) {
        candidates.resize(leaf_number);
    }
    if (sort) {
        std::stable_sort(candidates.begin(), candidates.end(),
            [](const SeedCandidate& a, const SeedCandidate& b) { return a.centroid_x < b.centroid_x; });
    }

    std::vector<int> relabel(n, 0);
    for (size_t k = 0; k < candidates.size(); ++k) {
        relabel[candidates[k].label] = static_cast<int>(k) + 1;
    }
    for (int y = top; y < bottom; ++y) {
        const int* src = labels.ptr<int>(y);
        int* dst = seed_map.ptr<int>(y);
        for (int x = 0; x < labels.cols; ++x) {
            if (src[x] > 0) dst[x] = relabel[src[x]];
        }
    }
    return seed_map;
}

} // namespace RootVision
