#include "morphology_analysis.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <iostream>

using namespace RootVision::Morphology;

cv::Mat SkeletonAnalyzer::skeletonize(const cv::Mat& binary_mask) const {
    if (binary_mask.empty()) return cv::Mat();

    // One pixel of padding keeps the neighborhood lookups inside the array
    cv::Mat padded;
    cv::Mat binary = binary_mask != 0;
    cv::copyMakeBorder(binary, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    padded /= 255;

    int iterations = 0;
    bool changed = true;
    while (changed) {
        changed = thinningPass(padded, 0);
        changed = thinningPass(padded, 1) || changed;

        if (++iterations > MAX_THINNING_ITERATIONS) {
            std::cerr << "SkeletonAnalyzer: thinning exceeded maximum iterations" << std::endl;
            break;
        }
    }

    return padded(cv::Rect(1, 1, binary_mask.cols, binary_mask.rows)).clone();
}

bool SkeletonAnalyzer::thinningPass(cv::Mat& skeleton, int step) const {
    std::vector<cv::Point> to_remove;

    for (int y = 1; y < skeleton.rows - 1; y++) {
        const uchar* above = skeleton.ptr<uchar>(y - 1);
        const uchar* row = skeleton.ptr<uchar>(y);
        const uchar* below = skeleton.ptr<uchar>(y + 1);

        for (int x = 1; x < skeleton.cols - 1; x++) {
            if (row[x] == 0) continue;

            // p2..p9 clockwise from north
            const int p[8] = {above[x], above[x + 1], row[x + 1], below[x + 1],
                              below[x], below[x - 1], row[x - 1], above[x - 1]};

            int count = 0;
            int transitions = 0;
            for (int i = 0; i < 8; i++) {
                count += p[i];
                if (p[i] == 0 && p[(i + 1) % 8] == 1) transitions++;
            }
            if (count < 2 || count > 6 || transitions != 1) continue;

            const int p2 = p[0], p4 = p[2], p6 = p[4], p8 = p[6];
            if (step == 0) {
                if (p2 * p4 * p6 != 0 || p4 * p6 * p8 != 0) continue;
            } else {
                if (p2 * p4 * p8 != 0 || p2 * p6 * p8 != 0) continue;
            }
            to_remove.push_back(cv::Point(x, y));
        }
    }

    for (const auto& pt : to_remove) {
        skeleton.at<uchar>(pt.y, pt.x) = 0;
    }
    return !to_remove.empty();
}

int SkeletonAnalyzer::countNeighbors(const cv::Mat& skeleton, int x, int y) {
    int neighbors = 0;
    for (int dy = -1; dy <= 1; dy++) {
        for (int dx = -1; dx <= 1; dx++) {
            if (dy == 0 && dx == 0) continue;
            const int nx = x + dx, ny = y + dy;
            if (nx < 0 || ny < 0 || nx >= skeleton.cols || ny >= skeleton.rows) continue;
            if (skeleton.at<uchar>(ny, nx) > 0) {
                neighbors++;
            }
        }
    }
    return neighbors;
}

int SkeletonAnalyzer::crossingNumber(const cv::Mat& skeleton, int x, int y) {
    // p2..p9 clockwise from north
    static const int dx[8] = {0, 1, 1, 1, 0, -1, -1, -1};
    static const int dy[8] = {-1, -1, 0, 1, 1, 1, 0, -1};

    int p[8];
    for (int i = 0; i < 8; i++) {
        const int nx = x + dx[i], ny = y + dy[i];
        const bool in = nx >= 0 && ny >= 0 && nx < skeleton.cols && ny < skeleton.rows;
        p[i] = (in && skeleton.at<uchar>(ny, nx) > 0) ? 1 : 0;
    }

    int transitions = 0;
    for (int i = 0; i < 8; i++) {
        if (p[i] == 0 && p[(i + 1) % 8] == 1) transitions++;
    }
    return transitions;
}

std::vector<cv::Point> SkeletonAnalyzer::findBranchPoints(const cv::Mat& skeleton) const {
    std::vector<cv::Point> branch_points;

    if (skeleton.empty()) return branch_points;

    for (int y = 0; y < skeleton.rows; y++) {
        for (int x = 0; x < skeleton.cols; x++) {
            if (skeleton.at<uchar>(y, x) == 0) continue;
            if (crossingNumber(skeleton, x, y) >= 3) {
                branch_points.push_back(cv::Point(x, y));
            }
        }
    }

    return branch_points;
}

std::vector<cv::Point> SkeletonAnalyzer::findTipPoints(const cv::Mat& skeleton) const {
    std::vector<cv::Point> tip_points;

    if (skeleton.empty()) return tip_points;

    for (int y = 0; y < skeleton.rows; y++) {
        for (int x = 0; x < skeleton.cols; x++) {
            if (skeleton.at<uchar>(y, x) == 0) continue;
            if (crossingNumber(skeleton, x, y) == 1) {
                tip_points.push_back(cv::Point(x, y));
            }
        }
    }

    return tip_points;
}

double SkeletonAnalyzer::calculatePathLength(const std::vector<cv::Point>& path) {
    if (path.size() < 2) return 0.0;

    double length = 0.0;
    for (size_t i = 1; i < path.size(); i++) {
        const cv::Point d = path[i] - path[i - 1];
        length += std::sqrt(static_cast<double>(d.x * d.x + d.y * d.y));
    }

    return length;
}
