#include "root_image.hpp"
#include "errors.hpp"
#include "image_ops.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <vector>

namespace RootVision {

cv::Mat removeBackground(const cv::Mat& image, double distance, double smooth) {
    if (image.empty()) {
        throw ValueError("removeBackground: empty image");
    }
    if (distance <= 0) {
        throw ValueError("removeBackground: distance must be positive");
    }

    cv::Mat img = ImageOps::gaussianFilter(image, smooth);

    const int radius = static_cast<int>(std::floor(distance));
    cv::Mat element = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                                cv::Size(2 * radius + 1, 2 * radius + 1));
    cv::Mat background;
    cv::morphologyEx(img, background, cv::MORPH_OPEN, element,
                     cv::Point(-1, -1), 1, cv::BORDER_REFLECT);

    cv::Mat foreground = img - background;
    foreground = cv::max(foreground, 0.0);
    return foreground;
}

// Otsu threshold over a 256-bin histogram
static int otsuThreshold(const std::vector<double>& hist) {
    double total = 0.0, sum = 0.0;
    for (int i = 0; i < 256; ++i) {
        total += hist[i];
        sum += i * hist[i];
    }
    if (total <= 0) return 0;

    double weight_bg = 0.0, sum_bg = 0.0;
    double best_variance = -1.0;
    int best = 0;
    for (int t = 0; t < 256; ++t) {
        weight_bg += hist[t];
        if (weight_bg == 0) continue;
        const double weight_fg = total - weight_bg;
        if (weight_fg == 0) break;

        sum_bg += t * hist[t];
        const double mean_bg = sum_bg / weight_bg;
        const double mean_fg = (sum - sum_bg) / weight_fg;
        const double variance = weight_bg * weight_fg * (mean_bg - mean_fg) * (mean_bg - mean_fg);
        if (variance > best_variance) {
            best_variance = variance;
            best = t;
        }
    }
    return best;
}

cv::Mat segmentRootImage(const cv::Mat& image) {
    if (image.empty()) {
        throw ValueError("segmentRootImage: empty image");
    }

    cv::Mat img;
    image.convertTo(img, CV_32F);
    cv::Mat nonzero = img > 0;

    cv::Mat rmask = cv::Mat::zeros(img.size(), CV_8U);
    if (cv::countNonZero(nonzero) == 0) return rmask;

    double min_value = 0.0, max_value = 0.0;
    cv::minMaxLoc(img, &min_value, &max_value, nullptr, nullptr, nonzero);
    if (max_value <= min_value) {
        // a single intensity level: every candidate pixel is foreground
        return nonzero;
    }

    cv::Mat img8u;
    img.convertTo(img8u, CV_8U, 255.0 / max_value);

    std::vector<double> hist(256, 0.0);
    for (int y = 0; y < img8u.rows; ++y) {
        const uchar* values = img8u.ptr<uchar>(y);
        const uchar* valid = nonzero.ptr<uchar>(y);
        for (int x = 0; x < img8u.cols; ++x) {
            if (valid[x]) hist[values[x]] += 1.0;
        }
    }

    const int threshold = otsuThreshold(hist);
    cv::Mat above = img8u > threshold;
    cv::bitwise_and(above, nonzero, rmask);
    return rmask;
}

} // namespace RootVision
