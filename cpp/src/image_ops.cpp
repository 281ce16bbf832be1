#include "image_ops.hpp"
#include "errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace RootVision {
namespace ImageOps {

static cv::Mat toBinary(const cv::Mat& mask) {
    if (mask.empty()) return cv::Mat();
    if (mask.channels() != 1) {
        throw ValueError("ImageOps: expected a single channel mask");
    }
    cv::Mat binary = mask != 0;
    return binary;
}

cv::Mat binarizeAtMax(const cv::Mat& mask) {
    if (mask.empty()) {
        throw ValueError("binarizeAtMax: empty mask");
    }
    if (mask.channels() != 1) {
        throw ValueError("binarizeAtMax: expected a single channel mask");
    }
    double max_value = 0.0;
    cv::minMaxLoc(mask, nullptr, &max_value);
    cv::Mat binary = mask == max_value;
    return binary;
}

cv::Rect boundingBox(const cv::Mat& mask) {
    cv::Mat binary = toBinary(mask);
    if (binary.empty() || cv::countNonZero(binary) == 0) {
        throw ShapeError("boundingBox: mask has no true pixel");
    }
    std::vector<cv::Point> points;
    cv::findNonZero(binary, points);
    return cv::boundingRect(points);
}

std::vector<cv::Rect> findObjects(const cv::Mat& labels) {
    std::vector<cv::Rect> boxes;
    if (labels.empty()) return boxes;

    cv::Mat lab;
    labels.convertTo(lab, CV_32S);

    double max_label = 0.0;
    cv::minMaxLoc(lab, nullptr, &max_label);
    const int n = static_cast<int>(max_label);
    if (n <= 0) return boxes;

    std::vector<int> x0(n + 1, lab.cols), y0(n + 1, lab.rows), x1(n + 1, -1), y1(n + 1, -1);
    for (int y = 0; y < lab.rows; ++y) {
        const int* row = lab.ptr<int>(y);
        for (int x = 0; x < lab.cols; ++x) {
            int id = row[x];
            if (id <= 0) continue;
            x0[id] = std::min(x0[id], x);
            y0[id] = std::min(y0[id], y);
            x1[id] = std::max(x1[id], x);
            y1[id] = std::max(y1[id], y);
        }
    }

    boxes.resize(n);
    for (int id = 1; id <= n; ++id) {
        if (x1[id] < 0) continue;
        boxes[id - 1] = cv::Rect(x0[id], y0[id], x1[id] - x0[id] + 1, y1[id] - y0[id] + 1);
    }
    return boxes;
}

cv::Mat crop(const cv::Mat& image, const cv::Rect& box) {
    const cv::Rect full(0, 0, image.cols, image.rows);
    if (box.width <= 0 || box.height <= 0 || (box & full) != box) {
        throw ValueError("crop: box does not fit inside a " + std::to_string(image.rows) + "x" +
                         std::to_string(image.cols) + " array");
    }
    return image(box).clone();
}

cv::Mat gaussianFilter(const cv::Mat& image, double sigma) {
    cv::Mat src;
    image.convertTo(src, CV_32F);
    if (sigma <= 0) return src;

    const int radius = static_cast<int>(4.0 * sigma + 0.5);
    const int ksize = 2 * radius + 1;
    cv::Mat blurred;
    cv::GaussianBlur(src, blurred, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT);
    return blurred;
}

cv::Mat maskedGaussian(const cv::Mat& image, const cv::Mat& mask, double sigma) {
    cv::Mat weight;
    toBinary(mask).convertTo(weight, CV_32F, 1.0 / 255.0);

    cv::Mat img;
    image.convertTo(img, CV_32F);

    cv::Mat numerator = gaussianFilter(img.mul(weight), sigma);
    cv::Mat denominator = cv::max(gaussianFilter(weight, sigma), MASK_WEIGHT_FLOOR);

    cv::Mat smoothed;
    cv::divide(numerator, denominator, smoothed);
    return smoothed;
}

cv::Mat binaryErosion(const cv::Mat& mask, int iterations) {
    cv::Mat binary = toBinary(mask);
    if (binary.empty() || iterations <= 0) return binary;

    cv::Mat eroded;
    cv::Mat cross = cv::getStructuringElement(cv::MORPH_CROSS, cv::Size(3, 3));
    cv::erode(binary, eroded, cross, cv::Point(-1, -1), iterations,
              cv::BORDER_CONSTANT, cv::Scalar(0));
    return eroded;
}

cv::Mat labelComponents(const cv::Mat& mask, int* count) {
    cv::Mat binary = toBinary(mask);
    cv::Mat labels;
    int n = 0;
    if (binary.empty()) {
        labels = cv::Mat();
    } else {
        n = cv::connectedComponents(binary, labels, 4, CV_32S) - 1;
    }
    if (count) *count = n;
    return labels;
}

cv::Mat cleanLabel(const cv::Mat& labels, int min_size, int min_dim) {
    if (labels.empty()) return cv::Mat();

    cv::Mat lab;
    labels.convertTo(lab, CV_32S);

    std::vector<cv::Rect> boxes = findObjects(lab);
    const int n = static_cast<int>(boxes.size());

    std::vector<int> sizes(n + 1, 0);
    for (int y = 0; y < lab.rows; ++y) {
        const int* row = lab.ptr<int>(y);
        for (int x = 0; x < lab.cols; ++x) {
            if (row[x] > 0) sizes[row[x]]++;
        }
    }

    std::vector<int> relabel(n + 1, 0);
    int next = 1;
    for (int id = 1; id <= n; ++id) {
        if (sizes[id] == 0) continue;
        const cv::Rect& box = boxes[id - 1];
        const int dim = std::max(box.width, box.height);
        if (sizes[id] < min_size || dim < min_dim) continue;
        relabel[id] = next++;
    }

    cv::Mat cleaned = cv::Mat::zeros(lab.size(), CV_32S);
    for (int y = 0; y < lab.rows; ++y) {
        const int* src = lab.ptr<int>(y);
        int* dst = cleaned.ptr<int>(y);
        for (int x = 0; x < lab.cols; ++x) {
            if (src[x] > 0) dst[x] = relabel[src[x]];
        }
    }
    return cleaned;
}

} // namespace ImageOps
} // namespace RootVision
