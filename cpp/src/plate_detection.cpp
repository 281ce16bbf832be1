#include "plate_detection.hpp"
#include "errors.hpp"
#include "image_ops.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace RootVision {

cv::Mat detectPetriPlate(const cv::Mat& image, const PlateDetectionOptions& options) {
    if (image.empty()) {
        throw ValueError("detectPetriPlate: empty image");
    }
    if (options.border_width < 0 || options.border_width >= 0.5) {
        throw ValueError("detectPetriPlate: border_width must be in [0, 0.5)");
    }
    if (options.shape != "contour" && options.shape != "convex") {
        throw ValueError("detectPetriPlate: unknown plate shape '" + options.shape + "'");
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image;
    }

    cv::Mat smoothed = ImageOps::gaussianFilter(gray, options.smooth);
    double min_value = 0.0, max_value = 0.0;
    cv::minMaxLoc(smoothed, &min_value, &max_value);
    if (max_value <= min_value) {
        throw ShapeError("detectPetriPlate: uniform image, no plate to detect");
    }

    cv::Mat img8u;
    smoothed.convertTo(img8u, CV_8U, 255.0 / (max_value - min_value),
                       -255.0 * min_value / (max_value - min_value));
    cv::Mat binary;
    cv::threshold(img8u, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

    // Keep the largest bright component
    cv::Mat labels, stats, centroids;
    int n = cv::connectedComponentsWithStats(binary, labels, stats, centroids, 4, CV_32S);
    int best = 0;
    int best_area = 0;
    for (int i = 1; i < n; ++i) {
        int area = stats.at<int>(i, cv::CC_STAT_AREA);
        if (area > best_area) {
            best_area = area;
            best = i;
        }
    }
    if (best == 0) {
        throw ShapeError("detectPetriPlate: no plate region found");
    }
    cv::Mat component = labels == best;

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(component, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours.empty()) {
        throw ShapeError("detectPetriPlate: plate region has no outline");
    }
    auto outline = std::max_element(contours.begin(), contours.end(),
        [](const std::vector<cv::Point>& a, const std::vector<cv::Point>& b) {
            return cv::contourArea(a) < cv::contourArea(b);
        });

    std::vector<cv::Point> plate = *outline;
    if (options.shape == "convex") {
        std::vector<cv::Point> hull;
        cv::convexHull(plate, hull);
        plate = hull;
    }

    cv::Mat pmask = cv::Mat::zeros(gray.size(), CV_8U);
    cv::drawContours(pmask, std::vector<std::vector<cv::Point>>{plate}, 0, cv::Scalar(255), cv::FILLED);

    const cv::Rect box = cv::boundingRect(plate);
    const int border = static_cast<int>(std::floor(options.border_width * std::min(box.width, box.height)));
    if (border > 0) {
        pmask = ImageOps::binaryErosion(pmask, border);
        if (cv::countNonZero(pmask) == 0) {
            throw ShapeError("detectPetriPlate: plate vanished after border removal");
        }
    }
    return pmask;
}

} // namespace RootVision
