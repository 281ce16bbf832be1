#include "reporting.hpp"
#include "errors.hpp"
#include <opencv2/core.hpp>
#include <iostream>

namespace RootVision {

void printState(bool verbose, const std::string& message) {
    if (!verbose) return;
    std::cout << "  - " << message << std::endl;
}

void printError(const std::exception& error) {
    const char* kind = "Error";
    if (dynamic_cast<const ShapeError*>(&error)) {
        kind = "ShapeError";
    } else if (dynamic_cast<const ValueError*>(&error)) {
        kind = "ValueError";
    } else if (dynamic_cast<const cv::Exception*>(&error)) {
        kind = "OpenCV error";
    }
    std::cerr << "  *** " << kind << ": " << error.what() << std::endl;
}

} // namespace RootVision
