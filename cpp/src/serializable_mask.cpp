#include "serializable_mask.hpp"
#include "errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <iostream>

namespace RootVision {

static std::string dtypeName(int dtype) {
    switch (dtype) {
        case CV_8U: return "uint8";
        case CV_16U: return "uint16";
        case CV_32S: return "int32";
        case CV_32F: return "float32";
        default: return "unknown";
    }
}

nlohmann::json SerializationPolicy::toJson() const {
    nlohmann::json j;
    j["format"] = format;
    j["dtype"] = dtypeName(dtype);
    j["scale"] = scale;
    j["boolean"] = boolean;
    return j;
}

SerializableMask::SerializableMask(const cv::Mat& data, const SerializationPolicy& policy)
    : data_(data.clone()), policy_(policy) {
    if (data_.channels() != 1) {
        throw ValueError("SerializableMask: expected a single channel array");
    }
}

cv::Mat SerializableMask::encode() const {
    if (data_.empty()) return cv::Mat();

    // boolean masks may carry true as 1 or 255, fold both to 1
    cv::Mat logical;
    if (policy_.boolean) {
        cv::Mat binary = data_ != 0;
        binary.convertTo(logical, CV_64F, 1.0 / 255.0);
    } else {
        data_.convertTo(logical, CV_64F);
    }

    // convertTo rounds to nearest and saturates
    cv::Mat encoded;
    logical.convertTo(encoded, policy_.dtype, policy_.scale);
    return encoded;
}

bool SerializableMask::save(const std::string& path) const {
    if (data_.empty()) {
        std::cerr << "SerializableMask: refusing to save empty mask to " << path << std::endl;
        return false;
    }
    try {
        return cv::imwrite(path, encode());
    } catch (const cv::Exception& e) {
        std::cerr << "SerializableMask: failed to write " << path << ": " << e.what() << std::endl;
        return false;
    }
}

SerializationPolicy booleanMaskPolicy() {
    SerializationPolicy policy;
    policy.format = "PNG";
    policy.dtype = CV_8U;
    policy.scale = 255.0;
    policy.boolean = true;
    return policy;
}

SerializationPolicy labelMapPolicy(int label_count) {
    if (label_count <= 0) {
        throw ValueError("labelMapPolicy: label_count must be positive");
    }
    SerializationPolicy policy;
    policy.format = "PNG";
    policy.dtype = CV_8U;
    policy.scale = 255.0 / label_count;
    return policy;
}

} // namespace RootVision
