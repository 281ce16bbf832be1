#ifndef ROOTVISION_SERIALIZABLE_MASK_HPP
#define ROOTVISION_SERIALIZABLE_MASK_HPP

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace RootVision {

/**
 * @brief How a logical array (boolean or label values) is stored as pixels
 *
 * A logical value v is stored as saturate_cast<dtype>(round(v * scale)).
 * Boolean policies read any non-zero value as the logical value 1.
 */
struct SerializationPolicy {
    std::string format = "PNG";
    int dtype = CV_8U;
    double scale = 1.0;
    bool boolean = false;

    nlohmann::json toJson() const;
};

/**
 * @brief Mask or label map bundled with its serialization policy
 *
 * Built once at the end of a stage and never modified afterwards.
 */
class SerializableMask {
public:
    SerializableMask() = default;
    SerializableMask(const cv::Mat& data, const SerializationPolicy& policy);

    const cv::Mat& data() const { return data_; }
    const SerializationPolicy& policy() const { return policy_; }

    cv::Size size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    /**
     * @brief Convert logical values to storable pixel intensities
     * @return New array of the policy dtype, the stored data is untouched
     */
    cv::Mat encode() const;

    /**
     * @brief Write the encoded array to disk
     * @param path Output file; its extension should match the policy format
     * @return true on success
     */
    bool save(const std::string& path) const;

private:
    cv::Mat data_;
    SerializationPolicy policy_;
};

// Boolean mask policy: true -> 255, false -> 0
SerializationPolicy booleanMaskPolicy();

// Label map policy: label k -> round(k * 255 / label_count)
SerializationPolicy labelMapPolicy(int label_count);

} // namespace RootVision

#endif // ROOTVISION_SERIALIZABLE_MASK_HPP
