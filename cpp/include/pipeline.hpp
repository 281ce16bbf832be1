#ifndef ROOTVISION_PIPELINE_HPP
#define ROOTVISION_PIPELINE_HPP

#include "errors.hpp"
#include "root_graph.hpp"
#include "root_tree.hpp"
#include "serializable_mask.hpp"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace RootVision {

// Any value a stage can consume or produce
using StageValue = std::variant<std::string, cv::Mat, cv::Rect, SerializableMask, RootGraph, RootTree>;
using StageOutputs = std::map<std::string, StageValue>;

/**
 * @brief Named values shared between the stages of one pipeline run
 */
class StageContext {
public:
    StageContext() = default;

    void set(const std::string& name, StageValue value);
    void merge(const StageOutputs& outputs);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // @throws ValueError if the value is missing
    const StageValue& at(const std::string& name) const;

    // @throws ValueError if the value is missing or holds another type
    template <typename T>
    const T& get(const std::string& name) const {
        const T* value = std::get_if<T>(&at(name));
        if (!value) {
            throw ValueError("StageContext: value '" + name + "' has an unexpected type");
        }
        return *value;
    }

private:
    std::map<std::string, StageValue> values_;
};

/**
 * @brief One step of a processing pipeline
 *
 * A stage reads its declared inputs from the context and returns exactly its
 * declared outputs. Stages keep no state between invocations.
 */
class Stage {
public:
    virtual ~Stage() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> inputs() const = 0;
    virtual std::vector<std::string> outputs() const = 0;

    // Pipeline-facing configuration, shown by parameter listings
    virtual nlohmann::json parameters() const { return nlohmann::json::object(); }

    virtual StageOutputs invoke(const StageContext& context) const = 0;
};

/**
 * @brief Ordered sequence of stages
 *
 * Stage inputs are resolved by name from the initial context and the outputs
 * of the stages run before.
 */
class Pipeline {
public:
    Pipeline() = default;
    explicit Pipeline(std::vector<std::shared_ptr<const Stage>> stages);

    Pipeline& add(std::shared_ptr<const Stage> stage);

    const std::vector<std::shared_ptr<const Stage>>& stages() const { return stages_; }
    std::vector<std::string> stageNames() const;

    /**
     * @brief Check that every stage input can be resolved
     * @param provided Names available before the first stage runs
     * @throws ValueError naming the first stage with an unresolved input
     */
    void validate(const std::vector<std::string>& provided) const;

    /**
     * @brief Run all stages in order
     * @return The initial context extended with every stage output
     * @throws ValueError if validation fails or a stage misses a declared output;
     *         stage errors propagate unchanged
     */
    StageContext run(StageContext context, bool verbose = false) const;

    // {stage name: pipeline-facing parameters}
    nlohmann::json parameters() const;

private:
    std::vector<std::shared_ptr<const Stage>> stages_;
};

} // namespace RootVision

#endif // ROOTVISION_PIPELINE_HPP
