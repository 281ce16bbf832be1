#include "pipeline.hpp"
#include "reporting.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace RootVision {

void StageContext::set(const std::string& name, StageValue value) {
    values_[name] = std::move(value);
}

void StageContext::merge(const StageOutputs& outputs) {
    for (const auto& kv : outputs) {
        values_[kv.first] = kv.second;
    }
}

bool StageContext::contains(const std::string& name) const {
    return values_.find(name) != values_.end();
}

std::vector<std::string> StageContext::names() const {
    std::vector<std::string> result;
    for (const auto& kv : values_) result.push_back(kv.first);
    return result;
}

const StageValue& StageContext::at(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw ValueError("StageContext: missing value '" + name + "'");
    }
    return it->second;
}

Pipeline::Pipeline(std::vector<std::shared_ptr<const Stage>> stages) {
    for (auto& stage : stages) add(std::move(stage));
}

Pipeline& Pipeline::add(std::shared_ptr<const Stage> stage) {
    if (!stage) {
        throw ValueError("Pipeline: null stage");
    }
    stages_.push_back(std::move(stage));
    return *this;
}

std::vector<std::string> Pipeline::stageNames() const {
    std::vector<std::string> names;
    for (const auto& stage : stages_) names.push_back(stage->name());
    return names;
}

void Pipeline::validate(const std::vector<std::string>& provided) const {
    std::set<std::string> available(provided.begin(), provided.end());
    for (const auto& stage : stages_) {
        for (const auto& input : stage->inputs()) {
            if (available.count(input) == 0) {
                throw ValueError("Pipeline: stage '" + stage->name() +
                                 "' needs '" + input + "' which no earlier stage provides");
            }
        }
        for (const auto& output : stage->outputs()) {
            available.insert(output);
        }
    }
}

StageContext Pipeline::run(StageContext context, bool verbose) const {
    validate(context.names());

    for (const auto& stage : stages_) {
        printState(verbose, stage->name());
        StageOutputs outputs = stage->invoke(context);

        for (const auto& output : stage->outputs()) {
            if (outputs.find(output) == outputs.end()) {
                throw ValueError("Pipeline: stage '" + stage->name() +
                                 "' did not produce '" + output + "'");
            }
        }
        context.merge(outputs);
    }
    return context;
}

nlohmann::json Pipeline::parameters() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& stage : stages_) {
        j[stage->name()] = stage->parameters();
    }
    return j;
}

} // namespace RootVision
