#include "AgentPolicies.h"

#include <algorithm>

namespace PlanTasks {

const std::vector<std::string>& baseSequence() {
    static const std::vector<std::string> kBase = {
        kProfileDataset, kBuildPreprocessor, kSelectModels, kTrainModels, kEvaluate, kReflect, kWriteReport
    };
    return kBase;
}

bool respectsStageOrder(const Plan& plan) {
    size_t lastPos = 0;
    bool first = true;
    for (const auto& stage : baseSequence()) {
        if (std::count(plan.begin(), plan.end(), stage) != 1) return false;
        const size_t pos = static_cast<size_t>(std::find(plan.begin(), plan.end(), stage) - plan.begin());
        if (!first && pos <= lastPos) return false;
        lastPos = pos;
        first = false;
    }
    return true;
}

bool isExtensionOf(const Plan& extended, const Plan& original) {
    if (extended.size() < original.size()) return false;
    size_t j = 0;
    for (size_t i = 0; i < extended.size() && j < original.size(); ++i) {
        if (extended[i] == original[j]) ++j;
    }
    return j == original.size();
}

} // namespace PlanTasks

Plan RuleBasedPlanner::createPlan(const DatasetProfile& profile, const std::optional<MemoryRecord>& memoryHint) const {
    Plan plan = PlanTasks::baseSequence();

    if (memoryHint && !memoryHint->bestModel.empty()) {
        const auto select = std::find(plan.begin(), plan.end(), PlanTasks::kSelectModels);
        plan.insert(select + 1, PlanTasks::kPrioritizePrefix + memoryHint->bestModel);
    }

    if (profile.imbalanceRatio >= DatasetProfiler::kImbalanceThreshold) {
        const auto train = std::find(plan.begin(), plan.end(), PlanTasks::kTrainModels);
        plan.insert(train, PlanTasks::kImbalanceStrategy);
    }
    return plan;
}
