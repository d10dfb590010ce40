#pragma once
#include "ClassificationMetrics.h"
#include "DatasetProfiler.h"
#include "MemoryStore.h"

#include <optional>
#include <string>
#include <vector>

using Plan = std::vector<std::string>;

namespace PlanTasks {
inline const std::string kProfileDataset = "profile_dataset";
inline const std::string kBuildPreprocessor = "build_preprocessor";
inline const std::string kSelectModels = "select_models";
inline const std::string kTrainModels = "train_models";
inline const std::string kEvaluate = "evaluate";
inline const std::string kReflect = "reflect";
inline const std::string kWriteReport = "write_report";
inline const std::string kImbalanceStrategy = "consider_imbalance_strategy";
inline const std::string kReplanAttempt = "replan_attempt";
inline const std::string kPrioritizePrefix = "prioritize_model:";

/**
 * @brief Canonical stage labels in dependency order.
 */
const std::vector<std::string>& baseSequence();

/**
 * @brief True when every canonical stage appears once and in dependency order.
 */
bool respectsStageOrder(const Plan& plan);

/**
 * @brief True when `extended` starts with every entry of `original`, in order.
 */
bool isExtensionOf(const Plan& extended, const Plan& original);
}

struct Reflection {
    std::string status = "ok";   // ok | needs_attention
    std::string bestModel;
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
    bool replanRecommended = false;
};

class Planner {
public:
    virtual ~Planner() = default;

    /**
     * @brief Deterministic plan for a profile and optional memory hint. No I/O.
     */
    virtual Plan createPlan(const DatasetProfile& profile, const std::optional<MemoryRecord>& memoryHint) const = 0;
};

class Reflector {
public:
    virtual ~Reflector() = default;

    virtual Reflection reflect(const DatasetProfile& profile,
                               const ModelMetrics& bestMetrics,
                               const std::vector<ModelMetrics>& allMetrics) const = 0;

    virtual bool shouldReplan(const Reflection& reflection) const { return reflection.replanRecommended; }
};

struct ReplanOutcome {
    Plan plan;
    DatasetProfile profile;
};

class ReplanStrategy {
public:
    virtual ~ReplanStrategy() = default;

    /**
     * @post The returned plan extends `plan` and the returned notes extend `profile.notes`.
     */
    virtual ReplanOutcome apply(const Plan& plan, const DatasetProfile& profile, const Reflection& reflection) const = 0;
};

/**
 * Canonical stage sequence, an optional prioritised model taken from memory,
 * and the imbalance task placed right before training.
 */
class RuleBasedPlanner : public Planner {
public:
    Plan createPlan(const DatasetProfile& profile, const std::optional<MemoryRecord>& memoryHint) const override;
};

/**
 * Flags weak lift over the majority-class baseline and modest macro F1.
 */
class ThresholdReflector : public Reflector {
public:
    static constexpr double kMinBaselineLift = 0.05;
    static constexpr double kMinF1Macro = 0.60;

    Reflection reflect(const DatasetProfile& profile,
                       const ModelMetrics& bestMetrics,
                       const std::vector<ModelMetrics>& allMetrics) const override;
};

class AppendingReplanStrategy : public ReplanStrategy {
public:
    ReplanOutcome apply(const Plan& plan, const DatasetProfile& profile, const Reflection& reflection) const override;
};
