#include "AgentPolicies.h"
#include "CommonUtils.h"

#include <algorithm>

Reflection ThresholdReflector::reflect(const DatasetProfile& profile,
                                       const ModelMetrics& bestMetrics,
                                       const std::vector<ModelMetrics>& allMetrics) const {
    Reflection out;
    out.bestModel = bestMetrics.model;

    const auto baseline = std::find_if(allMetrics.begin(), allMetrics.end(), [](const ModelMetrics& m) {
        return m.model.find("Dummy") != std::string::npos;
    });
    if (baseline != allMetrics.end()) {
        const double lift = bestMetrics.balancedAccuracy - baseline->balancedAccuracy;
        if (lift < kMinBaselineLift) {
            out.issues.push_back("Best model only " + CommonUtils::toFixed(lift, 3) +
                                 " better than baseline. Weak signal or pipeline issues.");
            out.suggestions.push_back("Check for target leakage, verify target quality, or improve feature engineering.");
        }
    }

    if (bestMetrics.f1Macro < kMinF1Macro) {
        out.issues.push_back("Macro F1 score is modest (<0.60).");
        out.suggestions.push_back("Try different models, tune hyperparameters, or improve preprocessing.");
    }

    if (profile.imbalanceRatio >= DatasetProfiler::kImbalanceThreshold) {
        out.suggestions.push_back("Imbalance detected: consider class_weight, threshold tuning, or SMOTE.");
    }

    out.status = out.issues.empty() ? "ok" : "needs_attention";
    out.replanRecommended = !out.issues.empty() && bestMetrics.f1Macro < kMinF1Macro;
    return out;
}
