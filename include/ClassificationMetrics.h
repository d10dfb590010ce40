#pragma once
#include <string>
#include <vector>

/**
 * Fixed metric set reported for every candidate.
 */
struct ModelMetrics {
    std::string model;
    double accuracy = 0.0;
    double balancedAccuracy = 0.0;
    double f1Macro = 0.0;
    double precisionMacro = 0.0;
    double recallMacro = 0.0;

    bool operator==(const ModelMetrics& other) const {
        return model == other.model &&
               accuracy == other.accuracy &&
               balancedAccuracy == other.balancedAccuracy &&
               f1Macro == other.f1Macro &&
               precisionMacro == other.precisionMacro &&
               recallMacro == other.recallMacro;
    }
    bool operator!=(const ModelMetrics& other) const { return !(*this == other); }
};

struct ConfusionMatrix {
    std::vector<std::string> labels;            // sorted union of true and predicted labels
    std::vector<std::vector<size_t>> counts;    // counts[true][predicted]
};

namespace ClassificationMetrics {

extern const std::vector<std::string> kMetricNames;

std::vector<std::string> labelUnion(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred);

ConfusionMatrix confusionMatrix(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred);

/**
 * @brief Computes the fixed metric set; zero-division terms score 0.
 * @pre yTrue.size() == yPred.size() and both are non-empty.
 */
ModelMetrics score(const std::string& model,
                   const std::vector<std::string>& yTrue,
                   const std::vector<std::string>& yPred);

/**
 * @brief Plain-text per-class precision/recall/F1/support table with summary rows.
 */
std::string classificationReport(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred);

} // namespace ClassificationMetrics
