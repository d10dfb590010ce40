#pragma once
#include "AgentConfig.h"
#include "ClassificationMetrics.h"
#include "TrainingEngine.h"
#include <string>
#include <vector>

struct EvaluationPayload {
    ModelMetrics bestMetrics;
    std::vector<ModelMetrics> allMetrics;   // ranking order
    std::string confusionMatrixPath;
    std::string classificationReport;
    ConfusionMatrix confusion;
};

class Evaluator {
public:
    explicit Evaluator(PlotConfig plot = {});

    /**
     * @brief Packages the ranking and renders the confusion artifact for the top candidate only.
     * @post confusionMatrixPath names an existing file: the gnuplot image when gnuplot is usable,
     *       otherwise a plain-text grid.
     * @throws Augur::ModelException on an empty ranking.
     * @throws Augur::IOException when the fallback grid cannot be written.
     */
    EvaluationPayload evaluate(const RankedResults& results, const std::string& outputDir, bool verbose = false) const;

    static std::string renderConfusionText(const ConfusionMatrix& cm);

private:
    PlotConfig plot_;
};
