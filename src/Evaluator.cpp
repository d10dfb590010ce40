#include "Evaluator.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"
#include "GnuplotEngine.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

Evaluator::Evaluator(PlotConfig plot) : plot_(std::move(plot)) {}

std::string Evaluator::renderConfusionText(const ConfusionMatrix& cm) {
    size_t width = std::string("true\\pred").size();
    for (const auto& label : cm.labels) width = std::max(width, label.size());
    for (const auto& row : cm.counts) {
        for (size_t v : row) width = std::max(width, std::to_string(v).size());
    }
    const int w = static_cast<int>(width) + 2;

    std::ostringstream out;
    out << std::left << std::setw(w) << "true\\pred";
    for (const auto& label : cm.labels) out << std::right << std::setw(w) << label;
    out << "\n";
    for (size_t r = 0; r < cm.labels.size(); ++r) {
        out << std::left << std::setw(w) << cm.labels[r];
        for (size_t c = 0; c < cm.labels.size(); ++c) out << std::right << std::setw(w) << cm.counts[r][c];
        out << "\n";
    }
    return out.str();
}

EvaluationPayload Evaluator::evaluate(const RankedResults& results, const std::string& outputDir, bool verbose) const {
    if (results.ranked.empty()) throw Augur::ModelException("No trained candidates to evaluate");

    const CandidateResult& best = results.ranked.front();
    EvaluationPayload payload;
    payload.bestMetrics = best.metrics;
    for (const auto& r : results.ranked) payload.allMetrics.push_back(r.metrics);
    payload.confusion = ClassificationMetrics::confusionMatrix(best.yTrue, best.yPred);
    payload.classificationReport = ClassificationMetrics::classificationReport(best.yTrue, best.yPred);

    GnuplotEngine plotter(outputDir, plot_);
    std::string rendered;
    if (plotter.isAvailable()) {
        rendered = plotter.confusionMatrix("confusion_matrix", payload.confusion,
                                           "Confusion Matrix: " + best.metrics.model);
    }

    if (rendered.empty()) {
        const std::filesystem::path textPath = std::filesystem::path(outputDir) / "confusion_matrix.txt";
        std::ofstream out(textPath);
        if (!out) throw Augur::IOException("Cannot write " + textPath.string());
        out << "Confusion matrix for " << best.metrics.model << " (rows = true, columns = predicted)\n\n";
        out << renderConfusionText(payload.confusion);
        if (!out.good()) throw Augur::IOException("Failed while writing " + textPath.string());
        rendered = textPath.string();
        if (verbose) {
            std::cout << "[Augur][Evaluation] gnuplot unavailable; wrote text confusion matrix\n";
        }
    }
    payload.confusionMatrixPath = rendered;

    if (verbose) {
        std::cout << "[Augur][Evaluation] Best model: " << best.metrics.model
                  << " (balanced_accuracy=" << CommonUtils::toFixed(best.metrics.balancedAccuracy)
                  << ", f1_macro=" << CommonUtils::toFixed(best.metrics.f1Macro) << ")\n";
    }
    return payload;
}
