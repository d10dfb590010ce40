#include "ClassificationMetrics.h"
#include "AugurExceptions.h"

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>

namespace {
struct PerClass {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    size_t support = 0;
};

double safeRatio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

std::vector<PerClass> perClassScores(const ConfusionMatrix& cm) {
    const size_t k = cm.labels.size();
    std::vector<PerClass> out(k);
    for (size_t i = 0; i < k; ++i) {
        size_t tp = cm.counts[i][i];
        size_t predicted = 0;
        size_t actual = 0;
        for (size_t j = 0; j < k; ++j) {
            predicted += cm.counts[j][i];
            actual += cm.counts[i][j];
        }
        out[i].precision = safeRatio(static_cast<double>(tp), static_cast<double>(predicted));
        out[i].recall = safeRatio(static_cast<double>(tp), static_cast<double>(actual));
        out[i].f1 = safeRatio(2.0 * out[i].precision * out[i].recall, out[i].precision + out[i].recall);
        out[i].support = actual;
    }
    return out;
}
} // namespace

namespace ClassificationMetrics {

const std::vector<std::string> kMetricNames = {
    "accuracy", "balanced_accuracy", "f1_macro", "precision_macro", "recall_macro"
};

std::vector<std::string> labelUnion(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred) {
    std::set<std::string> labels(yTrue.begin(), yTrue.end());
    labels.insert(yPred.begin(), yPred.end());
    return {labels.begin(), labels.end()};
}

ConfusionMatrix confusionMatrix(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred) {
    if (yTrue.size() != yPred.size()) {
        throw Augur::ModelException("Prediction count does not match label count");
    }
    ConfusionMatrix cm;
    cm.labels = labelUnion(yTrue, yPred);
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < cm.labels.size(); ++i) index[cm.labels[i]] = i;

    cm.counts.assign(cm.labels.size(), std::vector<size_t>(cm.labels.size(), 0));
    for (size_t i = 0; i < yTrue.size(); ++i) {
        cm.counts[index[yTrue[i]]][index[yPred[i]]]++;
    }
    return cm;
}

ModelMetrics score(const std::string& model,
                   const std::vector<std::string>& yTrue,
                   const std::vector<std::string>& yPred) {
    if (yTrue.empty()) throw Augur::ModelException("Cannot score " + model + " on an empty test split");

    const ConfusionMatrix cm = confusionMatrix(yTrue, yPred);
    const auto scores = perClassScores(cm);
    const double k = static_cast<double>(scores.size());

    ModelMetrics m;
    m.model = model;
    size_t correct = 0;
    for (size_t i = 0; i < cm.labels.size(); ++i) correct += cm.counts[i][i];
    m.accuracy = static_cast<double>(correct) / static_cast<double>(yTrue.size());

    double recallSum = 0.0;
    size_t presentClasses = 0;
    for (const auto& s : scores) {
        m.precisionMacro += s.precision;
        m.recallMacro += s.recall;
        m.f1Macro += s.f1;
        if (s.support > 0) {
            recallSum += s.recall;
            ++presentClasses;
        }
    }
    m.precisionMacro /= k;
    m.recallMacro /= k;
    m.f1Macro /= k;
    m.balancedAccuracy = safeRatio(recallSum, static_cast<double>(presentClasses));
    return m;
}

std::string classificationReport(const std::vector<std::string>& yTrue, const std::vector<std::string>& yPred) {
    const ConfusionMatrix cm = confusionMatrix(yTrue, yPred);
    const auto scores = perClassScores(cm);

    size_t width = std::string("weighted avg").size();
    for (const auto& label : cm.labels) width = std::max(width, label.size());

    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << std::setw(static_cast<int>(width)) << "" << " "
        << std::setw(10) << "precision" << std::setw(10) << "recall"
        << std::setw(10) << "f1-score" << std::setw(10) << "support" << "\n\n";

    double macroP = 0.0, macroR = 0.0, macroF = 0.0;
    double weightedP = 0.0, weightedR = 0.0, weightedF = 0.0;
    size_t total = 0;
    for (size_t i = 0; i < cm.labels.size(); ++i) {
        const auto& s = scores[i];
        out << std::setw(static_cast<int>(width)) << cm.labels[i] << " "
            << std::setw(10) << s.precision << std::setw(10) << s.recall
            << std::setw(10) << s.f1 << std::setw(10) << s.support << "\n";
        macroP += s.precision;
        macroR += s.recall;
        macroF += s.f1;
        weightedP += s.precision * static_cast<double>(s.support);
        weightedR += s.recall * static_cast<double>(s.support);
        weightedF += s.f1 * static_cast<double>(s.support);
        total += s.support;
    }

    const double k = static_cast<double>(std::max<size_t>(1, cm.labels.size()));
    const double n = static_cast<double>(std::max<size_t>(1, total));
    size_t correct = 0;
    for (size_t i = 0; i < cm.labels.size(); ++i) correct += cm.counts[i][i];

    out << "\n";
    out << std::setw(static_cast<int>(width)) << "accuracy" << " "
        << std::setw(10) << "" << std::setw(10) << ""
        << std::setw(10) << static_cast<double>(correct) / n << std::setw(10) << total << "\n";
    out << std::setw(static_cast<int>(width)) << "macro avg" << " "
        << std::setw(10) << macroP / k << std::setw(10) << macroR / k
        << std::setw(10) << macroF / k << std::setw(10) << total << "\n";
    out << std::setw(static_cast<int>(width)) << "weighted avg" << " "
        << std::setw(10) << weightedP / n << std::setw(10) << weightedR / n
        << std::setw(10) << weightedF / n << std::setw(10) << total << "\n";
    return out.str();
}

} // namespace ClassificationMetrics
