#include "Classifier.h"
#include "AugurExceptions.h"

namespace ClassWeights {

std::vector<double> balanced(const std::vector<int>& y, size_t numClasses) {
    std::vector<size_t> counts(numClasses, 0);
    for (int label : y) counts[static_cast<size_t>(label)]++;

    size_t present = 0;
    for (size_t c : counts) present += (c > 0) ? 1 : 0;

    std::vector<double> weights(numClasses, 0.0);
    for (size_t c = 0; c < numClasses; ++c) {
        if (counts[c] == 0) continue;
        weights[c] = static_cast<double>(y.size()) /
                     (static_cast<double>(present) * static_cast<double>(counts[c]));
    }
    return weights;
}

std::vector<double> perSample(const std::vector<int>& y, const std::vector<double>& classWeight) {
    std::vector<double> out(y.size());
    for (size_t i = 0; i < y.size(); ++i) out[i] = classWeight[static_cast<size_t>(y[i])];
    return out;
}

std::vector<double> uniform(size_t n) {
    return std::vector<double>(n, 1.0);
}

} // namespace ClassWeights

int argmaxLowestIndex(const std::vector<double>& scores) {
    int best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[static_cast<size_t>(best)]) best = static_cast<int>(i);
    }
    return best;
}

void DummyMostFrequent::fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) {
    if (X.size() != y.size() || y.empty() || numClasses == 0) {
        throw Augur::ModelException(name() + ": invalid training data");
    }
    std::vector<double> counts(numClasses, 0.0);
    for (int label : y) counts[static_cast<size_t>(label)] += 1.0;
    majority_ = argmaxLowestIndex(counts);
}

std::vector<int> DummyMostFrequent::predict(const Matrix& X) const {
    if (majority_ < 0) throw Augur::ModelException(name() + " used before fit");
    return std::vector<int>(X.size(), majority_);
}
