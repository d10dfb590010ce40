#include "LogisticRegression.h"
#include "AugurExceptions.h"
#include <algorithm>
#include <cmath>

namespace {
void softmaxInPlace(std::vector<double>& z) {
    const double m = *std::max_element(z.begin(), z.end());
    double sum = 0.0;
    for (double& v : z) {
        v = std::exp(v - m);
        sum += v;
    }
    for (double& v : z) v /= sum;
}
}

LogisticRegression::LogisticRegression(bool balancedClassWeight, double inverseRegularization, int maxIter)
    : balanced_(balancedClassWeight), c_(inverseRegularization), maxIter_(maxIter) {
    if (c_ <= 0.0) throw Augur::ModelException("LogisticRegression: C must be positive");
}

void LogisticRegression::fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) {
    if (X.size() != y.size() || y.empty() || numClasses == 0) {
        throw Augur::ModelException(name() + ": invalid training data");
    }
    const size_t n = X.size();
    const size_t p = X[0].size();
    numClasses_ = numClasses;
    weights_.assign(numClasses, std::vector<double>(p, 0.0));
    bias_.assign(numClasses, 0.0);
    if (numClasses < 2) return;

    const std::vector<double> sampleWeight = balanced_
        ? ClassWeights::perSample(y, ClassWeights::balanced(y, numClasses))
        : ClassWeights::uniform(n);
    double totalWeight = 0.0;
    for (double w : sampleWeight) totalWeight += w;

    double meanSqNorm = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double sq = 1.0;
        for (double v : X[i]) sq += v * v;
        meanSqNorm += sampleWeight[i] * sq;
    }
    meanSqNorm /= totalWeight;
    const double lambda = 1.0 / (c_ * totalWeight);
    const double step = 1.0 / (0.5 * meanSqNorm + lambda);

    std::vector<std::vector<double>> gradW(numClasses, std::vector<double>(p, 0.0));
    std::vector<double> gradB(numClasses, 0.0);
    std::vector<double> z(numClasses);

    for (int iter = 0; iter < maxIter_; ++iter) {
        for (auto& row : gradW) std::fill(row.begin(), row.end(), 0.0);
        std::fill(gradB.begin(), gradB.end(), 0.0);

        for (size_t i = 0; i < n; ++i) {
            for (size_t c = 0; c < numClasses; ++c) {
                double s = bias_[c];
                for (size_t j = 0; j < p; ++j) s += weights_[c][j] * X[i][j];
                z[c] = s;
            }
            softmaxInPlace(z);
            for (size_t c = 0; c < numClasses; ++c) {
                const double err = sampleWeight[i] * (z[c] - (static_cast<size_t>(y[i]) == c ? 1.0 : 0.0));
                gradB[c] += err;
                for (size_t j = 0; j < p; ++j) gradW[c][j] += err * X[i][j];
            }
        }

        double maxUpdate = 0.0;
        for (size_t c = 0; c < numClasses; ++c) {
            for (size_t j = 0; j < p; ++j) {
                const double g = gradW[c][j] / totalWeight + lambda * weights_[c][j];
                weights_[c][j] -= step * g;
                maxUpdate = std::max(maxUpdate, std::abs(step * g));
            }
            const double gb = gradB[c] / totalWeight;
            bias_[c] -= step * gb;
            maxUpdate = std::max(maxUpdate, std::abs(step * gb));
        }
        if (!std::isfinite(maxUpdate)) throw Augur::ModelException(name() + ": optimisation diverged");
        if (maxUpdate < 1e-7) break;
    }
}

std::vector<double> LogisticRegression::predictProba(const std::vector<double>& x) const {
    if (numClasses_ == 0) throw Augur::ModelException(name() + " used before fit");
    std::vector<double> z(numClasses_);
    for (size_t c = 0; c < numClasses_; ++c) {
        double s = bias_[c];
        for (size_t j = 0; j < x.size() && j < weights_[c].size(); ++j) s += weights_[c][j] * x[j];
        z[c] = s;
    }
    softmaxInPlace(z);
    return z;
}

std::vector<int> LogisticRegression::predict(const Matrix& X) const {
    std::vector<int> out;
    out.reserve(X.size());
    for (const auto& row : X) out.push_back(argmaxLowestIndex(predictProba(row)));
    return out;
}
