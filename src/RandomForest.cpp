#include "RandomForest.h"
#include "AugurExceptions.h"
#include <algorithm>
#include <cmath>
#include <random>

RandomForest::RandomForest(size_t nEstimators, uint32_t seed, bool balancedClassWeight, int maxDepth)
    : nEstimators_(nEstimators), seed_(seed), balanced_(balancedClassWeight), maxDepth_(maxDepth) {
    if (nEstimators_ == 0) throw Augur::ModelException("RandomForest: n_estimators must be positive");
}

void RandomForest::fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) {
    if (X.size() != y.size() || y.empty() || numClasses == 0) {
        throw Augur::ModelException(name() + ": invalid training data");
    }
    numClasses_ = numClasses;
    trees_.clear();

    const size_t n = X.size();
    const size_t p = X[0].size();
    TreeParams params;
    params.maxDepth = maxDepth_;
    params.minSamplesLeaf = 1;
    params.maxFeatures = std::max<size_t>(1, static_cast<size_t>(std::sqrt(static_cast<double>(p))));

    const std::vector<double> sampleWeight = balanced_
        ? ClassWeights::perSample(y, ClassWeights::balanced(y, numClasses))
        : ClassWeights::uniform(n);

    trees_.reserve(nEstimators_);
    for (size_t t = 0; t < nEstimators_; ++t) {
        std::mt19937 rng(seed_ ^ static_cast<uint32_t>(0x9e3779b9U * (t + 1)));
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        std::vector<size_t> sample(n);
        for (size_t& r : sample) r = pick(rng);

        DecisionTree tree(params);
        tree.fitClassifier(X, y, numClasses, sampleWeight, sample, rng);
        trees_.push_back(std::move(tree));
    }
}

std::vector<int> RandomForest::predict(const Matrix& X) const {
    if (trees_.empty()) throw Augur::ModelException(name() + " used before fit");
    std::vector<int> out;
    out.reserve(X.size());
    std::vector<double> votes(numClasses_);
    for (const auto& row : X) {
        std::fill(votes.begin(), votes.end(), 0.0);
        for (const auto& tree : trees_) {
            const auto& dist = tree.leafValue(row);
            for (size_t c = 0; c < numClasses_ && c < dist.size(); ++c) votes[c] += dist[c];
        }
        out.push_back(argmaxLowestIndex(votes));
    }
    return out;
}
