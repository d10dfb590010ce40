#include "GradientBoosting.h"
#include "AugurExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

GradientBoosting::GradientBoosting(size_t nRounds, double learningRate, int maxDepth, uint32_t seed)
    : nRounds_(nRounds), learningRate_(learningRate), maxDepth_(maxDepth), seed_(seed) {
    if (nRounds_ == 0 || learningRate_ <= 0.0) {
        throw Augur::ModelException("GradientBoosting: rounds and learning rate must be positive");
    }
}

void GradientBoosting::fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) {
    if (X.size() != y.size() || y.empty() || numClasses == 0) {
        throw Augur::ModelException(name() + ": invalid training data");
    }
    const size_t n = X.size();
    const size_t k = numClasses;
    numClasses_ = k;
    rounds_.clear();

    std::vector<double> prior(k, 0.0);
    for (int label : y) prior[static_cast<size_t>(label)] += 1.0;
    initScore_.assign(k, 0.0);
    for (size_t c = 0; c < k; ++c) {
        const double share = std::max(prior[c] / static_cast<double>(n), 1e-12);
        initScore_[c] = std::log(share);
    }
    if (k < 2) return;

    std::vector<std::vector<double>> F(n, initScore_);
    std::vector<std::vector<double>> prob(n, std::vector<double>(k));
    std::vector<double> residual(n);
    std::vector<double> hessian(n);
    std::vector<size_t> rows(n);
    std::iota(rows.begin(), rows.end(), 0);
    const double kScale = static_cast<double>(k - 1) / static_cast<double>(k);

    TreeParams params;
    params.maxDepth = maxDepth_;
    params.minSamplesLeaf = 1;
    std::mt19937 rng(seed_);

    for (size_t m = 0; m < nRounds_; ++m) {
        for (size_t i = 0; i < n; ++i) {
            const double mx = *std::max_element(F[i].begin(), F[i].end());
            double sum = 0.0;
            for (size_t c = 0; c < k; ++c) {
                prob[i][c] = std::exp(F[i][c] - mx);
                sum += prob[i][c];
            }
            for (size_t c = 0; c < k; ++c) prob[i][c] /= sum;
        }

        std::vector<DecisionTree> perClass;
        perClass.reserve(k);
        for (size_t c = 0; c < k; ++c) {
            for (size_t i = 0; i < n; ++i) {
                const double target = (static_cast<size_t>(y[i]) == c) ? 1.0 : 0.0;
                residual[i] = target - prob[i][c];
                hessian[i] = prob[i][c] * (1.0 - prob[i][c]);
            }
            DecisionTree tree(params);
            tree.fitRegressor(X, residual, hessian, rows, rng);
            for (size_t i = 0; i < n; ++i) {
                F[i][c] += learningRate_ * kScale * tree.leafValue(X[i])[0];
            }
            perClass.push_back(std::move(tree));
        }
        rounds_.push_back(std::move(perClass));
    }
}

std::vector<double> GradientBoosting::rawScores(const std::vector<double>& x) const {
    std::vector<double> score = initScore_;
    const double kScale = static_cast<double>(numClasses_ - 1) / static_cast<double>(numClasses_);
    for (const auto& perClass : rounds_) {
        for (size_t c = 0; c < perClass.size(); ++c) {
            score[c] += learningRate_ * kScale * perClass[c].leafValue(x)[0];
        }
    }
    return score;
}

std::vector<int> GradientBoosting::predict(const Matrix& X) const {
    if (numClasses_ == 0) throw Augur::ModelException(name() + " used before fit");
    std::vector<int> out;
    out.reserve(X.size());
    for (const auto& row : X) out.push_back(argmaxLowestIndex(rawScores(row)));
    return out;
}
