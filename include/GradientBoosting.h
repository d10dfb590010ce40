#pragma once
#include "Classifier.h"
#include "DecisionTree.h"
#include <cstdint>

/**
 * Softmax gradient boosting: one shallow regression tree per class per round,
 * leaves set by a single Newton step.
 */
class GradientBoosting : public Classifier {
public:
    GradientBoosting(size_t nRounds, double learningRate, int maxDepth, uint32_t seed);

    std::string name() const override { return "GradientBoosting"; }
    void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) override;
    std::vector<int> predict(const Matrix& X) const override;

private:
    size_t nRounds_;
    double learningRate_;
    int maxDepth_;
    uint32_t seed_;
    size_t numClasses_ = 0;
    std::vector<double> initScore_;
    std::vector<std::vector<DecisionTree>> rounds_;   // rounds_[m][class]

    std::vector<double> rawScores(const std::vector<double>& x) const;
};
