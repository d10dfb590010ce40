#pragma once
#include "Preprocessor.h"
#include <memory>
#include <string>
#include <vector>

/**
 * Common interface for every candidate model.
 * Labels are dense class indices in [0, numClasses).
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual std::string name() const = 0;

    /**
     * @pre X.size() == y.size() > 0 and every label is below numClasses.
     * @throws Augur::ModelException when the inputs are inconsistent or fitting fails.
     */
    virtual void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) = 0;

    virtual std::vector<int> predict(const Matrix& X) const = 0;
};

namespace ClassWeights {
/**
 * @brief n / (presentClasses * count_c) for each class; absent classes get weight 0.
 */
std::vector<double> balanced(const std::vector<int>& y, size_t numClasses);
std::vector<double> perSample(const std::vector<int>& y, const std::vector<double>& classWeight);
std::vector<double> uniform(size_t n);
}

int argmaxLowestIndex(const std::vector<double>& scores);

/**
 * Baseline: predicts the most frequent training class (lowest index on ties).
 */
class DummyMostFrequent : public Classifier {
public:
    std::string name() const override { return "DummyMostFrequent"; }
    void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) override;
    std::vector<int> predict(const Matrix& X) const override;

private:
    int majority_ = -1;
};
