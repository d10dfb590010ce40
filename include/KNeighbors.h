#pragma once
#include "Classifier.h"

/**
 * Brute-force k-nearest-neighbours with Euclidean distance and uniform votes.
 */
class KNeighbors : public Classifier {
public:
    explicit KNeighbors(size_t k = 5);

    std::string name() const override { return "KNeighbors"; }
    void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) override;
    std::vector<int> predict(const Matrix& X) const override;

private:
    size_t k_;
    size_t numClasses_ = 0;
    Matrix trainX_;
    std::vector<int> trainY_;
};
