#pragma once
#include "Classifier.h"
#include "DecisionTree.h"
#include <cstdint>

class RandomForest : public Classifier {
public:
    RandomForest(size_t nEstimators, uint32_t seed, bool balancedClassWeight = false, int maxDepth = 0);

    std::string name() const override { return "RandomForest"; }

    /**
     * @brief Fits each tree on a bootstrap sample with sqrt(p) features per split.
     * @post Tree t is seeded from (seed, t), so results do not depend on thread scheduling.
     */
    void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) override;
    std::vector<int> predict(const Matrix& X) const override;

private:
    size_t nEstimators_;
    uint32_t seed_;
    bool balanced_;
    int maxDepth_;
    size_t numClasses_ = 0;
    std::vector<DecisionTree> trees_;
};
