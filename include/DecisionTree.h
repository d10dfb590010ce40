#pragma once
#include "Preprocessor.h"
#include <random>
#include <vector>

struct TreeParams {
    int maxDepth = 0;           // 0 = unlimited
    size_t minSamplesLeaf = 1;
    size_t maxFeatures = 0;     // 0 = all features at every split
};

/**
 * CART tree over a dense design matrix.
 * Classification leaves hold the weighted class distribution; regression leaves hold
 * one Newton step (sum of residuals over sum of hessians) for gradient boosting.
 */
class DecisionTree {
public:
    explicit DecisionTree(TreeParams params = {});

    /**
     * @brief Grows a Gini tree on the given rows (duplicates allowed, e.g. a bootstrap sample).
     * @pre y[i] < numClasses and sampleWeight.size() == X.size().
     */
    void fitClassifier(const Matrix& X,
                       const std::vector<int>& y,
                       size_t numClasses,
                       const std::vector<double>& sampleWeight,
                       const std::vector<size_t>& rows,
                       std::mt19937& rng);

    /**
     * @brief Grows a squared-error tree on residuals; leaf values use the hessians.
     */
    void fitRegressor(const Matrix& X,
                      const std::vector<double>& residual,
                      const std::vector<double>& hessian,
                      const std::vector<size_t>& rows,
                      std::mt19937& rng);

    const std::vector<double>& leafValue(const std::vector<double>& x) const;

    size_t nodeCount() const noexcept { return nodes_.size(); }

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        std::vector<double> value;
    };
    struct BuildContext;

    TreeParams params_;
    std::vector<Node> nodes_;

    int build(BuildContext& ctx, size_t begin, size_t end, int depth);
};
