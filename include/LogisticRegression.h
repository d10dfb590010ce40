#pragma once
#include "Classifier.h"

/**
 * Multinomial logistic regression with L2 penalty, fitted by full-batch gradient descent.
 * The step size is derived from a bound on the loss curvature so no tuning is needed for
 * standardized inputs.
 */
class LogisticRegression : public Classifier {
public:
    explicit LogisticRegression(bool balancedClassWeight = false, double inverseRegularization = 1.0, int maxIter = 200);

    std::string name() const override { return "LogisticRegression"; }
    void fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) override;
    std::vector<int> predict(const Matrix& X) const override;

    std::vector<double> predictProba(const std::vector<double>& x) const;

private:
    bool balanced_;
    double c_;
    int maxIter_;
    size_t numClasses_ = 0;
    std::vector<std::vector<double>> weights_;
    std::vector<double> bias_;
};
