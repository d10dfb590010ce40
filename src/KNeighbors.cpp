#include "KNeighbors.h"
#include "AugurExceptions.h"
#include <algorithm>
#include <numeric>

KNeighbors::KNeighbors(size_t k) : k_(k) {
    if (k_ == 0) throw Augur::ModelException("KNeighbors: k must be positive");
}

void KNeighbors::fit(const Matrix& X, const std::vector<int>& y, size_t numClasses) {
    if (X.size() != y.size() || y.empty() || numClasses == 0) {
        throw Augur::ModelException(name() + ": invalid training data");
    }
    numClasses_ = numClasses;
    trainX_ = X;
    trainY_ = y;
}

std::vector<int> KNeighbors::predict(const Matrix& X) const {
    if (trainX_.empty()) throw Augur::ModelException(name() + " used before fit");

    const size_t n = trainX_.size();
    const size_t k = std::min(k_, n);
    std::vector<int> out;
    out.reserve(X.size());
    std::vector<double> dist(n);
    std::vector<size_t> order(n);
    std::vector<double> votes(numClasses_);

    for (const auto& row : X) {
        for (size_t i = 0; i < n; ++i) {
            double d = 0.0;
            for (size_t j = 0; j < row.size() && j < trainX_[i].size(); ++j) {
                const double diff = row[j] - trainX_[i][j];
                d += diff * diff;
            }
            dist[i] = d;
        }
        std::iota(order.begin(), order.end(), 0);
        // Equal distances keep training order.
        std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
                          [&](size_t a, size_t b) { return dist[a] < dist[b] || (dist[a] == dist[b] && a < b); });

        std::fill(votes.begin(), votes.end(), 0.0);
        for (size_t i = 0; i < k; ++i) votes[static_cast<size_t>(trainY_[order[i]])] += 1.0;
        out.push_back(argmaxLowestIndex(votes));
    }
    return out;
}
