#include "DecisionTree.h"
#include "AugurExceptions.h"
#include <algorithm>
#include <numeric>

namespace {
constexpr double kMinGain = 1e-12;
constexpr double kMinHessian = 1e-12;
}

// Both criteria reduce to maximising sum_c(s_c^2) / w over the two children:
// Gini with per-class weight sums, squared error with a single residual channel.
struct DecisionTree::BuildContext {
    const Matrix& X;
    size_t channels = 1;
    std::vector<size_t> channel;
    std::vector<double> value;
    std::vector<double> weight;
    std::vector<double> hessian;    // empty for classification
    std::vector<size_t> rows;
    std::mt19937& rng;

    BuildContext(const Matrix& data, std::mt19937& gen) : X(data), rng(gen) {}
};

DecisionTree::DecisionTree(TreeParams params) : params_(params) {}

void DecisionTree::fitClassifier(const Matrix& X,
                                 const std::vector<int>& y,
                                 size_t numClasses,
                                 const std::vector<double>& sampleWeight,
                                 const std::vector<size_t>& rows,
                                 std::mt19937& rng) {
    if (X.size() != y.size() || X.size() != sampleWeight.size()) {
        throw Augur::ModelException("DecisionTree: inconsistent training array sizes");
    }
    if (rows.empty() || numClasses == 0) throw Augur::ModelException("DecisionTree: nothing to fit");

    BuildContext ctx(X, rng);
    ctx.channels = numClasses;
    ctx.channel.resize(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] < 0 || static_cast<size_t>(y[i]) >= numClasses) {
            throw Augur::ModelException("DecisionTree: class index out of range");
        }
        ctx.channel[i] = static_cast<size_t>(y[i]);
    }
    ctx.value = sampleWeight;
    ctx.weight = sampleWeight;
    ctx.rows = rows;

    nodes_.clear();
    build(ctx, 0, ctx.rows.size(), 0);
}

void DecisionTree::fitRegressor(const Matrix& X,
                                const std::vector<double>& residual,
                                const std::vector<double>& hessian,
                                const std::vector<size_t>& rows,
                                std::mt19937& rng) {
    if (X.size() != residual.size() || X.size() != hessian.size()) {
        throw Augur::ModelException("DecisionTree: inconsistent training array sizes");
    }
    if (rows.empty()) throw Augur::ModelException("DecisionTree: nothing to fit");

    BuildContext ctx(X, rng);
    ctx.channels = 1;
    ctx.channel.assign(X.size(), 0);
    ctx.value = residual;
    ctx.weight.assign(X.size(), 1.0);
    ctx.hessian = hessian;
    ctx.rows = rows;

    nodes_.clear();
    build(ctx, 0, ctx.rows.size(), 0);
}

int DecisionTree::build(BuildContext& ctx, size_t begin, size_t end, int depth) {
    const size_t k = ctx.channels;
    const size_t n = end - begin;

    std::vector<double> totals(k, 0.0);
    double totalWeight = 0.0;
    for (size_t i = begin; i < end; ++i) {
        const size_t r = ctx.rows[i];
        totals[ctx.channel[r]] += ctx.value[r];
        totalWeight += ctx.weight[r];
    }

    Node leaf;
    if (ctx.hessian.empty()) {
        leaf.value = totals;
        if (totalWeight > 0.0) {
            for (double& v : leaf.value) v /= totalWeight;
        }
    } else {
        double h = 0.0;
        for (size_t i = begin; i < end; ++i) h += ctx.hessian[ctx.rows[i]];
        leaf.value = {h > kMinHessian ? totals[0] / h : 0.0};
    }

    const int nodeId = static_cast<int>(nodes_.size());
    nodes_.push_back(std::move(leaf));

    if (params_.maxDepth > 0 && depth >= params_.maxDepth) return nodeId;
    if (n < 2 * std::max<size_t>(1, params_.minSamplesLeaf) || totalWeight <= 0.0) return nodeId;
    if (ctx.hessian.empty()) {
        const size_t nonEmpty = static_cast<size_t>(std::count_if(totals.begin(), totals.end(),
            [](double v) { return v > 0.0; }));
        if (nonEmpty <= 1) return nodeId;
    }

    const size_t p = ctx.X.empty() ? 0 : ctx.X[0].size();
    std::vector<size_t> features(p);
    std::iota(features.begin(), features.end(), 0);
    if (params_.maxFeatures > 0 && params_.maxFeatures < p) {
        std::shuffle(features.begin(), features.end(), ctx.rng);
        features.resize(params_.maxFeatures);
    }

    double parentScore = 0.0;
    for (double t : totals) parentScore += t * t;
    parentScore /= totalWeight;

    double bestGain = kMinGain;
    int bestFeature = -1;
    double bestThreshold = 0.0;

    std::vector<size_t> order(ctx.rows.begin() + static_cast<std::ptrdiff_t>(begin),
                              ctx.rows.begin() + static_cast<std::ptrdiff_t>(end));
    std::vector<double> left(k);
    const size_t minLeaf = std::max<size_t>(1, params_.minSamplesLeaf);

    for (size_t f : features) {
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return ctx.X[a][f] < ctx.X[b][f];
        });
        if (ctx.X[order.front()][f] == ctx.X[order.back()][f]) continue;

        std::fill(left.begin(), left.end(), 0.0);
        double leftWeight = 0.0;
        for (size_t i = 0; i + 1 < n; ++i) {
            const size_t r = order[i];
            left[ctx.channel[r]] += ctx.value[r];
            leftWeight += ctx.weight[r];

            if (i + 1 < minLeaf) continue;
            if (n - i - 1 < minLeaf) break;
            const double xv = ctx.X[r][f];
            const double xn = ctx.X[order[i + 1]][f];
            if (!(xv < xn)) continue;

            const double rightWeight = totalWeight - leftWeight;
            if (leftWeight <= 0.0 || rightWeight <= 0.0) continue;

            double ls = 0.0;
            double rs = 0.0;
            for (size_t c = 0; c < k; ++c) {
                ls += left[c] * left[c];
                const double rc = totals[c] - left[c];
                rs += rc * rc;
            }
            const double gain = ls / leftWeight + rs / rightWeight - parentScore;
            if (gain > bestGain) {
                bestGain = gain;
                bestFeature = static_cast<int>(f);
                bestThreshold = xv + (xn - xv) / 2.0;
                if (!(bestThreshold < xn)) bestThreshold = xv;
            }
        }
    }

    if (bestFeature < 0) return nodeId;

    const auto first = ctx.rows.begin() + static_cast<std::ptrdiff_t>(begin);
    const auto last = ctx.rows.begin() + static_cast<std::ptrdiff_t>(end);
    const auto mid = std::stable_partition(first, last, [&](size_t r) {
        return ctx.X[r][static_cast<size_t>(bestFeature)] <= bestThreshold;
    });
    const size_t split = static_cast<size_t>(mid - ctx.rows.begin());
    if (split == begin || split == end) return nodeId;

    nodes_[static_cast<size_t>(nodeId)].feature = bestFeature;
    nodes_[static_cast<size_t>(nodeId)].threshold = bestThreshold;
    const int leftId = build(ctx, begin, split, depth + 1);
    const int rightId = build(ctx, split, end, depth + 1);
    nodes_[static_cast<size_t>(nodeId)].left = leftId;
    nodes_[static_cast<size_t>(nodeId)].right = rightId;
    return nodeId;
}

const std::vector<double>& DecisionTree::leafValue(const std::vector<double>& x) const {
    if (nodes_.empty()) throw Augur::ModelException("DecisionTree used before fit");
    size_t id = 0;
    while (nodes_[id].feature >= 0) {
        const Node& node = nodes_[id];
        id = static_cast<size_t>(x[static_cast<size_t>(node.feature)] <= node.threshold ? node.left : node.right);
    }
    return nodes_[id].value;
}
