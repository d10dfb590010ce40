#include "TrainingEngine.h"
#include "AugurExceptions.h"
#include "GradientBoosting.h"
#include "KNeighbors.h"
#include "LogisticRegression.h"
#include "RandomForest.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <map>
#include <random>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kForestTrees = 100;
constexpr size_t kBoostingRounds = 100;
constexpr double kBoostingLearningRate = 0.1;
constexpr int kBoostingDepth = 3;
constexpr size_t kNeighbours = 5;
constexpr size_t kBoostingMaxRows = 50000;
constexpr size_t kNeighboursMaxRows = 20000;
constexpr size_t kNeighboursMaxCols = 200;

size_t testCountFor(size_t n, double testFraction) {
    const double raw = std::ceil(static_cast<double>(n) * testFraction);
    size_t count = raw < 1.0 ? 1 : static_cast<size_t>(raw);
    return std::min(count, n - 1);
}
} // namespace

std::vector<CandidateSpec> TrainingEngine::selectCandidates(const DatasetProfile& profile, uint32_t seed) {
    const bool balanced = profile.imbalanceRatio >= DatasetProfiler::kImbalanceThreshold;
    const size_t rows = profile.shape.rows;
    const size_t cols = profile.shape.cols;

    std::vector<CandidateSpec> out;
    out.push_back({"DummyMostFrequent", [] { return std::make_unique<DummyMostFrequent>(); }});
    out.push_back({"LogisticRegression", [balanced] { return std::make_unique<LogisticRegression>(balanced); }});
    out.push_back({"RandomForest", [seed, balanced] {
        return std::make_unique<RandomForest>(kForestTrees, seed, balanced);
    }});
    if (rows <= kBoostingMaxRows) {
        out.push_back({"GradientBoosting", [seed] {
            return std::make_unique<GradientBoosting>(kBoostingRounds, kBoostingLearningRate, kBoostingDepth, seed);
        }});
    }
    if (rows <= kNeighboursMaxRows && cols <= kNeighboursMaxCols) {
        out.push_back({"KNeighbors", [] { return std::make_unique<KNeighbors>(kNeighbours); }});
    }
    return out;
}

TrainTestSplit TrainingEngine::splitRows(const std::vector<size_t>& rows,
                                         const std::vector<std::string>& labels,
                                         double testFraction,
                                         uint32_t seed) {
    const size_t n = rows.size();
    const size_t testTotal = testCountFor(n, testFraction);
    std::mt19937 rng(seed);

    std::map<std::string, std::vector<size_t>> byClass;
    for (size_t i = 0; i < n; ++i) byClass[labels[i]].push_back(rows[i]);

    bool canStratify = byClass.size() >= 2;
    for (const auto& kv : byClass) {
        if (kv.second.size() < 2) canStratify = false;
    }

    TrainTestSplit split;
    if (!canStratify) {
        std::vector<size_t> shuffled = rows;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        split.test.assign(shuffled.begin(), shuffled.begin() + static_cast<std::ptrdiff_t>(testTotal));
        split.train.assign(shuffled.begin() + static_cast<std::ptrdiff_t>(testTotal), shuffled.end());
    } else {
        // Proportional allocation, remainder to the largest fractional shares.
        std::vector<size_t> quota;
        std::vector<std::pair<double, size_t>> remainders;
        size_t assigned = 0;
        size_t classIdx = 0;
        for (const auto& kv : byClass) {
            const double exact = static_cast<double>(kv.second.size()) * static_cast<double>(testTotal) /
                                 static_cast<double>(n);
            const size_t base = std::min(static_cast<size_t>(std::floor(exact)), kv.second.size() - 1);
            quota.push_back(base);
            remainders.push_back({exact - static_cast<double>(base), classIdx++});
            assigned += base;
        }
        std::stable_sort(remainders.begin(), remainders.end(), [](const auto& a, const auto& b) {
            return a.first > b.first;
        });

        std::vector<const std::vector<size_t>*> members;
        for (const auto& kv : byClass) members.push_back(&kv.second);
        for (const auto& rem : remainders) {
            if (assigned >= testTotal) break;
            if (quota[rem.second] + 1 < members[rem.second]->size()) {
                quota[rem.second]++;
                assigned++;
            }
        }

        for (size_t c = 0; c < members.size(); ++c) {
            std::vector<size_t> shuffled = *members[c];
            std::shuffle(shuffled.begin(), shuffled.end(), rng);
            split.test.insert(split.test.end(), shuffled.begin(), shuffled.begin() + static_cast<std::ptrdiff_t>(quota[c]));
            split.train.insert(split.train.end(), shuffled.begin() + static_cast<std::ptrdiff_t>(quota[c]), shuffled.end());
        }
        split.stratified = true;
    }

    std::sort(split.train.begin(), split.train.end());
    std::sort(split.test.begin(), split.test.end());
    return split;
}

void TrainingEngine::rank(std::vector<CandidateResult>& results) {
    std::stable_sort(results.begin(), results.end(), [](const CandidateResult& a, const CandidateResult& b) {
        if (a.metrics.balancedAccuracy != b.metrics.balancedAccuracy) {
            return a.metrics.balancedAccuracy > b.metrics.balancedAccuracy;
        }
        return a.metrics.f1Macro > b.metrics.f1Macro;
    });
}

RankedResults TrainingEngine::train(const TypedDataset& data,
                                    const std::string& target,
                                    const PreprocessingSpec& spec,
                                    const std::vector<CandidateSpec>& candidates,
                                    uint32_t seed,
                                    double testFraction,
                                    bool verbose) {
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw Augur::ConfigurationException("test fraction must be in (0, 1)");
    }
    if (candidates.empty()) throw Augur::ModelException("No candidate models to train");

    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) throw Augur::DatasetException("Target column '" + target + "' not found in dataset columns.");
    const TypedColumn& y = data.columns()[static_cast<size_t>(targetIdx)];

    std::vector<size_t> labelled;
    std::vector<std::string> labels;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (y.missing[r]) continue;
        labelled.push_back(r);
        labels.push_back(y.textAt(r));
    }
    if (labelled.size() < 2) {
        throw Augur::DatasetException("Fewer than 2 rows with a non-missing target '" + target + "'");
    }

    const TrainTestSplit split = splitRows(labelled, labels, testFraction, seed);
    if (verbose) {
        std::cout << "[Augur][Modelling] Split " << split.train.size() << " train / " << split.test.size()
                  << " test rows (" << (split.stratified ? "stratified" : "non-stratified") << ")\n";
    }

    Preprocessor preprocessor(spec);
    preprocessor.fit(data, split.train);
    const Matrix trainX = preprocessor.transform(data, split.train);
    const Matrix testX = preprocessor.transform(data, split.test);

    std::map<std::string, int> classIndex;
    for (size_t r : split.train) classIndex.emplace(y.textAt(r), 0);
    std::vector<std::string> classNames;
    for (auto& kv : classIndex) {
        kv.second = static_cast<int>(classNames.size());
        classNames.push_back(kv.first);
    }
    std::vector<int> trainY;
    trainY.reserve(split.train.size());
    for (size_t r : split.train) trainY.push_back(classIndex.at(y.textAt(r)));
    std::vector<std::string> testLabels;
    testLabels.reserve(split.test.size());
    for (size_t r : split.test) testLabels.push_back(y.textAt(r));

    if (verbose) {
        for (const auto& candidate : candidates) {
            std::cout << "[Augur][Modelling] Training: " << candidate.name << "\n";
        }
    }

    std::vector<CandidateResult> results(candidates.size());
    std::vector<std::exception_ptr> failures(candidates.size());
    const long count = static_cast<long>(candidates.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long i = 0; i < count; ++i) {
        const size_t idx = static_cast<size_t>(i);
        try {
            std::unique_ptr<Classifier> model = candidates[idx].make();
            model->fit(trainX, trainY, classNames.size());
            const std::vector<int> predicted = model->predict(testX);

            CandidateResult res;
            res.yTrue = testLabels;
            res.yPred.reserve(predicted.size());
            for (int p : predicted) res.yPred.push_back(classNames[static_cast<size_t>(p)]);
            res.metrics = ClassificationMetrics::score(candidates[idx].name, res.yTrue, res.yPred);
            results[idx] = std::move(res);
        } catch (...) {
            failures[idx] = std::current_exception();
        }
    }

    for (size_t i = 0; i < failures.size(); ++i) {
        if (!failures[i]) continue;
        try {
            std::rethrow_exception(failures[i]);
        } catch (const Augur::ModelException&) {
            throw;
        } catch (const std::exception& e) {
            throw Augur::ModelException(candidates[i].name + " failed to fit: " + e.what());
        }
    }

    rank(results);

    RankedResults out;
    out.ranked = std::move(results);
    out.trainRows = split.train.size();
    out.testRows = split.test.size();
    out.stratified = split.stratified;
    return out;
}
