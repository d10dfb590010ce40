#include "AugurExceptions.h"
#include "Classifier.h"
#include "DatasetProfiler.h"
#include "GradientBoosting.h"
#include "KNeighbors.h"
#include "LogisticRegression.h"
#include "Preprocessor.h"
#include "RandomForest.h"

#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <numeric>

namespace {
// Two blobs around (+2, +2) and (-2, -2), interleaved by row.
void makeBlobs(size_t n, Matrix& X, std::vector<int>& y) {
    X.clear();
    y.clear();
    for (size_t i = 0; i < n; ++i) {
        const int label = static_cast<int>(i % 2);
        const double centre = label == 0 ? 2.0 : -2.0;
        const double jitter = static_cast<double>(i % 5) * 0.1;
        X.push_back({centre + jitter, centre - jitter});
        y.push_back(label);
    }
}

double accuracy(const std::vector<int>& a, const std::vector<int>& b) {
    size_t hit = 0;
    for (size_t i = 0; i < a.size(); ++i) hit += (a[i] == b[i]) ? 1 : 0;
    return static_cast<double>(hit) / static_cast<double>(a.size());
}
} // namespace

TEST(Preprocessor, ImputesScalesAndOneHotEncodes) {
    const TypedDataset data = TypedDataset::fromRows({"n", "c", "t"}, {
        {"1", "red", "a"}, {"3", "blue", "b"}, {"", "red", "a"}, {"5", "", "b"}, {"9", "green", "a"}
    });
    const DatasetProfile profile = DatasetProfiler::profileDataset(data, "t");
    Preprocessor prep(Preprocessor::buildSpec(profile));

    const std::vector<size_t> trainRows = {0, 1, 2, 3};
    prep.fit(data, trainRows);
    // One numeric column and the training vocabulary {blue, red}.
    EXPECT_EQ(prep.outputWidth(), 3u);

    const Matrix X = prep.transform(data, {0, 1, 2, 3, 4});
    ASSERT_EQ(X.size(), 5u);

    // Median of {1, 3, 5} is 3 so the imputed column is {1, 3, 3, 5}: mean 3.
    EXPECT_NEAR(X[2][0], 0.0, 1e-12);
    EXPECT_LT(X[0][0], 0.0);
    EXPECT_GT(X[3][0], 0.0);

    EXPECT_DOUBLE_EQ(X[0][2], 1.0);   // red
    EXPECT_DOUBLE_EQ(X[1][1], 1.0);   // blue
    EXPECT_DOUBLE_EQ(X[3][2], 1.0);   // missing colour imputed with the mode (red)
    EXPECT_DOUBLE_EQ(X[4][1] + X[4][2], 0.0);   // green was never seen
}

TEST(Preprocessor, TransformBeforeFitIsAModelError) {
    const TypedDataset data = TypedDataset::fromRows({"n", "t"}, {{"1", "a"}, {"2", "b"}});
    Preprocessor prep(PreprocessingSpec{{"n"}, {}});
    EXPECT_THROW(prep.transform(data, {0}), Augur::ModelException);
}

TEST(Preprocessor, WrongColumnTypeIsADatasetError) {
    const TypedDataset data = TypedDataset::fromRows({"n", "t"}, {{"x", "a"}, {"y", "b"}});
    Preprocessor prep(PreprocessingSpec{{"n"}, {}});
    EXPECT_THROW(prep.fit(data, {0, 1}), Augur::DatasetException);
}

TEST(ClassWeights, BalancedWeightsInverseToFrequency) {
    const std::vector<double> w = ClassWeights::balanced({0, 0, 0, 1}, 3);
    EXPECT_DOUBLE_EQ(w[0], 4.0 / (2.0 * 3.0));
    EXPECT_DOUBLE_EQ(w[1], 2.0);
    EXPECT_DOUBLE_EQ(w[2], 0.0);
}

TEST(DummyMostFrequent, PredictsMajorityWithLowestIndexOnTies) {
    DummyMostFrequent model;
    model.fit({{0.0}, {0.0}, {0.0}, {0.0}}, {1, 0, 1, 0}, 2);
    EXPECT_EQ(model.predict({{5.0}}), std::vector<int>({0}));
    model.fit({{0.0}, {0.0}, {0.0}}, {1, 1, 0}, 2);
    EXPECT_EQ(model.predict({{5.0}, {1.0}}), std::vector<int>({1, 1}));
}

TEST(Candidates, EveryModelSeparatesTwoBlobs) {
    Matrix X;
    std::vector<int> y;
    makeBlobs(80, X, y);

    std::vector<std::unique_ptr<Classifier>> models;
    models.push_back(std::make_unique<LogisticRegression>());
    models.push_back(std::make_unique<LogisticRegression>(true));
    models.push_back(std::make_unique<RandomForest>(25, 3u));
    models.push_back(std::make_unique<GradientBoosting>(20, 0.1, 3, 3u));
    models.push_back(std::make_unique<KNeighbors>(5));

    for (auto& model : models) {
        model->fit(X, y, 2);
        EXPECT_GE(accuracy(model->predict(X), y), 0.95) << model->name();
    }
}

TEST(Candidates, SeededModelsAreDeterministic) {
    Matrix X;
    std::vector<int> y;
    makeBlobs(60, X, y);
    // Add label noise so the trees have something to disagree about.
    y[3] = 0;
    y[10] = 1;

    RandomForest a(15, 99u), b(15, 99u);
    a.fit(X, y, 2);
    b.fit(X, y, 2);
    EXPECT_EQ(a.predict(X), b.predict(X));

    GradientBoosting g1(10, 0.2, 2, 5u), g2(10, 0.2, 2, 5u);
    g1.fit(X, y, 2);
    g2.fit(X, y, 2);
    EXPECT_EQ(g1.predict(X), g2.predict(X));
}

TEST(Candidates, LogisticProbabilitiesSumToOne) {
    Matrix X;
    std::vector<int> y;
    makeBlobs(40, X, y);
    for (size_t i = 0; i < X.size(); i += 4) y[i] = 2;

    LogisticRegression model;
    model.fit(X, y, 3);
    const std::vector<double> p = model.predictProba(X[0]);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_NEAR(std::accumulate(p.begin(), p.end(), 0.0), 1.0, 1e-9);
}

TEST(Candidates, InconsistentInputsAreModelErrors) {
    KNeighbors knn(3);
    EXPECT_THROW(knn.predict({{1.0}}), Augur::ModelException);
    EXPECT_THROW(knn.fit({{1.0}}, {0, 1}, 2), Augur::ModelException);
    EXPECT_THROW(RandomForest(0, 1u), Augur::ModelException);
}
