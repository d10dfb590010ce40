#include "AugurExceptions.h"
#include "ClassificationMetrics.h"
#include "Evaluator.h"
#include "TrainingEngine.h"

#include <gtest/gtest.h>

TEST(ClassificationMetrics, PerfectPredictionScoresOne) {
    const std::vector<std::string> y = {"a", "b", "a", "c"};
    const ModelMetrics m = ClassificationMetrics::score("m", y, y);
    EXPECT_DOUBLE_EQ(m.accuracy, 1.0);
    EXPECT_DOUBLE_EQ(m.balancedAccuracy, 1.0);
    EXPECT_DOUBLE_EQ(m.f1Macro, 1.0);
    EXPECT_DOUBLE_EQ(m.precisionMacro, 1.0);
    EXPECT_DOUBLE_EQ(m.recallMacro, 1.0);
}

TEST(ClassificationMetrics, MajorityPredictorOnImbalancedLabels) {
    std::vector<std::string> yTrue(9, "0");
    yTrue.push_back("1");
    const std::vector<std::string> yPred(10, "0");
    const ModelMetrics m = ClassificationMetrics::score("DummyMostFrequent", yTrue, yPred);

    EXPECT_DOUBLE_EQ(m.accuracy, 0.9);
    EXPECT_DOUBLE_EQ(m.balancedAccuracy, 0.5);
    // Class "1" is never predicted, so its precision and F1 count as zero.
    EXPECT_DOUBLE_EQ(m.precisionMacro, 0.45);
    EXPECT_DOUBLE_EQ(m.recallMacro, 0.5);
    EXPECT_NEAR(m.f1Macro, (2.0 * 0.9 / 1.9) / 2.0, 1e-12);
}

TEST(ClassificationMetrics, LabelsAreSortedUnionOfTrueAndPredicted) {
    const ConfusionMatrix cm = ClassificationMetrics::confusionMatrix({"b", "a", "b"}, {"b", "c", "a"});
    EXPECT_EQ(cm.labels, std::vector<std::string>({"a", "b", "c"}));
    EXPECT_EQ(cm.counts[0][2], 1u);   // true a, predicted c
    EXPECT_EQ(cm.counts[1][1], 1u);
    EXPECT_EQ(cm.counts[1][0], 1u);
    EXPECT_EQ(cm.counts[2][0] + cm.counts[2][1] + cm.counts[2][2], 0u);

    // "c" has no true instances, so balanced accuracy averages recall over a and b only.
    const ModelMetrics m = ClassificationMetrics::score("m", {"b", "a", "b"}, {"b", "c", "a"});
    EXPECT_DOUBLE_EQ(m.balancedAccuracy, 0.25);
}

TEST(ClassificationMetrics, EmptyInputIsAModelError) {
    EXPECT_THROW(ClassificationMetrics::score("m", {}, {}), Augur::ModelException);
    EXPECT_THROW(ClassificationMetrics::confusionMatrix({"a"}, {}), Augur::ModelException);
}

TEST(ClassificationMetrics, ReportListsClassesAndSummaryRows) {
    const std::string report = ClassificationMetrics::classificationReport({"x", "y", "y"}, {"x", "y", "x"});
    EXPECT_NE(report.find("precision"), std::string::npos);
    EXPECT_NE(report.find("macro avg"), std::string::npos);
    EXPECT_NE(report.find("weighted avg"), std::string::npos);
    EXPECT_NE(report.find("accuracy"), std::string::npos);
}

TEST(ClassificationMetrics, DeclaresFiveMetricNames) {
    EXPECT_EQ(ClassificationMetrics::kMetricNames.size(), 5u);
}

TEST(Ranking, OrdersByBalancedAccuracyThenMacroF1) {
    auto make = [](const std::string& name, double bal, double f1) {
        CandidateResult r;
        r.metrics.model = name;
        r.metrics.balancedAccuracy = bal;
        r.metrics.f1Macro = f1;
        return r;
    };
    std::vector<CandidateResult> results = {
        make("first", 0.70, 0.60), make("second", 0.80, 0.50), make("third", 0.70, 0.65), make("fourth", 0.70, 0.60)
    };
    TrainingEngine::rank(results);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].metrics.model, "second");
    EXPECT_EQ(results[1].metrics.model, "third");
    EXPECT_EQ(results[2].metrics.model, "first");   // stable on full ties
    EXPECT_EQ(results[3].metrics.model, "fourth");
}

TEST(ConfusionText, RendersHeaderAndRows) {
    const ConfusionMatrix cm = ClassificationMetrics::confusionMatrix({"0", "1", "1"}, {"0", "1", "0"});
    const std::string text = Evaluator::renderConfusionText(cm);
    EXPECT_NE(text.find("0"), std::string::npos);
    EXPECT_NE(text.find("1"), std::string::npos);
    EXPECT_FALSE(text.empty());
}
