#include "ArtifactJson.h"
#include "AugurExceptions.h"
#include "GnuplotEngine.h"
#include "ReportEngine.h"
#include "RunReport.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

namespace {
DatasetProfile sampleProfile() {
    DatasetProfile p;
    p.shape = {200, 2};
    p.columns = {"feature", "target"};
    p.target = "target";
    p.targetDtype = "numeric";
    p.isClassification = true;
    p.featureTypes.numeric = {"feature"};
    p.missingPct = {{"feature", 0.0}, {"target", 0.0}};
    p.uniqueByColumn = {{"feature", 7}, {"target", 2}};
    p.classCounts = std::map<std::string, size_t>{{"0", 180}, {"1", 20}};
    p.imbalanceRatio = 9.0;
    p.notes = {"Imbalance detected (ratio >= 3.0): prioritise macro metrics / balanced accuracy."};
    return p;
}

EvaluationPayload samplePayload() {
    EvaluationPayload payload;
    payload.bestMetrics.model = "RandomForest";
    payload.bestMetrics.f1Macro = 0.5;
    payload.allMetrics = {payload.bestMetrics};
    payload.confusion = ClassificationMetrics::confusionMatrix({"0", "1"}, {"0", "0"});
    payload.classificationReport = ClassificationMetrics::classificationReport({"0", "1"}, {"0", "0"});
    payload.confusionMatrixPath = "/tmp/run/confusion_matrix.txt";
    return payload;
}
} // namespace

TEST(ArtifactJson, ProfileCarriesEveryDocumentedKey) {
    const Json::Value v = ArtifactJson::toJson(sampleProfile());
    for (const char* key : {"shape", "columns", "missing_pct", "target", "target_dtype", "is_classification",
                            "feature_types", "n_unique_by_col", "notes", "class_counts", "imbalance_ratio"}) {
        EXPECT_TRUE(v.isMember(key)) << key;
    }
    EXPECT_EQ(v["shape"]["rows"].asUInt64(), 200u);
    EXPECT_EQ(v["class_counts"]["1"].asUInt64(), 20u);
    EXPECT_DOUBLE_EQ(v["imbalance_ratio"].asDouble(), 9.0);
}

TEST(ArtifactJson, RegressionProfileHasNullClassCounts) {
    DatasetProfile p = sampleProfile();
    p.classCounts.reset();
    EXPECT_TRUE(ArtifactJson::toJson(p)["class_counts"].isNull());
}

TEST(ArtifactJson, MetricsExposeFiveMetricNames) {
    const Json::Value v = ArtifactJson::toJson(samplePayload());
    for (const auto& name : ClassificationMetrics::kMetricNames) {
        EXPECT_TRUE(v["best_metrics"].isMember(name)) << name;
    }
    EXPECT_EQ(v["all_metrics"].size(), 1u);
    EXPECT_EQ(v["confusion_matrix"]["counts"][1][0].asUInt64(), 1u);
    EXPECT_EQ(ArtifactJson::planToJson({"a", "b"})["plan"].size(), 2u);
}

TEST(ArtifactJson, DecodersRejectWrongShapes) {
    Json::Value bad(Json::objectValue);
    bad["model"] = "x";
    bad["accuracy"] = "high";
    EXPECT_THROW(ArtifactJson::metricsFromJson(bad), Augur::DatasetException);
    EXPECT_THROW(ArtifactJson::memoryRecordFromJson(Json::Value(3)), Augur::DatasetException);
    EXPECT_THROW(ArtifactJson::memoryNoteFromJson(Json::Value(Json::arrayValue)), Augur::DatasetException);
}

TEST(ArtifactJson, ReadRejectsInvalidJson) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("broken.json");
    TestSupport::writeTextFile(path, "[1, 2");
    EXPECT_THROW(ArtifactJson::readJsonFile(path), Augur::DatasetException);
    EXPECT_THROW(ArtifactJson::readJsonFile(dir.file("absent.json")), Augur::IOException);
}

TEST(ReportEngine, TablesEscapePipesAndNewlines) {
    ReportEngine report;
    report.addTable("T", {"a|b", "c"}, {{"x\ny", "z"}});
    EXPECT_NE(report.markdown().find("a\\|b"), std::string::npos);
    EXPECT_NE(report.markdown().find("x<br>y"), std::string::npos);
}

TEST(ReportEngine, EmptyBulletListShowsPlaceholder) {
    ReportEngine report;
    report.addBulletList({});
    EXPECT_EQ(report.markdown(), "- (none)\n\n");
}

TEST(ReportEngine, SaveRewritesAbsoluteImageLinksRelativeToReport) {
    TestSupport::ScopedTempDir dir;
    ReportEngine report;
    report.addImage("cm", (dir.path() / "confusion_matrix.png").string());
    const std::string path = dir.file("report.md");
    report.save(path);
    EXPECT_NE(TestSupport::readTextFile(path).find("![cm](confusion_matrix.png)"), std::string::npos);
}

TEST(GnuplotEngine, HeatmapScriptIsSelfContained) {
    ConfusionMatrix cm;
    cm.labels = {"cat", "it's"};
    cm.counts = {{5, 1}, {0, 3}};
    PlotConfig cfg;
    cfg.format = "svg";
    cfg.width = 640;
    cfg.height = 480;

    const std::string script = GnuplotEngine::heatmapScript(cm, "Confusion", "/tmp/run/cm.svg", cfg);
    for (const char* needle : {"set terminal svg size 640,480", "set output '/tmp/run/cm.svg'",
                               "set cbrange [0:5]", "set xrange [-0.5:1.5]", "'it''s' 1",
                               "$counts << EOD\n0 1 5\n1 1 1\n0 0 0\n1 0 3\nEOD\n", "plot $counts"}) {
        EXPECT_NE(script.find(needle), std::string::npos) << needle;
    }
    EXPECT_EQ(script.find(".dat"), std::string::npos);
}

TEST(RunReport, ContainsEverySection) {
    RunContext ctx("20240501_123000_deadbeef", "2024-05-01T12:30:00Z", "data.csv", "target", "/tmp/run", 42, 0.2, 1);
    Reflection reflection;
    reflection.status = "needs_attention";
    reflection.issues = {"Macro F1 score is modest (<0.60)."};

    const std::string md = RunReport::build(ctx, "fp_123", sampleProfile(), {"profile_dataset", "train_models"},
                                            samplePayload(), reflection).markdown();
    for (const char* needle : {"# Augur Run Report", "20240501_123000_deadbeef", "fp_123", "## Dataset Profile",
                               "Imbalance ratio: **9.000**", "## Plan", "- train_models", "## Results (Best Model)",
                               "Macro F1: **0.500**", "All candidates (ranked)", "```json",
                               "Confusion matrix (RandomForest)", "macro avg", "## Reflection",
                               "needs_attention", "# Artefacts", "confusion_matrix.txt"}) {
        EXPECT_NE(md.find(needle), std::string::npos) << needle;
    }
}

TEST(RunReport, ShortListTruncatesAfterLimit) {
    EXPECT_EQ(RunReport::shortList({"a", "b", "c"}, 2), "a, b ...");
    EXPECT_EQ(RunReport::shortList({"a", "b"}, 2), "a, b");
}
