#include "RunReport.h"
#include "ArtifactJson.h"
#include "CommonUtils.h"

#include <algorithm>
#include <filesystem>

namespace RunReport {

std::string shortList(const std::vector<std::string>& names, size_t n) {
    std::vector<std::string> head(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(std::min(n, names.size())));
    std::string out = CommonUtils::join(head, ", ");
    if (names.size() > n) out += " ...";
    return out;
}

ReportEngine build(const RunContext& ctx,
                   const std::string& fingerprint,
                   const DatasetProfile& profile,
                   const Plan& plan,
                   const EvaluationPayload& payload,
                   const Reflection& reflection) {
    ReportEngine report;
    report.addTitle("Augur Run Report");
    report.addParagraph("**Run ID:** `" + ctx.runId() + "`  \n"
                        "**Started (UTC):** " + ctx.startedAt() + "  \n"
                        "**Dataset:** `" + ctx.dataPath() + "`  \n"
                        "**Target:** `" + ctx.target() + "`  \n"
                        "**Fingerprint:** `" + fingerprint + "`");

    report.addHeading("Dataset Profile");
    report.addBulletList({
        "Rows: **" + std::to_string(profile.shape.rows) + "**",
        "Columns: **" + std::to_string(profile.shape.cols) + "**",
        std::string("Classification: **") + (profile.isClassification ? "True" : "False") + "**",
        "Imbalance ratio: **" + CommonUtils::toFixed(profile.imbalanceRatio, 3) + "**",
    });
    report.addParagraph("**Feature Types**");
    report.addBulletList({
        "Numeric (" + std::to_string(profile.featureTypes.numeric.size()) + "): " + shortList(profile.featureTypes.numeric),
        "Categorical (" + std::to_string(profile.featureTypes.categorical.size()) + "): " + shortList(profile.featureTypes.categorical),
    });
    report.addParagraph("**Notes**");
    report.addBulletList(profile.notes);

    report.addHeading("Plan");
    report.addBulletList(plan);

    const ModelMetrics& best = payload.bestMetrics;
    report.addHeading("Results (Best Model)");
    report.addParagraph("**Model:** `" + best.model + "`");
    report.addBulletList({
        "Accuracy: **" + CommonUtils::toFixed(best.accuracy, 3) + "**",
        "Balanced accuracy: **" + CommonUtils::toFixed(best.balancedAccuracy, 3) + "**",
        "Macro F1: **" + CommonUtils::toFixed(best.f1Macro, 3) + "**",
        "Macro Precision: **" + CommonUtils::toFixed(best.precisionMacro, 3) + "**",
        "Macro Recall: **" + CommonUtils::toFixed(best.recallMacro, 3) + "**",
    });

    std::vector<std::vector<std::string>> rows;
    Json::Value all(Json::arrayValue);
    for (size_t i = 0; i < payload.allMetrics.size(); ++i) {
        const ModelMetrics& m = payload.allMetrics[i];
        rows.push_back({std::to_string(i + 1), m.model,
                        CommonUtils::toFixed(m.accuracy, 3), CommonUtils::toFixed(m.balancedAccuracy, 3),
                        CommonUtils::toFixed(m.f1Macro, 3), CommonUtils::toFixed(m.precisionMacro, 3),
                        CommonUtils::toFixed(m.recallMacro, 3)});
        all.append(ArtifactJson::toJson(m));
    }
    report.addTable("All candidates (ranked)",
                    {"Rank", "Model", "Accuracy", "Balanced acc.", "Macro F1", "Macro precision", "Macro recall"},
                    rows);
    report.addParagraph("Top metrics (all candidates):");
    report.addCodeBlock("json", ArtifactJson::toString(all));

    std::vector<std::string> cmHeaders = {"true \\ predicted"};
    cmHeaders.insert(cmHeaders.end(), payload.confusion.labels.begin(), payload.confusion.labels.end());
    std::vector<std::vector<std::string>> cmRows;
    for (size_t r = 0; r < payload.confusion.labels.size(); ++r) {
        std::vector<std::string> row = {payload.confusion.labels[r]};
        for (size_t v : payload.confusion.counts[r]) row.push_back(std::to_string(v));
        cmRows.push_back(std::move(row));
    }
    report.addTable("Confusion matrix (" + best.model + ")", cmHeaders, cmRows);
    report.addParagraph("Classification report:");
    report.addCodeBlock("", payload.classificationReport);

    report.addHeading("Reflection");
    report.addParagraph("Status: **" + reflection.status + "**");
    report.addParagraph("**Issues**");
    report.addBulletList(reflection.issues);
    report.addParagraph("**Suggestions**");
    report.addBulletList(reflection.suggestions);

    report.addTitle("Artefacts");
    report.addBulletList({"Confusion matrix: " + payload.confusionMatrixPath});
    const std::string ext = std::filesystem::path(payload.confusionMatrixPath).extension().string();
    if (ext == ".png" || ext == ".svg") {
        report.addImage("Confusion matrix (" + best.model + ")", payload.confusionMatrixPath);
    }
    return report;
}

} // namespace RunReport
