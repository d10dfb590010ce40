#include "RunOrchestrator.h"
#include "ArtifactJson.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"
#include "DatasetProfiler.h"
#include "Evaluator.h"
#include "Preprocessor.h"
#include "RunContext.h"
#include "RunReport.h"
#include "TrainingEngine.h"
#include "TypedDataset.h"

#include <filesystem>
#include <iostream>

namespace {
void checkReplanOutcome(const ReplanOutcome& outcome, const Plan& plan, const DatasetProfile& profile) {
    if (!PlanTasks::isExtensionOf(outcome.plan, plan)) {
        throw Augur::PlanningException("Replan strategy dropped or reordered existing plan entries");
    }
    if (!PlanTasks::respectsStageOrder(outcome.plan)) {
        throw Augur::PlanningException("Replanned plan violates stage order");
    }
    if (!PlanTasks::isExtensionOf(outcome.profile.notes, profile.notes)) {
        throw Augur::PlanningException("Replan strategy dropped existing profile notes");
    }
    if (outcome.profile.target != profile.target) {
        throw Augur::PlanningException("Replan strategy changed the target column");
    }
    try {
        outcome.profile.validate();
    } catch (const Augur::DatasetException& ex) {
        throw Augur::PlanningException(std::string("Replanned profile is invalid: ") + ex.what());
    }
}

std::string planText(const Plan& plan) {
    return "[" + CommonUtils::join(plan, ", ") + "]";
}
} // namespace

const char* runStageName(RunStage stage) {
    switch (stage) {
        case RunStage::INIT: return "INIT";
        case RunStage::PROFILED: return "PROFILED";
        case RunStage::PLANNED: return "PLANNED";
        case RunStage::TRAINING: return "TRAINING";
        case RunStage::EVALUATED: return "EVALUATED";
        case RunStage::REFLECTED: return "REFLECTED";
        case RunStage::REPLAN: return "REPLAN";
        case RunStage::DONE: return "DONE";
    }
    return "UNKNOWN";
}

RunOrchestrator::RunOrchestrator(MemoryStore& memory,
                                 std::unique_ptr<Planner> planner,
                                 std::unique_ptr<Reflector> reflector,
                                 std::unique_ptr<ReplanStrategy> replanStrategy,
                                 PlotConfig plot,
                                 bool verbose)
    : memory_(memory),
      planner_(std::move(planner)),
      reflector_(std::move(reflector)),
      replanStrategy_(std::move(replanStrategy)),
      plot_(std::move(plot)),
      verbose_(verbose) {
    if (!planner_ || !reflector_ || !replanStrategy_) {
        throw Augur::ConfigurationException("RunOrchestrator requires a planner, a reflector and a replan strategy");
    }
}

RunOrchestrator RunOrchestrator::withDefaultPolicies(MemoryStore& memory, PlotConfig plot, bool verbose) {
    return RunOrchestrator(memory,
                           std::make_unique<RuleBasedPlanner>(),
                           std::make_unique<ThresholdReflector>(),
                           std::make_unique<AppendingReplanStrategy>(),
                           std::move(plot),
                           verbose);
}

void RunOrchestrator::enter(RunStage stage) {
    trace_.stages.push_back(stage);
}

void RunOrchestrator::log(const std::string& stage, const std::string& message) const {
    if (!verbose_) return;
    std::cout << "[Augur][" << stage << "] " << message << "\n";
}

std::string RunOrchestrator::run(const std::string& dataPath,
                                 const std::string& targetOrAuto,
                                 const std::string& outputRoot,
                                 int seed,
                                 double testFraction,
                                 int maxReplans) {
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw Augur::ConfigurationException("test fraction must be strictly between 0 and 1");
    }
    if (maxReplans < 0) throw Augur::ConfigurationException("max replans must be >= 0");
    if (seed < 0) throw Augur::ConfigurationException("seed must be >= 0");

    trace_ = RunTrace{};
    enter(RunStage::INIT);

    const std::string runId = RunContext::generateRunId();
    const std::filesystem::path outDir = std::filesystem::path(outputRoot) / runId;
    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec || !std::filesystem::is_directory(outDir)) {
        throw Augur::IOException("Cannot create output directory " + outDir.string() +
                                 (ec ? ": " + ec.message() : std::string()));
    }
    RunContext ctx(runId, CommonUtils::nowIsoUtc(), dataPath, targetOrAuto, outDir.string(),
                   seed, testFraction, maxReplans);
    trace_.outputDir = ctx.outputDir();
    log("Run", "Run " + ctx.runId() + " writing to " + ctx.outputDir());

    TypedDataset data(dataPath);
    data.load();
    log("Data", "Loaded " + std::to_string(data.rowCount()) + " rows x " + std::to_string(data.colCount()) + " columns");

    if (CommonUtils::toLower(CommonUtils::trim(targetOrAuto)) == "auto") {
        const auto inferred = DatasetProfiler::inferTargetColumn(data);
        if (!inferred) {
            throw Augur::PlanningException("cannot infer target column; pass --target <name>");
        }
        ctx.bindInferredTarget(*inferred);
        log("Target", "Inferred target: " + ctx.target());
    }
    trace_.target = ctx.target();

    DatasetProfile profile = DatasetProfiler::profileDataset(data, ctx.target());
    const std::string fingerprint = DatasetProfiler::datasetFingerprint(data, ctx.target());
    trace_.fingerprint = fingerprint;
    enter(RunStage::PROFILED);

    const std::optional<MemoryRecord> hint = memory_.get(fingerprint);
    if (hint) log("Memory", "Memory hit: previously best=" + hint->bestModel + " for fp=" + fingerprint);

    Plan plan = planner_->createPlan(profile, hint);
    if (!PlanTasks::respectsStageOrder(plan)) {
        throw Augur::PlanningException("Planner returned a plan that violates stage order: " + planText(plan));
    }
    enter(RunStage::PLANNED);
    log("Plan", "Plan: " + planText(plan));

    ctx.freeze();
    const Evaluator evaluator(plot_);
    const uint32_t modelSeed = static_cast<uint32_t>(ctx.seed());

    while (true) {
        enter(RunStage::TRAINING);
        ++trace_.iterations;
        trace_.plans.push_back(plan);

        const PreprocessingSpec spec = Preprocessor::buildSpec(profile);
        const std::vector<CandidateSpec> candidates = TrainingEngine::selectCandidates(profile, modelSeed);
        std::vector<std::string> names;
        for (const auto& c : candidates) names.push_back(c.name);
        log("Modelling", "Candidate models: " + planText(names));

        const RankedResults results = TrainingEngine::train(data, ctx.target(), spec, candidates, modelSeed,
                                                            ctx.testFraction(), verbose_);
        const EvaluationPayload payload = evaluator.evaluate(results, ctx.outputDir(), verbose_);
        enter(RunStage::EVALUATED);

        const Reflection reflection = reflector_->reflect(profile, payload.bestMetrics, payload.allMetrics);
        enter(RunStage::REFLECTED);
        log("Reflect", "Status: " + reflection.status + ", replan recommended: " +
                       (reflection.replanRecommended ? "yes" : "no"));

        const std::filesystem::path dir(ctx.outputDir());
        ArtifactJson::writeJsonFile((dir / "eda_summary.json").string(), ArtifactJson::toJson(profile));
        ArtifactJson::writeJsonFile((dir / "plan.json").string(), ArtifactJson::planToJson(plan));
        ArtifactJson::writeJsonFile((dir / "metrics.json").string(), ArtifactJson::toJson(payload));
        ArtifactJson::writeJsonFile((dir / "reflection.json").string(), ArtifactJson::toJson(reflection));
        RunReport::build(ctx, fingerprint, profile, plan, payload, reflection).save((dir / "report.md").string());

        MemoryRecord record;
        record.lastSeen = CommonUtils::nowIsoUtc();
        record.target = ctx.target();
        record.shape = profile.shape;
        record.bestModel = payload.bestMetrics.model;
        record.bestMetrics = payload.bestMetrics;
        memory_.upsert(fingerprint, record);

        if (!reflector_->shouldReplan(reflection)) break;
        if (trace_.replans >= ctx.maxReplans()) {
            log("Replan", "Replan suggested, but max_replans reached. Stopping.");
            break;
        }

        ++trace_.replans;
        enter(RunStage::REPLAN);
        ReplanOutcome outcome = replanStrategy_->apply(plan, profile, reflection);
        checkReplanOutcome(outcome, plan, profile);
        plan = std::move(outcome.plan);
        profile = std::move(outcome.profile);
        log("Replan", "Replanning (attempt " + std::to_string(trace_.replans) + "): " + planText(plan));
    }

    enter(RunStage::DONE);
    log("Run", "Done. Outputs in: " + ctx.outputDir());
    return ctx.outputDir();
}
