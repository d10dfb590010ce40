#pragma once
#include "AgentConfig.h"
#include "AgentPolicies.h"
#include "MemoryStore.h"

#include <memory>
#include <string>
#include <vector>

enum class RunStage { INIT, PROFILED, PLANNED, TRAINING, EVALUATED, REFLECTED, REPLAN, DONE };

const char* runStageName(RunStage stage);

/**
 * What the last run() did: visited stages in order, loop counts and the plan each iteration used.
 */
struct RunTrace {
    std::vector<RunStage> stages;
    size_t iterations = 0;
    int replans = 0;
    std::vector<Plan> plans;
    std::string outputDir;
    std::string fingerprint;
    std::string target;
};

/**
 * Drives one run: profile, plan, then train/evaluate/reflect until the reflector is satisfied
 * or the replan budget is spent. Artifacts of the latest iteration are rewritten in place each
 * iteration and the memory record is upserted every iteration. Nothing is rolled back on failure.
 */
class RunOrchestrator {
public:
    RunOrchestrator(MemoryStore& memory,
                    std::unique_ptr<Planner> planner,
                    std::unique_ptr<Reflector> reflector,
                    std::unique_ptr<ReplanStrategy> replanStrategy,
                    PlotConfig plot = {},
                    bool verbose = true);

    /**
     * @brief Builds an orchestrator with the rule-based default policies.
     */
    static RunOrchestrator withDefaultPolicies(MemoryStore& memory, PlotConfig plot = {}, bool verbose = true);

    /**
     * @brief Executes one run and returns its output directory.
     * @pre 0 < testFraction < 1, maxReplans >= 0, seed >= 0.
     * @throws Augur::ConfigurationException when a precondition fails.
     * @throws Augur::IOException when the output directory or an artifact cannot be written.
     * @throws Augur::DatasetException when the data cannot be loaded or the target column is absent.
     * @throws Augur::PlanningException when "auto" finds no target or a policy breaks its contract.
     * @throws Augur::ModelException when a candidate fails to fit.
     */
    std::string run(const std::string& dataPath,
                    const std::string& targetOrAuto,
                    const std::string& outputRoot,
                    int seed,
                    double testFraction,
                    int maxReplans);

    const RunTrace& lastTrace() const noexcept { return trace_; }

private:
    MemoryStore& memory_;
    std::unique_ptr<Planner> planner_;
    std::unique_ptr<Reflector> reflector_;
    std::unique_ptr<ReplanStrategy> replanStrategy_;
    PlotConfig plot_;
    bool verbose_;
    RunTrace trace_;

    void enter(RunStage stage);
    void log(const std::string& stage, const std::string& message) const;
};
