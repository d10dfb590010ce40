#pragma once
#include <string>

/**
 * Identity and parameters of one run.
 * Every field is fixed at construction except the target, which may be bound once
 * (target inference) before training starts.
 */
class RunContext {
public:
    RunContext(std::string runId,
               std::string startedAt,
               std::string dataPath,
               std::string target,
               std::string outputDir,
               int seed,
               double testFraction,
               int maxReplans);

    const std::string& runId() const noexcept { return runId_; }
    const std::string& startedAt() const noexcept { return startedAt_; }
    const std::string& dataPath() const noexcept { return dataPath_; }
    const std::string& target() const noexcept { return target_; }
    const std::string& outputDir() const noexcept { return outputDir_; }
    int seed() const noexcept { return seed_; }
    double testFraction() const noexcept { return testFraction_; }
    int maxReplans() const noexcept { return maxReplans_; }

    /**
     * @brief Replaces the target once with an inferred name.
     * @throws Augur::PlanningException when already rebound or frozen.
     */
    void bindInferredTarget(const std::string& target);

    /**
     * @brief Marks the start of training; the context is read-only afterwards.
     */
    void freeze() noexcept { frozen_ = true; }
    bool frozen() const noexcept { return frozen_; }

    /**
     * @brief UTC timestamp plus a random 8-hex suffix, e.g. 20240501_123000_1a2b3c4d.
     */
    static std::string generateRunId();

private:
    std::string runId_;
    std::string startedAt_;
    std::string dataPath_;
    std::string target_;
    std::string outputDir_;
    int seed_;
    double testFraction_;
    int maxReplans_;
    bool targetRebound_ = false;
    bool frozen_ = false;
};
