#include "RunContext.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <cstdint>
#include <cstdio>
#include <random>

RunContext::RunContext(std::string runId,
                       std::string startedAt,
                       std::string dataPath,
                       std::string target,
                       std::string outputDir,
                       int seed,
                       double testFraction,
                       int maxReplans)
    : runId_(std::move(runId)),
      startedAt_(std::move(startedAt)),
      dataPath_(std::move(dataPath)),
      target_(std::move(target)),
      outputDir_(std::move(outputDir)),
      seed_(seed),
      testFraction_(testFraction),
      maxReplans_(maxReplans) {}

void RunContext::bindInferredTarget(const std::string& target) {
    if (frozen_) throw Augur::PlanningException("Run context is frozen; target can no longer change");
    if (targetRebound_) throw Augur::PlanningException("Target was already bound for run " + runId_);
    target_ = target;
    targetRebound_ = true;
}

std::string RunContext::generateRunId() {
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist;
    char suffix[9];
    std::snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(dist(rd)));
    return CommonUtils::nowCompactUtc() + "_" + suffix;
}
