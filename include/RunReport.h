#pragma once
#include "AgentPolicies.h"
#include "DatasetProfiler.h"
#include "Evaluator.h"
#include "ReportEngine.h"
#include "RunContext.h"

#include <string>
#include <vector>

namespace RunReport {

/**
 * @brief Comma-joined preview of at most n names, suffixed with " ..." when truncated.
 */
std::string shortList(const std::vector<std::string>& names, size_t n = 12);

ReportEngine build(const RunContext& ctx,
                   const std::string& fingerprint,
                   const DatasetProfile& profile,
                   const Plan& plan,
                   const EvaluationPayload& payload,
                   const Reflection& reflection);

} // namespace RunReport
