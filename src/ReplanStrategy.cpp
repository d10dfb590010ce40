#include "AgentPolicies.h"

ReplanOutcome AppendingReplanStrategy::apply(const Plan& plan,
                                             const DatasetProfile& profile,
                                             const Reflection& /*reflection*/) const {
    ReplanOutcome out{plan, profile};
    out.profile.notes.push_back("Replan: adjusting strategy after reflection.");
    out.plan.push_back(PlanTasks::kReplanAttempt);
    return out;
}
