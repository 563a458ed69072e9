/**
 * @file job.cpp
 * @brief Job → JobRecord projection.
 */

#include "lifecycle/job.hpp"

namespace hybrid_orchestrator {

JobRecord Job::record() const {
    JobRecord rec{
        .id = id,
        .workflow = graph ? graph->name() : std::string{},
        .fingerprint = graph ? graph->fingerprint() : 0,
        .priority = priority,
        .state = lifecycle.state(),
        .transitions = lifecycle.history(),
        .stages = {},
        .checkpoints = checkpoints
    };

    rec.stages.reserve(stages.size());
    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& rt = stages[i];
        rec.stages.push_back(StageRecord{
            .id = graph ? graph->stage(i).id : StageId{},
            .phase = rt.phase,
            .attempts = rt.attempts,
            .resource = rt.resource,
            .checkpoint_ref = rt.checkpoint_ref,
            .last_cause = rt.last_cause,
            .outputs = rt.outputs
        });
    }
    return rec;
}

}  // namespace hybrid_orchestrator
