/**
 * @file checkpoint_coordinator.cpp
 * @brief CheckpointCoordinator implementation.
 */

#include "recovery/checkpoint_coordinator.hpp"

#include "storage/record_codec.hpp"

#include <algorithm>
#include <chrono>

namespace hybrid_orchestrator {

namespace {

constexpr std::string_view kComponent = "checkpoint";

}  // anonymous namespace

size_t ResumePoint::completed_count() const noexcept {
    return static_cast<size_t>(std::count(completed.begin(), completed.end(), true));
}

CheckpointCoordinator::CheckpointCoordinator(IArtifactStore& store, Logger& logger)
    : store_(store)
    , logger_(logger) {}

Result<CheckpointRef> CheckpointCoordinator::checkpoint(
    const JobId& job,
    const WorkflowGraph& graph,
    const StageId& stage,
    uint32_t attempt,
    const std::map<std::string, StoredOutput>& outputs,
    CheckpointKind kind) {
    uint64_t sequence = 0;
    {
        std::lock_guard lock(mutex_);
        sequence = ++sequences_[job];
    }

    CheckpointRecord record{
        .job = job,
        .stage = stage,
        .attempt = attempt,
        .sequence = sequence,
        .kind = kind,
        .graph_fingerprint = graph.fingerprint(),
        .at = std::chrono::system_clock::now(),
        .outputs = kind == CheckpointKind::StageComplete ? outputs
                                                         : std::map<std::string, StoredOutput>{}
    };

    auto ref = store_.checkpoint_write(job, stage, sequence, RecordCodec::encode_checkpoint(record));
    if (!ref) {
        logger_.warn(kComponent, "checkpoint " + std::to_string(sequence) + " for " + job + "/"
                     + stage + " not persisted: " + ref.error().message);
        return ref.error();
    }

    logger_.debug(kComponent, "checkpoint " + std::to_string(sequence) + " for " + job + "/" + stage
                  + " -> " + *ref);
    return CheckpointRef{
        .ref = *ref,
        .stage = stage,
        .attempt = attempt,
        .sequence = sequence,
        .kind = kind
    };
}

Result<ResumePoint> CheckpointCoordinator::resume(const JobId& job, const WorkflowGraph& graph) {
    auto refs = store_.checkpoint_list(job);
    if (!refs) return refs.error();

    ResumePoint point;
    point.completed.assign(graph.stage_count(), false);

    std::vector<bool> verified(graph.stage_count(), false);
    std::vector<uint64_t> verified_seq(graph.stage_count(), 0);

    for (const auto& ref : *refs) {
        auto bytes = store_.checkpoint_read(ref);
        if (!bytes) {
            logger_.warn(kComponent, "unreadable checkpoint " + ref + ": " + bytes.error().message);
            ++point.rejected;
            continue;
        }
        auto record = RecordCodec::decode_checkpoint(*bytes);
        if (!record) {
            logger_.warn(kComponent, "corrupt checkpoint " + ref + ": " + record.error().message);
            ++point.rejected;
            continue;
        }

        auto index = graph.index_of(record->stage);
        if (record->job != job || record->graph_fingerprint != graph.fingerprint() || !index) {
            logger_.warn(kComponent, "checkpoint " + ref + " does not belong to this job graph");
            ++point.rejected;
            continue;
        }

        point.last_sequence = std::max(point.last_sequence, record->sequence);
        auto& spent = point.attempts[record->stage];
        spent = std::max(spent, record->attempt);
        point.checkpoints.push_back(CheckpointRef{
            .ref = ref,
            .stage = record->stage,
            .attempt = record->attempt,
            .sequence = record->sequence,
            .kind = record->kind
        });

        if (record->kind != CheckpointKind::StageComplete) continue;

        if (!verify_outputs(graph.stage(*index), record->outputs)) {
            logger_.warn(kComponent, "checkpoint " + ref + " failed output verification");
            ++point.rejected;
            continue;
        }
        verified[*index] = true;
        verified_seq[*index] = record->sequence;
        point.outputs[record->stage] = record->outputs;
    }

    // Dependency closure in topological order
    uint64_t latest_seq = 0;
    for (size_t index : graph.topological_order()) {
        if (!verified[index]) continue;
        const auto& deps = graph.dependencies(index);
        bool closed = std::all_of(deps.begin(), deps.end(),
                                  [&](size_t dep) { return point.completed[dep]; });
        if (!closed) {
            point.outputs.erase(graph.stage(index).id);
            continue;
        }
        point.completed[index] = true;
        if (verified_seq[index] >= latest_seq) {
            latest_seq = verified_seq[index];
            point.latest_stage = graph.stage(index).id;
        }
    }

    {
        std::lock_guard lock(mutex_);
        auto& seq = sequences_[job];
        seq = std::max(seq, point.last_sequence);
    }

    logger_.info(kComponent, "resume point for " + job + ": "
                 + std::to_string(point.completed_count()) + "/"
                 + std::to_string(graph.stage_count()) + " stages complete, "
                 + std::to_string(point.rejected) + " checkpoints rejected");
    return point;
}

uint64_t CheckpointCoordinator::last_sequence(const JobId& job) const {
    std::lock_guard lock(mutex_);
    auto it = sequences_.find(job);
    return it == sequences_.end() ? 0 : it->second;
}

void CheckpointCoordinator::forget(const JobId& job) {
    std::lock_guard lock(mutex_);
    sequences_.erase(job);
}

bool CheckpointCoordinator::verify_outputs(const Stage& stage,
                                           const std::map<std::string, StoredOutput>& outputs) {
    for (const auto& name : stage.outputs) {
        auto it = outputs.find(name);
        if (it == outputs.end()) return false;

        auto bytes = store_.retrieve(it->second.ref);
        if (!bytes || RecordCodec::checksum(*bytes) != it->second.checksum) return false;
    }
    return true;
}

}  // namespace hybrid_orchestrator
