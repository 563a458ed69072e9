/**
 * @file allocation_engine.cpp
 * @brief AllocationEngine implementation.
 */

#include "scheduler/allocation_engine.hpp"

#include <algorithm>
#include <numeric>

namespace hybrid_orchestrator {

namespace {

constexpr std::string_view kComponent = "scheduler";

}  // anonymous namespace

AllocationEngine::AllocationEngine(ResourceRegistry& registry,
                                   std::unique_ptr<ISchedulingPolicy> policy,
                                   Logger& logger,
                                   Duration lease_timeout)
    : registry_(registry)
    , policy_(policy ? std::move(policy) : std::make_unique<FirstFitPolicy>())
    , logger_(logger)
    , lease_timeout_(lease_timeout) {}

Result<ResourceAllocation, SelectionError> AllocationEngine::select_resource(
    const JobId& job, const Stage& stage, SteadyTime now) {
    std::lock_guard lock(mutex_);
    return select_locked(job, stage, now, std::nullopt);
}

Result<ResourceAllocation, SelectionError> AllocationEngine::confirm(
    uint64_t lease_id, const Stage& stage, SteadyTime now) {
    std::lock_guard lock(mutex_);

    auto it = leases_.find(lease_id);
    if (it == leases_.end()) {
        return SelectionError{SelectionError::Kind::Transient, CauseCode::ResourceUnavailable,
                              "lease " + std::to_string(lease_id) + " is no longer held"};
    }
    if (it->second.running) return it->second;

    auto resource = registry_.get(it->second.resource);
    if (resource && resource->available) {
        it->second.running = true;
        return it->second;
    }

    // Leased resource went away before dispatch: reselect elsewhere
    auto job = it->second.job;
    auto lost = it->second.resource;
    release_locked(it);
    logger_.warn(kComponent, "resource " + lost + " became unavailable before dispatch of "
                 + job + "/" + stage.id + "; reselecting");

    auto replacement = select_locked(job, stage, now, lost);
    if (replacement) {
        leases_.at(replacement->lease_id).running = true;
        replacement->running = true;
    }
    return replacement;
}

bool AllocationEngine::release(uint64_t lease_id) {
    std::lock_guard lock(mutex_);
    auto it = leases_.find(lease_id);
    if (it == leases_.end()) return false;
    release_locked(it);
    return true;
}

std::vector<ResourceAllocation> AllocationEngine::expire_leases(SteadyTime now) {
    std::lock_guard lock(mutex_);
    std::vector<ResourceAllocation> expired;
    for (auto it = leases_.begin(); it != leases_.end();) {
        auto& lease = it->second;
        if (lease.expired || lease.hard_deadline > now) {
            ++it;
            continue;
        }

        logger_.warn(kComponent, "lease " + std::to_string(it->first) + " on " + lease.resource
                     + " for " + lease.job + "/" + lease.stage + " expired"
                     + (lease.running ? " while running" : ""));
        if (lease.running) {
            lease.expired = true;
            expired.push_back(lease);
            ++it;
        } else {
            expired.push_back(lease);
            auto next = std::next(it);
            release_locked(it);
            it = next;
        }
    }
    return expired;
}

void AllocationEngine::record_outcome(const ResourceId& resource, bool success, double smoothing) {
    registry_.record_outcome(resource, success, smoothing);
}

std::vector<ResourceAllocation> AllocationEngine::active_allocations() const {
    std::lock_guard lock(mutex_);
    std::vector<ResourceAllocation> out;
    out.reserve(leases_.size());
    for (const auto& [id, lease] : leases_) out.push_back(lease);
    return out;
}

std::optional<ResourceAllocation> AllocationEngine::allocation(uint64_t lease_id) const {
    std::lock_guard lock(mutex_);
    auto it = leases_.find(lease_id);
    if (it == leases_.end()) return std::nullopt;
    return it->second;
}

uint32_t AllocationEngine::in_use(const ResourceId& resource) const {
    std::lock_guard lock(mutex_);
    auto it = in_use_.find(resource);
    return it == in_use_.end() ? 0 : it->second;
}

// ─────────────────────────────────────────────
// Locked helpers
// ─────────────────────────────────────────────

Result<ResourceAllocation, SelectionError> AllocationEngine::select_locked(
    const JobId& job, const Stage& stage, SteadyTime now,
    const std::optional<ResourceId>& excluded) {
    auto candidates = registry_.snapshot();
    if (excluded) {
        std::erase_if(candidates, [&](const Resource& r) { return r.id == *excluded; });
    }

    std::vector<uint32_t> held(candidates.size(), 0);
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto it = in_use_.find(candidates[i].id);
        if (it != in_use_.end()) held[i] = it->second;
    }

    PolicyContext ctx{.now = std::chrono::system_clock::now()};
    auto chosen = select_candidate(stage, candidates, held, *policy_, ctx);
    if (!chosen) return chosen.error();

    const auto& resource = candidates[*chosen];
    auto estimated_end = now + stage.constraints.estimated_duration + resource.quality.estimated_wait;

    ResourceAllocation lease{
        .lease_id = next_lease_++,
        .job = job,
        .stage = stage.id,
        .resource = resource.id,
        .start = now,
        .estimated_end = estimated_end,
        .hard_deadline = estimated_end + lease_timeout_,
        .qubit_mapping = {},
        .running = false
    };
    lease.qubit_mapping.resize(stage.constraints.min_qubits);
    std::iota(lease.qubit_mapping.begin(), lease.qubit_mapping.end(), 0u);

    ++in_use_[resource.id];
    leases_.emplace(lease.lease_id, lease);

    logger_.debug(kComponent, "lease " + std::to_string(lease.lease_id) + ": " + job + "/"
                  + stage.id + " -> " + resource.id + " via " + std::string{policy_->name()});
    return lease;
}

void AllocationEngine::release_locked(std::map<uint64_t, ResourceAllocation>::iterator it) {
    auto held = in_use_.find(it->second.resource);
    if (held != in_use_.end() && held->second > 0) {
        if (--held->second == 0) in_use_.erase(held);
    }
    leases_.erase(it);
}

}  // namespace hybrid_orchestrator
