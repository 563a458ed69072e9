/**
 * @file allocation_engine.hpp
 * @brief Lease-based resource allocation: the single allocate/release path.
 *
 * Every mutation of a resource's allocation state goes through one mutex
 * in this class, so two concurrently running stages can never hold
 * conflicting leases on the same resource (leases per resource never
 * exceed its capacity). The engine receives its registry and policy
 * explicitly; there is no process-wide scheduler state.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/policy.hpp"
#include "scheduler/resource.hpp"
#include "workflow/stage.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Time-bounded exclusive binding of a stage to a resource.
 */
struct ResourceAllocation {
    uint64_t lease_id = 0;
    JobId job;
    StageId stage;
    ResourceId resource;
    SteadyTime start;
    SteadyTime estimated_end;
    SteadyTime hard_deadline;
    std::vector<uint32_t> qubit_mapping;    ///< logical → physical qubit
    bool running = false;                   ///< dispatch confirmed
    bool expired = false;                   ///< hard deadline passed while running
};

class AllocationEngine {
public:
    AllocationEngine(ResourceRegistry& registry,
                     std::unique_ptr<ISchedulingPolicy> policy,
                     Logger& logger,
                     Duration lease_timeout = std::chrono::minutes{10});

    AllocationEngine(const AllocationEngine&) = delete;
    AllocationEngine& operator=(const AllocationEngine&) = delete;

    /**
     * @brief Choose a resource for `stage` and take a lease on it.
     *
     * Fatal errors mean no registered resource can ever host the stage;
     * transient errors mean every feasible resource is busy or unsuitable
     * right now.
     */
    Result<ResourceAllocation, SelectionError> select_resource(
        const JobId& job, const Stage& stage,
        SteadyTime now = std::chrono::steady_clock::now());

    /**
     * @brief Confirm a lease immediately before dispatch.
     *
     * If the leased resource has become unavailable, the lease is released
     * and selection re-runs over the remaining candidates; leases already
     * confirmed by other stages are left untouched and still count against
     * capacity. A confirmed lease is returned unchanged.
     */
    Result<ResourceAllocation, SelectionError> confirm(
        uint64_t lease_id, const Stage& stage,
        SteadyTime now = std::chrono::steady_clock::now());

    /// Release a lease. Idempotent: unknown or already released leases return false.
    bool release(uint64_t lease_id);

    /**
     * @brief Handle leases whose hard deadline has passed.
     *
     * Unconfirmed leases are released. A confirmed lease still has a stage
     * on the resource, so it is only flagged expired and keeps counting
     * against capacity until its holder releases it. Each lease is reported
     * once.
     */
    std::vector<ResourceAllocation> expire_leases(SteadyTime now = std::chrono::steady_clock::now());

    /// Feed an execution outcome back into the resource's success rate.
    void record_outcome(const ResourceId& resource, bool success, double smoothing);

    [[nodiscard]] std::vector<ResourceAllocation> active_allocations() const;
    [[nodiscard]] std::optional<ResourceAllocation> allocation(uint64_t lease_id) const;
    [[nodiscard]] uint32_t in_use(const ResourceId& resource) const;

    [[nodiscard]] ResourceRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const ISchedulingPolicy& policy() const noexcept { return *policy_; }

private:
    Result<ResourceAllocation, SelectionError> select_locked(
        const JobId& job, const Stage& stage, SteadyTime now,
        const std::optional<ResourceId>& excluded);
    void release_locked(std::map<uint64_t, ResourceAllocation>::iterator it);

    ResourceRegistry& registry_;
    std::unique_ptr<ISchedulingPolicy> policy_;
    Logger& logger_;
    Duration lease_timeout_;

    mutable std::mutex mutex_;
    std::map<uint64_t, ResourceAllocation> leases_;
    std::unordered_map<ResourceId, uint32_t> in_use_;
    uint64_t next_lease_ = 1;
};

}  // namespace hybrid_orchestrator
