/**
 * @file resource.hpp
 * @brief Execution resources and the thread-safe candidate registry.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Time-varying soft signals of a resource.
 */
struct ResourceQuality {
    uint32_t queue_depth = 0;           ///< jobs queued at the backend itself
    Timestamp last_calibration{};
    double success_rate = 1.0;          ///< EWMA of observed execution outcomes
    double two_qubit_error = 0.0;
    Duration estimated_wait{0};
};

struct Resource {
    ResourceId id;
    uint32_t qubits = 0;
    std::vector<std::pair<uint32_t, uint32_t>> coupling;   ///< empty = all-to-all
    std::vector<std::string> formats;                       ///< empty = any format
    uint32_t capacity = 1;                                  ///< concurrent leases
    ResourceQuality quality;
    bool available = true;

    [[nodiscard]] bool supports_format(const std::string& format) const;
    [[nodiscard]] bool has_coupling(uint32_t a, uint32_t b) const;

    [[nodiscard]] static Resource from_config(const ResourceConfig& cfg, Timestamp now);
};

/**
 * @brief Registry of candidate resources.
 *
 * Updated by operators and execution feedback, read by the allocation
 * engine. Thread-safe via shared_mutex. Snapshots preserve registration
 * order, which is the final tie-breaker of every policy.
 */
class ResourceRegistry {
public:
    Result<void> add(Resource resource);
    bool remove(const ResourceId& id);

    bool set_available(const ResourceId& id, bool available);
    bool update_quality(const ResourceId& id, const ResourceQuality& quality);

    /// Fold one execution outcome into the success-rate EWMA.
    bool record_outcome(const ResourceId& id, bool success, double smoothing);

    [[nodiscard]] std::optional<Resource> get(const ResourceId& id) const;
    [[nodiscard]] std::vector<Resource> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    Resource* find(const ResourceId& id);

    mutable std::shared_mutex mutex_;
    std::vector<Resource> resources_;
};

}  // namespace hybrid_orchestrator
