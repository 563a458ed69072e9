/**
 * @file resource.cpp
 * @brief Resource helpers and ResourceRegistry.
 */

#include "scheduler/resource.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace hybrid_orchestrator {

bool Resource::supports_format(const std::string& format) const {
    if (format.empty() || formats.empty()) return true;
    return std::find(formats.begin(), formats.end(), format) != formats.end();
}

bool Resource::has_coupling(uint32_t a, uint32_t b) const {
    if (a >= qubits || b >= qubits || a == b) return false;
    if (coupling.empty()) return true;
    return std::any_of(coupling.begin(), coupling.end(), [&](const auto& edge) {
        return (edge.first == a && edge.second == b) || (edge.first == b && edge.second == a);
    });
}

Resource Resource::from_config(const ResourceConfig& cfg, Timestamp now) {
    auto age = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(cfg.calibration_age_s));
    return Resource{
        .id = cfg.id,
        .qubits = cfg.qubits,
        .coupling = cfg.coupling,
        .formats = cfg.formats,
        .capacity = cfg.capacity,
        .quality = ResourceQuality{
            .queue_depth = cfg.queue_depth,
            .last_calibration = now - age,
            .success_rate = cfg.success_rate,
            .two_qubit_error = cfg.two_qubit_error,
            .estimated_wait = std::chrono::milliseconds{static_cast<int64_t>(cfg.estimated_wait_ms)}
        },
        .available = true
    };
}

// ─────────────────────────────────────────────
// ResourceRegistry
// ─────────────────────────────────────────────

Result<void> ResourceRegistry::add(Resource resource) {
    std::unique_lock lock(mutex_);
    if (find(resource.id)) {
        return Error{"resource already registered: " + resource.id};
    }
    resources_.push_back(std::move(resource));
    return {};
}

bool ResourceRegistry::remove(const ResourceId& id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const Resource& r) { return r.id == id; });
    if (it == resources_.end()) return false;
    resources_.erase(it);
    return true;
}

bool ResourceRegistry::set_available(const ResourceId& id, bool available) {
    std::unique_lock lock(mutex_);
    auto* r = find(id);
    if (!r) return false;
    r->available = available;
    return true;
}

bool ResourceRegistry::update_quality(const ResourceId& id, const ResourceQuality& quality) {
    std::unique_lock lock(mutex_);
    auto* r = find(id);
    if (!r) return false;
    r->quality = quality;
    return true;
}

bool ResourceRegistry::record_outcome(const ResourceId& id, bool success, double smoothing) {
    std::unique_lock lock(mutex_);
    auto* r = find(id);
    if (!r) return false;
    double alpha = std::clamp(smoothing, 0.0, 1.0);
    double sample = success ? 1.0 : 0.0;
    r->quality.success_rate = alpha * sample + (1.0 - alpha) * r->quality.success_rate;
    return true;
}

std::optional<Resource> ResourceRegistry::get(const ResourceId& id) const {
    std::shared_lock lock(mutex_);
    for (const auto& r : resources_) {
        if (r.id == id) return r;
    }
    return std::nullopt;
}

std::vector<Resource> ResourceRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return resources_;
}

size_t ResourceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return resources_.size();
}

Resource* ResourceRegistry::find(const ResourceId& id) {
    for (auto& r : resources_) {
        if (r.id == id) return &r;
    }
    return nullptr;
}

}  // namespace hybrid_orchestrator
