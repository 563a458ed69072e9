/**
 * @file types.hpp
 * @brief Fundamental types used throughout HybridOrchestrator.
 *
 * Defines identity types, clocks, the stage data model (Datum) and the
 * stable cause codes reported to callers. All types use value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using StageId = std::string;
using ResourceId = std::string;
using ArtifactRef = std::string;     ///< Opaque handle issued by the storage collaborator
using Bytes = std::vector<uint8_t>;

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Stage Data
// ─────────────────────────────────────────────

/// Measurement histogram: bitstring → occurrences.
using Counts = std::map<std::string, uint64_t>;

/// Classical parameter vector (e.g. variational angles, expectation values).
using Parameters = std::vector<double>;

/**
 * @brief A value flowing along a workflow edge.
 *
 * Compiled circuits travel as text payloads, quantum results as Counts,
 * classical results as Parameters.
 */
using Datum = std::variant<Counts, Parameters, std::string>;

/// Named outputs produced by one stage.
using StageOutputs = std::map<std::string, Datum>;

[[nodiscard]] constexpr std::string_view datum_type_name(const Datum& d) noexcept {
    switch (d.index()) {
        case 0: return "counts";
        case 1: return "parameters";
        case 2: return "payload";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Cause Codes
// ─────────────────────────────────────────────

/**
 * @brief Stable, externally visible reason for a failed, cancelled or
 *        timed-out job (or a failed stage attempt).
 */
enum class CauseCode : uint8_t {
    None,
    ValidationFailed,
    NoCandidate,
    RetriesExhausted,
    UnsupportedFormat,
    ResourceUnavailable,
    ResourceBusy,
    DeadlineExceeded,
    MalformedPayload,
    CollaboratorUnavailable,
    Cancelled,
    Timeout,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(CauseCode code) noexcept {
    switch (code) {
        case CauseCode::None:                    return "NONE";
        case CauseCode::ValidationFailed:        return "VALIDATION_FAILED";
        case CauseCode::NoCandidate:             return "NO_CANDIDATE";
        case CauseCode::RetriesExhausted:        return "RETRIES_EXHAUSTED";
        case CauseCode::UnsupportedFormat:       return "UNSUPPORTED_FORMAT";
        case CauseCode::ResourceUnavailable:     return "RESOURCE_UNAVAILABLE";
        case CauseCode::ResourceBusy:            return "RESOURCE_BUSY";
        case CauseCode::DeadlineExceeded:        return "DEADLINE_EXCEEDED";
        case CauseCode::MalformedPayload:        return "MALFORMED_PAYLOAD";
        case CauseCode::CollaboratorUnavailable: return "COLLABORATOR_UNAVAILABLE";
        case CauseCode::Cancelled:               return "CANCELLED";
        case CauseCode::Timeout:                 return "TIMEOUT";
        case CauseCode::Internal:                return "INTERNAL";
    }
    return "UNKNOWN";
}

}  // namespace hybrid_orchestrator
