/**
 * @file collaborators.hpp
 * @brief Interfaces of the external compiler and backend-execution
 *        collaborators, and the classification of their failures.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// Dispatch Errors
// ─────────────────────────────────────────────

enum class DispatchCause : uint8_t {
    UnsupportedFormat,
    ResourceUnavailable,
    ResourceBusy,
    DeadlineExceeded,
    MalformedPayload,
    CollaboratorUnreachable,
    CapacityExhausted,
    Cancelled,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(DispatchCause cause) noexcept {
    switch (cause) {
        case DispatchCause::UnsupportedFormat:       return "unsupported_format";
        case DispatchCause::ResourceUnavailable:     return "resource_unavailable";
        case DispatchCause::ResourceBusy:            return "resource_busy";
        case DispatchCause::DeadlineExceeded:        return "deadline_exceeded";
        case DispatchCause::MalformedPayload:        return "malformed_payload";
        case DispatchCause::CollaboratorUnreachable: return "collaborator_unreachable";
        case DispatchCause::CapacityExhausted:       return "capacity_exhausted";
        case DispatchCause::Cancelled:               return "cancelled";
        case DispatchCause::Internal:                return "internal";
    }
    return "unknown";
}

/// Transient causes are retried per the stage retry policy; the rest fail the stage.
[[nodiscard]] constexpr bool is_transient(DispatchCause cause) noexcept {
    switch (cause) {
        case DispatchCause::ResourceUnavailable:
        case DispatchCause::ResourceBusy:
        case DispatchCause::DeadlineExceeded:
        case DispatchCause::CollaboratorUnreachable:
        case DispatchCause::CapacityExhausted:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr CauseCode to_cause_code(DispatchCause cause) noexcept {
    switch (cause) {
        case DispatchCause::UnsupportedFormat:       return CauseCode::UnsupportedFormat;
        case DispatchCause::ResourceUnavailable:     return CauseCode::ResourceUnavailable;
        case DispatchCause::ResourceBusy:            return CauseCode::ResourceBusy;
        case DispatchCause::DeadlineExceeded:        return CauseCode::DeadlineExceeded;
        case DispatchCause::MalformedPayload:        return CauseCode::MalformedPayload;
        case DispatchCause::CollaboratorUnreachable:
        case DispatchCause::CapacityExhausted:       return CauseCode::CollaboratorUnavailable;
        case DispatchCause::Cancelled:               return CauseCode::Cancelled;
        case DispatchCause::Internal:                return CauseCode::Internal;
    }
    return CauseCode::Internal;
}

struct DispatchError {
    DispatchCause cause;
    std::string message;
};

// ─────────────────────────────────────────────
// Compiler
// ─────────────────────────────────────────────

struct CompileRequest {
    std::string source;
    std::string target_format;
    std::map<std::string, std::string> options;
};

struct CompileOutput {
    std::string payload;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Front-end compiler. Must be deterministic for identical requests.
 */
class ICompiler {
public:
    virtual ~ICompiler() = default;
    virtual Result<CompileOutput, DispatchError> compile(const CompileRequest& request) = 0;
};

// ─────────────────────────────────────────────
// Backend Execution
// ─────────────────────────────────────────────

struct ExecutionRequest {
    JobId job;
    StageId stage;
    uint32_t attempt = 0;
    std::string payload;
    ResourceId resource;
    uint32_t shots = 0;
    std::map<std::string, std::string> options;
};

struct ExecutionOutput {
    Counts counts;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Circuit execution on a concrete resource.
 *
 * The stop token is a best-effort cancellation signal; implementations
 * may ignore it and run to completion.
 */
class IBackendExecutor {
public:
    virtual ~IBackendExecutor() = default;
    virtual Result<ExecutionOutput, DispatchError> execute(const ExecutionRequest& request,
                                                           std::stop_token stop) = 0;
};

}  // namespace hybrid_orchestrator
