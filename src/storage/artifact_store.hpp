/**
 * @file artifact_store.hpp
 * @brief Storage collaborator interface and its two implementations.
 *
 * All artifacts of a job live under one per-job namespace:
 *
 *   <job>/stages/<stage>/<kind>.bin        stage outputs, diagnostics
 *   <job>/<kind>.bin                       job-level diagnostics (empty stage)
 *   <job>/checkpoints/<seq>_<stage>.ckpt   checkpoint records
 *   <job>/record.bin                       persisted job record
 *
 * An ArtifactRef is the namespace-relative key; it is opaque to callers.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hybrid_orchestrator {

class IArtifactStore {
public:
    virtual ~IArtifactStore() = default;

    virtual Result<ArtifactRef> persist(const JobId& job, const StageId& stage,
                                        std::string_view kind, const Bytes& bytes) = 0;
    virtual Result<Bytes> retrieve(const ArtifactRef& ref) = 0;

    /// `sequence` orders checkpoints of one job; listing returns ascending order.
    virtual Result<ArtifactRef> checkpoint_write(const JobId& job, const StageId& stage,
                                                 uint64_t sequence, const Bytes& bytes) = 0;
    virtual Result<Bytes> checkpoint_read(const ArtifactRef& ref) = 0;
    virtual Result<std::vector<ArtifactRef>> checkpoint_list(const JobId& job) = 0;

    virtual Result<void> put_job_record(const JobId& job, const Bytes& bytes) = 0;
    virtual Result<Bytes> get_job_record(const JobId& job) = 0;

    /// False when no record was ever written; errors only on storage failure.
    virtual Result<bool> has_job_record(const JobId& job) = 0;
};

// ─────────────────────────────────────────────
// Key Layout
// ─────────────────────────────────────────────

/// Rejects empty segments and segments containing '/', '\' or "..".
[[nodiscard]] Result<void> validate_segment(std::string_view what, std::string_view segment);

[[nodiscard]] Result<ArtifactRef> artifact_key(const JobId& job, const StageId& stage,
                                               std::string_view kind);
[[nodiscard]] Result<ArtifactRef> checkpoint_key(const JobId& job, const StageId& stage,
                                                 uint64_t sequence);
[[nodiscard]] Result<ArtifactRef> job_record_key(const JobId& job);

/// Rejects absolute refs and refs containing "..".
[[nodiscard]] Result<void> validate_ref(const ArtifactRef& ref);

// ─────────────────────────────────────────────
// MemoryArtifactStore
// ─────────────────────────────────────────────

/**
 * @brief In-process store; the default backend and the test double.
 */
class MemoryArtifactStore : public IArtifactStore {
public:
    Result<ArtifactRef> persist(const JobId& job, const StageId& stage,
                                std::string_view kind, const Bytes& bytes) override;
    Result<Bytes> retrieve(const ArtifactRef& ref) override;

    Result<ArtifactRef> checkpoint_write(const JobId& job, const StageId& stage,
                                         uint64_t sequence, const Bytes& bytes) override;
    Result<Bytes> checkpoint_read(const ArtifactRef& ref) override;
    Result<std::vector<ArtifactRef>> checkpoint_list(const JobId& job) override;

    Result<void> put_job_record(const JobId& job, const Bytes& bytes) override;
    Result<Bytes> get_job_record(const JobId& job) override;
    Result<bool> has_job_record(const JobId& job) override;

    [[nodiscard]] size_t size() const;

private:
    Result<Bytes> read_key(const ArtifactRef& ref) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bytes> objects_;
};

// ─────────────────────────────────────────────
// LocalArtifactStore
// ─────────────────────────────────────────────

/**
 * @brief Filesystem store rooted at a directory.
 *
 * Writes go to a temporary file that is renamed into place, so a reader
 * never observes a partially written artifact.
 */
class LocalArtifactStore : public IArtifactStore {
public:
    explicit LocalArtifactStore(std::filesystem::path root);

    Result<ArtifactRef> persist(const JobId& job, const StageId& stage,
                                std::string_view kind, const Bytes& bytes) override;
    Result<Bytes> retrieve(const ArtifactRef& ref) override;

    Result<ArtifactRef> checkpoint_write(const JobId& job, const StageId& stage,
                                         uint64_t sequence, const Bytes& bytes) override;
    Result<Bytes> checkpoint_read(const ArtifactRef& ref) override;
    Result<std::vector<ArtifactRef>> checkpoint_list(const JobId& job) override;

    Result<void> put_job_record(const JobId& job, const Bytes& bytes) override;
    Result<Bytes> get_job_record(const JobId& job) override;
    Result<bool> has_job_record(const JobId& job) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<void> write_atomic(const ArtifactRef& ref, const Bytes& bytes);
    Result<Bytes> read_file(const ArtifactRef& ref) const;

    std::filesystem::path root_;
    std::mutex write_mutex_;
};

}  // namespace hybrid_orchestrator
