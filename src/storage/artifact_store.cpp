/**
 * @file artifact_store.cpp
 * @brief Key layout, MemoryArtifactStore and LocalArtifactStore.
 */

#include "storage/artifact_store.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace hybrid_orchestrator {

namespace {

constexpr std::string_view kCheckpointDir = "/checkpoints/";
constexpr std::string_view kCheckpointExt = ".ckpt";

bool has_suffix(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

Error checkpoint_ref_error(const ArtifactRef& ref) {
    return Error{"not a checkpoint reference: " + ref};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Key Layout
// ─────────────────────────────────────────────

Result<void> validate_segment(std::string_view what, std::string_view segment) {
    if (segment.empty()) {
        return Error{std::string{what} + " must not be empty"};
    }
    if (segment.find_first_of("/\\") != std::string_view::npos
        || segment.find("..") != std::string_view::npos) {
        return Error{std::string{what} + " '" + std::string{segment}
                     + "' must not contain '/', '\\' or '..'"};
    }
    return {};
}

Result<ArtifactRef> artifact_key(const JobId& job, const StageId& stage, std::string_view kind) {
    if (auto ok = validate_segment("job id", job); !ok) return ok.error();
    if (auto ok = validate_segment("artifact kind", kind); !ok) return ok.error();
    if (stage.empty()) {
        return std::format("{}/{}.bin", job, kind);
    }
    if (auto ok = validate_segment("stage id", stage); !ok) return ok.error();
    return std::format("{}/stages/{}/{}.bin", job, stage, kind);
}

Result<ArtifactRef> checkpoint_key(const JobId& job, const StageId& stage, uint64_t sequence) {
    if (auto ok = validate_segment("job id", job); !ok) return ok.error();
    if (auto ok = validate_segment("stage id", stage); !ok) return ok.error();
    // Zero-padded so lexical order equals sequence order
    return std::format("{}/checkpoints/{:020}_{}.ckpt", job, sequence, stage);
}

Result<ArtifactRef> job_record_key(const JobId& job) {
    if (auto ok = validate_segment("job id", job); !ok) return ok.error();
    return job + "/record.bin";
}

Result<void> validate_ref(const ArtifactRef& ref) {
    if (ref.empty() || ref.front() == '/' || ref.find('\\') != std::string::npos
        || ref.find("..") != std::string::npos) {
        return Error{"invalid artifact reference: '" + ref + "'"};
    }
    return {};
}

// ─────────────────────────────────────────────
// MemoryArtifactStore
// ─────────────────────────────────────────────

Result<ArtifactRef> MemoryArtifactStore::persist(const JobId& job, const StageId& stage,
                                                 std::string_view kind, const Bytes& bytes) {
    auto key = artifact_key(job, stage, kind);
    if (!key) return key;
    std::lock_guard lock(mutex_);
    objects_[*key] = bytes;
    return key;
}

Result<Bytes> MemoryArtifactStore::retrieve(const ArtifactRef& ref) {
    return read_key(ref);
}

Result<ArtifactRef> MemoryArtifactStore::checkpoint_write(const JobId& job, const StageId& stage,
                                                          uint64_t sequence, const Bytes& bytes) {
    auto key = checkpoint_key(job, stage, sequence);
    if (!key) return key;
    std::lock_guard lock(mutex_);
    objects_[*key] = bytes;
    return key;
}

Result<Bytes> MemoryArtifactStore::checkpoint_read(const ArtifactRef& ref) {
    if (!has_suffix(ref, kCheckpointExt)) return checkpoint_ref_error(ref);
    return read_key(ref);
}

Result<std::vector<ArtifactRef>> MemoryArtifactStore::checkpoint_list(const JobId& job) {
    if (auto ok = validate_segment("job id", job); !ok) return ok.error();
    const std::string prefix = job + std::string{kCheckpointDir};

    std::vector<ArtifactRef> refs;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, _] : objects_) {
            if (key.starts_with(prefix) && has_suffix(key, kCheckpointExt)) refs.push_back(key);
        }
    }
    std::sort(refs.begin(), refs.end());
    return refs;
}

Result<void> MemoryArtifactStore::put_job_record(const JobId& job, const Bytes& bytes) {
    auto key = job_record_key(job);
    if (!key) return key.error();
    std::lock_guard lock(mutex_);
    objects_[*key] = bytes;
    return {};
}

Result<Bytes> MemoryArtifactStore::get_job_record(const JobId& job) {
    auto key = job_record_key(job);
    if (!key) return key.error();
    return read_key(*key);
}

Result<bool> MemoryArtifactStore::has_job_record(const JobId& job) {
    auto key = job_record_key(job);
    if (!key) return key.error();
    std::lock_guard lock(mutex_);
    return objects_.contains(*key);
}

size_t MemoryArtifactStore::size() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

Result<Bytes> MemoryArtifactStore::read_key(const ArtifactRef& ref) const {
    if (auto ok = validate_ref(ref); !ok) return ok.error();
    std::lock_guard lock(mutex_);
    auto it = objects_.find(ref);
    if (it == objects_.end()) return Error{"artifact not found: " + ref};
    return it->second;
}

// ─────────────────────────────────────────────
// LocalArtifactStore
// ─────────────────────────────────────────────

LocalArtifactStore::LocalArtifactStore(std::filesystem::path root)
    : root_(std::move(root)) {}

Result<ArtifactRef> LocalArtifactStore::persist(const JobId& job, const StageId& stage,
                                                std::string_view kind, const Bytes& bytes) {
    auto key = artifact_key(job, stage, kind);
    if (!key) return key;
    if (auto written = write_atomic(*key, bytes); !written) return written.error();
    return key;
}

Result<Bytes> LocalArtifactStore::retrieve(const ArtifactRef& ref) {
    return read_file(ref);
}

Result<ArtifactRef> LocalArtifactStore::checkpoint_write(const JobId& job, const StageId& stage,
                                                         uint64_t sequence, const Bytes& bytes) {
    auto key = checkpoint_key(job, stage, sequence);
    if (!key) return key;
    if (auto written = write_atomic(*key, bytes); !written) return written.error();
    return key;
}

Result<Bytes> LocalArtifactStore::checkpoint_read(const ArtifactRef& ref) {
    if (!has_suffix(ref, kCheckpointExt)) return checkpoint_ref_error(ref);
    return read_file(ref);
}

Result<std::vector<ArtifactRef>> LocalArtifactStore::checkpoint_list(const JobId& job) {
    if (auto ok = validate_segment("job id", job); !ok) return ok.error();

    std::vector<ArtifactRef> refs;
    const auto dir = root_ / job / "checkpoints";
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return refs;

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (entry.is_regular_file(ec) && has_suffix(name, kCheckpointExt)) {
            refs.push_back(job + std::string{kCheckpointDir} + name);
        }
    }
    if (ec) return Error{"cannot list " + dir.string() + ": " + ec.message()};

    std::sort(refs.begin(), refs.end());
    return refs;
}

Result<void> LocalArtifactStore::put_job_record(const JobId& job, const Bytes& bytes) {
    auto key = job_record_key(job);
    if (!key) return key.error();
    return write_atomic(*key, bytes);
}

Result<Bytes> LocalArtifactStore::get_job_record(const JobId& job) {
    auto key = job_record_key(job);
    if (!key) return key.error();
    return read_file(*key);
}

Result<bool> LocalArtifactStore::has_job_record(const JobId& job) {
    auto key = job_record_key(job);
    if (!key) return key.error();

    std::error_code ec;
    const bool found = std::filesystem::exists(root_ / *key, ec);
    if (ec) return Error{"cannot stat " + (root_ / *key).string() + ": " + ec.message()};
    return found;
}

Result<void> LocalArtifactStore::write_atomic(const ArtifactRef& ref, const Bytes& bytes) {
    const auto target = root_ / ref;
    auto tmp = target;
    tmp += ".tmp";

    std::lock_guard lock(write_mutex_);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) return Error{"cannot create " + target.parent_path().string() + ": " + ec.message()};

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return Error{"cannot open " + tmp.string() + " for writing"};
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) return Error{"short write to " + tmp.string()};
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        return Error{"cannot rename into " + target.string() + ": " + reason};
    }
    return {};
}

Result<Bytes> LocalArtifactStore::read_file(const ArtifactRef& ref) const {
    if (auto ok = validate_ref(ref); !ok) return ok.error();

    const auto path = root_ / ref;
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{"artifact not found: " + ref};

    Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return Error{"read error on " + path.string()};
    return bytes;
}

}  // namespace hybrid_orchestrator
