/**
 * @file record_codec.cpp
 * @brief RecordCodec binary serialization.
 *
 * Datum:
 *   [1B tag: 0=counts, 1=parameters, 2=payload]
 *   counts:     [4B n] n × ([str bitstring][8B count])
 *   parameters: [4B n] n × [8B IEEE-754 bits]
 *   payload:    [str]
 *
 * Checkpoint record:
 *   [4B "HOCK"][1B version][str job][str stage][4B attempt][8B sequence]
 *   [1B kind][8B graph fingerprint][8B at_us][outputs]
 *
 * Job record:
 *   [4B "HOJR"][1B version][str id][str workflow][8B fingerprint][4B priority]
 *   [1B state][transitions][stages][checkpoints]
 *
 * where [str] = [4B len][bytes] and [outputs] = [4B n] n × ([str name][str ref][8B checksum]).
 */

#include "storage/record_codec.hpp"

#include "core/checksum.hpp"

#include <bit>
#include <chrono>
#include <optional>

namespace hybrid_orchestrator {

namespace {

constexpr uint32_t kCheckpointMagic = 0x484F434B;   // "HOCK"
constexpr uint32_t kJobRecordMagic = 0x484F4A52;    // "HOJR"
constexpr uint8_t kVersion = 1;

// ─────────────────────────────────────────────
// Encoding helpers
// ─────────────────────────────────────────────

void put_u8(Bytes& buf, uint8_t val) {
    buf.push_back(val);
}

void put_str(Bytes& buf, const std::string& s) {
    RecordCodec::put_u32(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

void put_time(Bytes& buf, Timestamp t) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
    RecordCodec::put_u64(buf, static_cast<uint64_t>(us));
}

void put_outputs(Bytes& buf, const std::map<std::string, StoredOutput>& outputs) {
    RecordCodec::put_u32(buf, static_cast<uint32_t>(outputs.size()));
    for (const auto& [name, out] : outputs) {
        put_str(buf, name);
        put_str(buf, out.ref);
        RecordCodec::put_u64(buf, out.checksum);
    }
}

// ─────────────────────────────────────────────
// Bounds-checked reader
// ─────────────────────────────────────────────

class Reader {
public:
    explicit Reader(const Bytes& data) : data_(data) {}

    std::optional<uint8_t> u8() {
        if (!has(1)) return std::nullopt;
        return data_[pos_++];
    }

    std::optional<uint32_t> u32() {
        if (!has(4)) return std::nullopt;
        auto v = RecordCodec::get_u32(data_.data() + pos_);
        pos_ += 4;
        return v;
    }

    std::optional<uint64_t> u64() {
        if (!has(8)) return std::nullopt;
        auto v = RecordCodec::get_u64(data_.data() + pos_);
        pos_ += 8;
        return v;
    }

    std::optional<std::string> str() {
        auto len = u32();
        if (!len || !has(*len)) return std::nullopt;
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), *len);
        pos_ += *len;
        return s;
    }

    std::optional<Timestamp> time() {
        auto us = u64();
        if (!us) return std::nullopt;
        return Timestamp{std::chrono::microseconds{static_cast<int64_t>(*us)}};
    }

    /// Enum stored as one byte, accepted only if <= max.
    template <typename Enum>
    std::optional<Enum> enumeration(Enum max) {
        auto v = u8();
        if (!v || *v > static_cast<uint8_t>(max)) return std::nullopt;
        return static_cast<Enum>(*v);
    }

    std::optional<std::map<std::string, StoredOutput>> outputs() {
        auto n = u32();
        if (!n) return std::nullopt;
        std::map<std::string, StoredOutput> out;
        for (uint32_t i = 0; i < *n; ++i) {
            auto name = str();
            auto ref = str();
            auto sum = u64();
            if (!name || !ref || !sum) return std::nullopt;
            out.emplace(std::move(*name), StoredOutput{std::move(*ref), *sum});
        }
        return out;
    }

    [[nodiscard]] bool at_end() const noexcept { return pos_ == data_.size(); }
    [[nodiscard]] bool has(size_t n) const noexcept { return data_.size() - pos_ >= n; }

private:

    const Bytes& data_;
    size_t pos_ = 0;
};

Error truncated(std::string_view what) {
    return Error{std::string{what} + ": truncated or malformed record"};
}

Result<void> check_header(Reader& r, uint32_t magic, std::string_view what) {
    auto m = r.u32();
    auto v = r.u8();
    if (!m || *m != magic) return Error{std::string{what} + ": bad magic"};
    if (!v || *v != kVersion) return Error{std::string{what} + ": unsupported version"};
    return {};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Big-endian primitives
// ─────────────────────────────────────────────

void RecordCodec::put_u64(Bytes& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void RecordCodec::put_u32(Bytes& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint64_t RecordCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t RecordCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

uint64_t RecordCodec::checksum(const Bytes& data) noexcept {
    return fnv1a_64(std::span<const uint8_t>{data});
}

// ─────────────────────────────────────────────
// Datum
// ─────────────────────────────────────────────

Bytes RecordCodec::encode_datum(const Datum& datum) {
    Bytes buf;
    put_u8(buf, static_cast<uint8_t>(datum.index()));

    if (const auto* counts = std::get_if<Counts>(&datum)) {
        put_u32(buf, static_cast<uint32_t>(counts->size()));
        for (const auto& [bits, n] : *counts) {
            put_str(buf, bits);
            put_u64(buf, n);
        }
    } else if (const auto* params = std::get_if<Parameters>(&datum)) {
        put_u32(buf, static_cast<uint32_t>(params->size()));
        for (double v : *params) {
            put_u64(buf, std::bit_cast<uint64_t>(v));
        }
    } else {
        put_str(buf, std::get<std::string>(datum));
    }
    return buf;
}

Result<Datum> RecordCodec::decode_datum(const Bytes& data) {
    Reader r(data);
    auto tag = r.u8();
    if (!tag) return truncated("datum");

    Datum datum;
    switch (*tag) {
        case 0: {
            auto n = r.u32();
            if (!n) return truncated("datum");
            Counts counts;
            for (uint32_t i = 0; i < *n; ++i) {
                auto bits = r.str();
                auto count = r.u64();
                if (!bits || !count) return truncated("datum");
                counts.emplace(std::move(*bits), *count);
            }
            datum = std::move(counts);
            break;
        }
        case 1: {
            auto n = r.u32();
            if (!n || !r.has(size_t{*n} * 8)) return truncated("datum");
            Parameters params;
            params.reserve(*n);
            for (uint32_t i = 0; i < *n; ++i) {
                auto bits = r.u64();
                if (!bits) return truncated("datum");
                params.push_back(std::bit_cast<double>(*bits));
            }
            datum = std::move(params);
            break;
        }
        case 2: {
            auto payload = r.str();
            if (!payload) return truncated("datum");
            datum = std::move(*payload);
            break;
        }
        default:
            return Error{"datum: unknown tag " + std::to_string(*tag)};
    }

    if (!r.at_end()) return truncated("datum");
    return datum;
}

// ─────────────────────────────────────────────
// Checkpoint Record
// ─────────────────────────────────────────────

Bytes RecordCodec::encode_checkpoint(const CheckpointRecord& record) {
    Bytes buf;
    put_u32(buf, kCheckpointMagic);
    put_u8(buf, kVersion);
    put_str(buf, record.job);
    put_str(buf, record.stage);
    put_u32(buf, record.attempt);
    put_u64(buf, record.sequence);
    put_u8(buf, static_cast<uint8_t>(record.kind));
    put_u64(buf, record.graph_fingerprint);
    put_time(buf, record.at);
    put_outputs(buf, record.outputs);
    return buf;
}

Result<CheckpointRecord> RecordCodec::decode_checkpoint(const Bytes& data) {
    Reader r(data);
    if (auto ok = check_header(r, kCheckpointMagic, "checkpoint"); !ok) return ok.error();

    auto job = r.str();
    auto stage = r.str();
    auto attempt = r.u32();
    auto sequence = r.u64();
    auto kind = r.enumeration(CheckpointKind::InFlight);
    auto fingerprint = r.u64();
    auto at = r.time();
    auto outputs = r.outputs();
    if (!job || !stage || !attempt || !sequence || !kind || !fingerprint || !at || !outputs
        || !r.at_end()) {
        return truncated("checkpoint");
    }

    return CheckpointRecord{
        .job = std::move(*job),
        .stage = std::move(*stage),
        .attempt = *attempt,
        .sequence = *sequence,
        .kind = *kind,
        .graph_fingerprint = *fingerprint,
        .at = *at,
        .outputs = std::move(*outputs)
    };
}

// ─────────────────────────────────────────────
// Job Record
// ─────────────────────────────────────────────

Bytes RecordCodec::encode_job_record(const JobRecord& record) {
    Bytes buf;
    put_u32(buf, kJobRecordMagic);
    put_u8(buf, kVersion);
    put_str(buf, record.id);
    put_str(buf, record.workflow);
    put_u64(buf, record.fingerprint);
    put_u32(buf, static_cast<uint32_t>(record.priority));
    put_u8(buf, static_cast<uint8_t>(record.state));

    put_u32(buf, static_cast<uint32_t>(record.transitions.size()));
    for (const auto& t : record.transitions) {
        put_u8(buf, static_cast<uint8_t>(t.from));
        put_u8(buf, static_cast<uint8_t>(t.to));
        put_u8(buf, static_cast<uint8_t>(t.event));
        put_time(buf, t.at);
        put_u8(buf, static_cast<uint8_t>(t.cause));
        put_str(buf, t.detail_ref);
        put_str(buf, t.stage);
    }

    put_u32(buf, static_cast<uint32_t>(record.stages.size()));
    for (const auto& s : record.stages) {
        put_str(buf, s.id);
        put_u8(buf, static_cast<uint8_t>(s.phase));
        put_u32(buf, s.attempts);
        put_str(buf, s.resource);
        put_str(buf, s.checkpoint_ref);
        put_u8(buf, static_cast<uint8_t>(s.last_cause));
        put_outputs(buf, s.outputs);
    }

    put_u32(buf, static_cast<uint32_t>(record.checkpoints.size()));
    for (const auto& c : record.checkpoints) {
        put_str(buf, c.ref);
        put_str(buf, c.stage);
        put_u32(buf, c.attempt);
        put_u64(buf, c.sequence);
        put_u8(buf, static_cast<uint8_t>(c.kind));
    }
    return buf;
}

Result<JobRecord> RecordCodec::decode_job_record(const Bytes& data) {
    Reader r(data);
    if (auto ok = check_header(r, kJobRecordMagic, "job record"); !ok) return ok.error();

    JobRecord record;
    auto id = r.str();
    auto workflow = r.str();
    auto fingerprint = r.u64();
    auto priority = r.u32();
    auto state = r.enumeration(JobState::Timeout);
    if (!id || !workflow || !fingerprint || !priority || !state) return truncated("job record");
    record.id = std::move(*id);
    record.workflow = std::move(*workflow);
    record.fingerprint = *fingerprint;
    record.priority = static_cast<int32_t>(*priority);
    record.state = *state;

    auto n_transitions = r.u32();
    if (!n_transitions) return truncated("job record");
    for (uint32_t i = 0; i < *n_transitions; ++i) {
        auto from = r.enumeration(JobState::Timeout);
        auto to = r.enumeration(JobState::Timeout);
        auto event = r.enumeration(JobEvent::Expire);
        auto at = r.time();
        auto cause = r.enumeration(CauseCode::Internal);
        auto detail = r.str();
        auto stage = r.str();
        if (!from || !to || !event || !at || !cause || !detail || !stage) {
            return truncated("job record");
        }
        record.transitions.push_back(StateTransition{
            .from = *from, .to = *to, .event = *event, .at = *at,
            .cause = *cause, .detail_ref = std::move(*detail), .stage = std::move(*stage)
        });
    }

    auto n_stages = r.u32();
    if (!n_stages) return truncated("job record");
    for (uint32_t i = 0; i < *n_stages; ++i) {
        auto sid = r.str();
        auto phase = r.enumeration(StagePhase::Failed);
        auto attempts = r.u32();
        auto resource = r.str();
        auto checkpoint_ref = r.str();
        auto last_cause = r.enumeration(CauseCode::Internal);
        auto outputs = r.outputs();
        if (!sid || !phase || !attempts || !resource || !checkpoint_ref || !last_cause || !outputs) {
            return truncated("job record");
        }
        record.stages.push_back(StageRecord{
            .id = std::move(*sid), .phase = *phase, .attempts = *attempts,
            .resource = std::move(*resource), .checkpoint_ref = std::move(*checkpoint_ref),
            .last_cause = *last_cause, .outputs = std::move(*outputs)
        });
    }

    auto n_checkpoints = r.u32();
    if (!n_checkpoints) return truncated("job record");
    for (uint32_t i = 0; i < *n_checkpoints; ++i) {
        auto ref = r.str();
        auto stage = r.str();
        auto attempt = r.u32();
        auto sequence = r.u64();
        auto kind = r.enumeration(CheckpointKind::InFlight);
        if (!ref || !stage || !attempt || !sequence || !kind) return truncated("job record");
        record.checkpoints.push_back(CheckpointRef{
            .ref = std::move(*ref), .stage = std::move(*stage), .attempt = *attempt,
            .sequence = *sequence, .kind = *kind
        });
    }

    if (!r.at_end()) return truncated("job record");
    return record;
}

}  // namespace hybrid_orchestrator
