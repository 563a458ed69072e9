/**
 * @file record_codec.hpp
 * @brief Binary serialization of stage data, checkpoint records and job
 *        records for the storage collaborator.
 *
 * All multi-byte values are big-endian. Strings and containers are
 * length-prefixed with a u32. Records start with a 4-byte magic and a
 * 1-byte version; decoding rejects truncated or trailing input.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "lifecycle/job.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Durable content of one checkpoint.
 *
 * The checksums are those of the encoded output data at checkpoint time;
 * resume re-reads each output and compares.
 */
struct CheckpointRecord {
    JobId job;
    StageId stage;
    uint32_t attempt = 0;
    uint64_t sequence = 0;
    CheckpointKind kind = CheckpointKind::StageComplete;
    uint64_t graph_fingerprint = 0;
    Timestamp at;
    std::map<std::string, StoredOutput> outputs;
};

struct RecordCodec {
    static Bytes encode_datum(const Datum& datum);
    static Result<Datum> decode_datum(const Bytes& data);

    static Bytes encode_checkpoint(const CheckpointRecord& record);
    static Result<CheckpointRecord> decode_checkpoint(const Bytes& data);

    static Bytes encode_job_record(const JobRecord& record);
    static Result<JobRecord> decode_job_record(const Bytes& data);

    /// Checksum stored alongside persisted outputs.
    static uint64_t checksum(const Bytes& data) noexcept;

    static void put_u64(Bytes& buf, uint64_t val);
    static void put_u32(Bytes& buf, uint32_t val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace hybrid_orchestrator
