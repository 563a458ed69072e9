/**
 * @file test_record_codec.cpp
 * @brief Unit tests for RecordCodec.
 */

#include "storage/record_codec.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace hybrid_orchestrator;

namespace {

Timestamp at_us(int64_t us) {
    return Timestamp{std::chrono::microseconds{us}};
}

CheckpointRecord sample_checkpoint() {
    CheckpointRecord rec;
    rec.job = "job-7";
    rec.stage = "execute";
    rec.attempt = 2;
    rec.sequence = 5;
    rec.kind = CheckpointKind::StageComplete;
    rec.graph_fingerprint = 0xDEADBEEFCAFEF00DULL;
    rec.at = at_us(1'700'000'000'123'456);
    rec.outputs["counts"] = StoredOutput{"job-7/stages/execute/counts.bin", 99};
    return rec;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════
// Primitives
// ═══════════════════════════════════════════════

TEST(RecordCodecTest, BigEndianPrimitives) {
    Bytes buf;
    RecordCodec::put_u32(buf, 0x01020304);
    RecordCodec::put_u64(buf, 0x0A0B0C0D0E0F1011ULL);
    ASSERT_EQ(buf.size(), 12u);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(buf[4], 0x0A);
    EXPECT_EQ(buf[11], 0x11);
    EXPECT_EQ(RecordCodec::get_u32(buf.data()), 0x01020304u);
    EXPECT_EQ(RecordCodec::get_u64(buf.data() + 4), 0x0A0B0C0D0E0F1011ULL);
}

TEST(RecordCodecTest, ChecksumDetectsChange) {
    Bytes a{1, 2, 3};
    Bytes b{1, 2, 4};
    EXPECT_EQ(RecordCodec::checksum(a), RecordCodec::checksum(Bytes{1, 2, 3}));
    EXPECT_NE(RecordCodec::checksum(a), RecordCodec::checksum(b));
}

// ═══════════════════════════════════════════════
// Datum
// ═══════════════════════════════════════════════

TEST(RecordCodecTest, DatumVariants) {
    const Datum counts = Counts{{"00", 510}, {"11", 490}};
    const Datum params = Parameters{0.25, -1.5, std::numeric_limits<double>::infinity()};
    const Datum payload = std::string{"openqasm3:h q[0];"};

    for (const auto& datum : {counts, params, payload}) {
        auto decoded = RecordCodec::decode_datum(RecordCodec::encode_datum(datum));
        ASSERT_TRUE(decoded) << decoded.error().message;
        EXPECT_EQ(*decoded, datum);
    }
}

TEST(RecordCodecTest, DatumPreservesNaNBits) {
    auto decoded = RecordCodec::decode_datum(
        RecordCodec::encode_datum(Datum{Parameters{std::nan("")}}));
    ASSERT_TRUE(decoded);
    EXPECT_TRUE(std::isnan(std::get<Parameters>(*decoded)[0]));
}

TEST(RecordCodecTest, DatumRejectsMalformedInput) {
    EXPECT_FALSE(RecordCodec::decode_datum(Bytes{}));

    auto unknown = RecordCodec::decode_datum(Bytes{7});
    ASSERT_FALSE(unknown);
    EXPECT_NE(unknown.error().message.find("unknown tag"), std::string::npos);

    auto bytes = RecordCodec::encode_datum(Datum{Counts{{"0", 1}}});
    bytes.pop_back();
    EXPECT_FALSE(RecordCodec::decode_datum(bytes));

    bytes = RecordCodec::encode_datum(Datum{std::string{"x"}});
    bytes.push_back(0);
    auto trailing = RecordCodec::decode_datum(bytes);
    ASSERT_FALSE(trailing);
    EXPECT_NE(trailing.error().message.find("truncated or malformed"), std::string::npos);
}

TEST(RecordCodecTest, DatumRejectsOversizedLength) {
    // Payload tag with a length prefix far beyond the buffer
    Bytes bytes{2, 0xFF, 0xFF, 0xFF, 0xFF, 'a'};
    EXPECT_FALSE(RecordCodec::decode_datum(bytes));
}

TEST(RecordCodecTest, DatumRejectsOversizedParameterCount) {
    // Parameters tag claiming 2^32-1 doubles with none present
    auto huge = RecordCodec::decode_datum(Bytes{1, 0xFF, 0xFF, 0xFF, 0xFF});
    ASSERT_FALSE(huge);
    EXPECT_NE(huge.error().message.find("truncated or malformed"), std::string::npos);

    // Count of two with one double present
    Bytes one_short{1, 0, 0, 0, 2};
    one_short.resize(one_short.size() + 8, 0);
    EXPECT_FALSE(RecordCodec::decode_datum(one_short));
}

// ═══════════════════════════════════════════════
// Checkpoint Record
// ═══════════════════════════════════════════════

TEST(RecordCodecTest, CheckpointFields) {
    const auto rec = sample_checkpoint();
    auto decoded = RecordCodec::decode_checkpoint(RecordCodec::encode_checkpoint(rec));
    ASSERT_TRUE(decoded) << decoded.error().message;

    EXPECT_EQ(decoded->job, rec.job);
    EXPECT_EQ(decoded->stage, rec.stage);
    EXPECT_EQ(decoded->attempt, 2u);
    EXPECT_EQ(decoded->sequence, 5u);
    EXPECT_EQ(decoded->kind, CheckpointKind::StageComplete);
    EXPECT_EQ(decoded->graph_fingerprint, rec.graph_fingerprint);
    EXPECT_EQ(decoded->at, rec.at);
    EXPECT_EQ(decoded->outputs, rec.outputs);
}

TEST(RecordCodecTest, CheckpointHeaderChecks) {
    auto bytes = RecordCodec::encode_checkpoint(sample_checkpoint());

    auto bad_magic = bytes;
    bad_magic[0] ^= 0xFF;
    auto r1 = RecordCodec::decode_checkpoint(bad_magic);
    ASSERT_FALSE(r1);
    EXPECT_NE(r1.error().message.find("bad magic"), std::string::npos);

    auto bad_version = bytes;
    bad_version[4] = 9;
    auto r2 = RecordCodec::decode_checkpoint(bad_version);
    ASSERT_FALSE(r2);
    EXPECT_NE(r2.error().message.find("unsupported version"), std::string::npos);

    // A job record is not a checkpoint
    EXPECT_FALSE(RecordCodec::decode_checkpoint(RecordCodec::encode_job_record(JobRecord{})));
}

TEST(RecordCodecTest, CheckpointRejectsEveryTruncation) {
    const auto bytes = RecordCodec::encode_checkpoint(sample_checkpoint());
    for (size_t len = 0; len < bytes.size(); ++len) {
        Bytes prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(len));
        EXPECT_FALSE(RecordCodec::decode_checkpoint(prefix)) << "prefix length " << len;
    }
}

TEST(RecordCodecTest, CheckpointRejectsUnknownKind) {
    auto rec = sample_checkpoint();
    rec.outputs.clear();
    auto bytes = RecordCodec::encode_checkpoint(rec);
    // magic(4) version(1) job(4+5) stage(4+7) attempt(4) sequence(8) -> kind byte
    const size_t kind_offset = 4 + 1 + 4 + rec.job.size() + 4 + rec.stage.size() + 4 + 8;
    ASSERT_LT(kind_offset, bytes.size());
    bytes[kind_offset] = 42;
    EXPECT_FALSE(RecordCodec::decode_checkpoint(bytes));
}

// ═══════════════════════════════════════════════
// Job Record
// ═══════════════════════════════════════════════

TEST(RecordCodecTest, JobRecordFields) {
    JobRecord rec;
    rec.id = "job-9";
    rec.workflow = "linear_hybrid";
    rec.fingerprint = 1234567;
    rec.priority = -3;
    rec.state = JobState::Error;
    rec.transitions.push_back(StateTransition{
        .from = JobState::Pending, .to = JobState::Compiling, .event = JobEvent::StartCompiling,
        .at = at_us(10), .cause = CauseCode::None, .detail_ref = {}, .stage = {}});
    rec.transitions.push_back(StateTransition{
        .from = JobState::Compiling, .to = JobState::Error, .event = JobEvent::Fail,
        .at = at_us(20), .cause = CauseCode::NoCandidate,
        .detail_ref = "job-9/stages/execute/error.bin", .stage = "execute"});
    rec.stages.push_back(StageRecord{
        .id = "compile", .phase = StagePhase::Completed, .attempts = 1, .resource = {},
        .checkpoint_ref = "job-9/checkpoints/00000000000000000001_compile.ckpt",
        .last_cause = CauseCode::None,
        .outputs = {{"circuit", StoredOutput{"job-9/stages/compile/circuit.bin", 5}}}});
    rec.stages.push_back(StageRecord{
        .id = "execute", .phase = StagePhase::Failed, .attempts = 0, .resource = {},
        .checkpoint_ref = {}, .last_cause = CauseCode::NoCandidate, .outputs = {}});
    rec.checkpoints.push_back(CheckpointRef{
        .ref = "job-9/checkpoints/00000000000000000001_compile.ckpt", .stage = "compile",
        .attempt = 1, .sequence = 1, .kind = CheckpointKind::StageComplete});

    auto decoded = RecordCodec::decode_job_record(RecordCodec::encode_job_record(rec));
    ASSERT_TRUE(decoded) << decoded.error().message;

    EXPECT_EQ(decoded->id, "job-9");
    EXPECT_EQ(decoded->workflow, "linear_hybrid");
    EXPECT_EQ(decoded->fingerprint, 1234567u);
    EXPECT_EQ(decoded->priority, -3);
    EXPECT_EQ(decoded->state, JobState::Error);

    ASSERT_EQ(decoded->transitions.size(), 2u);
    EXPECT_EQ(decoded->transitions[1].cause, CauseCode::NoCandidate);
    EXPECT_EQ(decoded->transitions[1].detail_ref, "job-9/stages/execute/error.bin");
    EXPECT_EQ(decoded->transitions[1].stage, "execute");
    EXPECT_EQ(decoded->transitions[1].at, at_us(20));

    ASSERT_EQ(decoded->stages.size(), 2u);
    EXPECT_EQ(decoded->stages[0].outputs, rec.stages[0].outputs);
    EXPECT_EQ(decoded->stages[1].phase, StagePhase::Failed);
    EXPECT_EQ(decoded->stages[1].last_cause, CauseCode::NoCandidate);

    ASSERT_EQ(decoded->checkpoints.size(), 1u);
    EXPECT_EQ(decoded->checkpoints[0], rec.checkpoints[0]);
}

TEST(RecordCodecTest, JobRecordRejectsTrailingBytes) {
    auto bytes = RecordCodec::encode_job_record(JobRecord{.id = "j"});
    EXPECT_TRUE(RecordCodec::decode_job_record(bytes));
    bytes.push_back(0);
    EXPECT_FALSE(RecordCodec::decode_job_record(bytes));
}
