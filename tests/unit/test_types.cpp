/**
 * @file test_types.cpp
 * @brief Unit tests for core types, cause codes and checksums.
 */

#include "core/checksum.hpp"
#include "core/types.hpp"
#include "workflow/stage.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

using namespace hybrid_orchestrator;

TEST(TypesTest, DatumTypeNames) {
    EXPECT_EQ(datum_type_name(Datum{Counts{{"00", 3}}}), "counts");
    EXPECT_EQ(datum_type_name(Datum{Parameters{0.5}}), "parameters");
    EXPECT_EQ(datum_type_name(Datum{std::string{"openqasm3:..."}}), "payload");
}

TEST(TypesTest, CauseCodeStringsAreStableAndDistinct) {
    const std::vector<CauseCode> all{
        CauseCode::None, CauseCode::ValidationFailed, CauseCode::NoCandidate,
        CauseCode::RetriesExhausted, CauseCode::UnsupportedFormat,
        CauseCode::ResourceUnavailable, CauseCode::ResourceBusy,
        CauseCode::DeadlineExceeded, CauseCode::MalformedPayload,
        CauseCode::CollaboratorUnavailable, CauseCode::Cancelled,
        CauseCode::Timeout, CauseCode::Internal
    };
    std::set<std::string_view> names;
    for (auto code : all) names.insert(to_string(code));
    EXPECT_EQ(names.size(), all.size());

    EXPECT_EQ(to_string(CauseCode::NoCandidate), "NO_CANDIDATE");
    EXPECT_EQ(to_string(CauseCode::RetriesExhausted), "RETRIES_EXHAUSTED");
    EXPECT_EQ(to_string(CauseCode::Timeout), "TIMEOUT");
}

TEST(TypesTest, StageKindFollowsBodyAlternative) {
    Stage s;
    s.body = CompileStage{};
    EXPECT_EQ(s.kind(), StageKind::Compile);
    s.body = QuantumStage{};
    EXPECT_EQ(s.kind(), StageKind::Quantum);
    s.body = ClassicalStage{};
    EXPECT_EQ(s.kind(), StageKind::Classical);
    EXPECT_EQ(to_string(StageKind::Quantum), "quantum");
}

TEST(TypesTest, DataRefParse) {
    auto ref = DataRef::parse("compile.circuit");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->stage, "compile");
    EXPECT_EQ(ref->output, "circuit");
    EXPECT_EQ(ref->str(), "compile.circuit");

    // Split happens at the first dot
    auto dotted = DataRef::parse("a.b.c");
    ASSERT_TRUE(dotted.has_value());
    EXPECT_EQ(dotted->stage, "a");
    EXPECT_EQ(dotted->output, "b.c");
}

TEST(TypesTest, DataRefParseRejectsMalformed) {
    EXPECT_FALSE(DataRef::parse("nodot").has_value());
    EXPECT_FALSE(DataRef::parse(".output").has_value());
    EXPECT_FALSE(DataRef::parse("stage.").has_value());
    EXPECT_FALSE(DataRef::parse("").has_value());
}

TEST(ChecksumTest, KnownVectors) {
    // Reference values of 64-bit FNV-1a
    EXPECT_EQ(fnv1a_64(std::string_view{""}), 0xcbf29ce484222325ULL);
    EXPECT_EQ(fnv1a_64(std::string_view{"a"}), 0xaf63dc4c8601ec8cULL);
    EXPECT_EQ(fnv1a_64(std::string_view{"foobar"}), 0x85944171f73967e8ULL);
}

TEST(ChecksumTest, BytesAndTextAgree) {
    const std::string text = "hybrid";
    const Bytes bytes(text.begin(), text.end());
    EXPECT_EQ(fnv1a_64(bytes), fnv1a_64(text));
}

TEST(ChecksumTest, SeedChains) {
    EXPECT_EQ(fnv1a_64("bar", fnv1a_64("foo")), fnv1a_64("foobar"));
    EXPECT_NE(fnv1a_64("ab"), fnv1a_64("ba"));
}

TEST(ChecksumTest, Constexpr) {
    static_assert(fnv1a_64(std::string_view{""}) == kFnvOffsetBasis);
    SUCCEED();
}
