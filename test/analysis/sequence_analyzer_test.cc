#include <gtest/gtest.h>
#include "../../src/analysis/sequence_analyzer.h"

#include <map>

using namespace Tsnbench;

namespace {

std::vector<FrameSequenceRecord> MakeStream(const std::vector<uint32_t>& seqs) {
    std::vector<FrameSequenceRecord> stream;
    for (size_t i = 0; i < seqs.size(); ++i) {
        stream.push_back(FrameSequenceRecord{seqs[i], i});
    }
    return stream;
}

} // namespace

TEST(SequenceAnalyzerTest, ReplicatedStreamExample) {
    SequenceAnalysis a = Analyze(MakeStream({1, 1, 2, 3, 2, 4}));

    EXPECT_EQ(a.unique, 4u);
    EXPECT_EQ(a.duplicates, 2u);
    EXPECT_EQ(a.total, 6u);
    EXPECT_EQ(a.out_of_order, 1u);
    EXPECT_DOUBLE_EQ(a.replication_ratio_pct, 50.0);
    EXPECT_NEAR(a.elimination_efficiency_pct, 33.333333, 1e-5);
}

TEST(SequenceAnalyzerTest, EmptyStream) {
    SequenceAnalysis a = Analyze({});
    EXPECT_EQ(a.total, 0u);
    EXPECT_EQ(a.unique, 0u);
    EXPECT_DOUBLE_EQ(a.replication_ratio_pct, 0.0);
    EXPECT_DOUBLE_EQ(a.elimination_efficiency_pct, 0.0);
}

TEST(SequenceAnalyzerTest, PerfectDualPathDelivery) {
    // Every frame arrives once per path, back to back
    std::vector<uint32_t> seqs;
    for (uint32_t s = 0; s < 100; ++s) {
        seqs.push_back(s);
        seqs.push_back(s);
    }
    SequenceAnalysis a = Analyze(MakeStream(seqs));
    EXPECT_EQ(a.unique, 100u);
    EXPECT_EQ(a.duplicates, 100u);
    EXPECT_EQ(a.out_of_order, 0u);
    EXPECT_DOUBLE_EQ(a.replication_ratio_pct, 100.0);
    EXPECT_DOUBLE_EQ(a.elimination_efficiency_pct, 50.0);
}

TEST(SequenceAnalyzerTest, LateDuplicateMovesReferenceBackwards) {
    // 5 is late, then 3 is compared against 5, then 4 against 3
    SequenceAnalysis a = Analyze(MakeStream({1, 2, 5, 3, 4, 6}));
    EXPECT_EQ(a.out_of_order, 1u);

    // A stale duplicate of 1 resets the reference so 2 is in order again
    SequenceAnalysis b = Analyze(MakeStream({1, 2, 3, 1, 2}));
    EXPECT_EQ(b.duplicates, 2u);
    EXPECT_EQ(b.out_of_order, 1u);
}

TEST(SequenceAnalyzerTest, SequenceZeroIsNotOutOfOrder) {
    SequenceAnalysis a = Analyze(MakeStream({0, 0, 1}));
    EXPECT_EQ(a.out_of_order, 0u);
    EXPECT_EQ(a.duplicates, 1u);
}

TEST(SequenceAnalyzerTest, TotalIsUniquePlusDuplicates) {
    SequenceAnalysis a = Analyze(MakeStream({9, 3, 3, 7, 9, 1, 2, 2, 2, 0xFFFFFFFFu}));
    EXPECT_EQ(a.total, a.unique + a.duplicates);
    EXPECT_EQ(a.unique, 6u);
    EXPECT_EQ(a.duplicates, 4u);
}

TEST(SequenceAnalyzerTest, StreamingMatchesBatch) {
    SequenceAnalyzer analyzer;
    for (uint32_t s : {1u, 1u, 2u, 3u, 2u, 4u}) analyzer.Observe(s);
    SequenceAnalysis streamed = analyzer.Result();
    SequenceAnalysis batch = Analyze(MakeStream({1, 1, 2, 3, 2, 4}));
    EXPECT_EQ(streamed.duplicates, batch.duplicates);
    EXPECT_EQ(streamed.out_of_order, batch.out_of_order);

    analyzer.Reset();
    EXPECT_EQ(analyzer.Result().total, 0u);
}

TEST(RTagTest, DecodeTag) {
    const uint8_t frame[] = {0xF1, 0xC1, 0x00, 0x07, 0x01, 0x02, 0x03, 0x04, 0xAA};
    auto tag = DecodeRTag(frame, sizeof(frame));
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag->ether_type, kRTagEtherType);
    EXPECT_EQ(tag->stream_id, 7);
    EXPECT_EQ(tag->sequence_number, 0x01020304u);
}

TEST(RTagTest, RejectsShortOrForeignFrames) {
    const uint8_t short_frame[] = {0xF1, 0xC1, 0x00, 0x01, 0x00};
    EXPECT_FALSE(DecodeRTag(short_frame, sizeof(short_frame)).has_value());

    const uint8_t ipv4[] = {0x08, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01};
    EXPECT_FALSE(DecodeRTag(ipv4, sizeof(ipv4)).has_value());

    EXPECT_FALSE(DecodeRTag(nullptr, 8).has_value());
}

TEST(RTagTest, EncodeWritesWireOrder) {
    std::vector<uint8_t> frame = EncodeRTag(0x0102, 0xA0B0C0D0u, 4);
    ASSERT_EQ(frame.size(), kRTagSize + 4);
    EXPECT_EQ(frame[0], 0xF1);
    EXPECT_EQ(frame[1], 0xC1);
    EXPECT_EQ(frame[2], 0x01);
    EXPECT_EQ(frame[3], 0x02);
    EXPECT_EQ(frame[4], 0xA0);
    EXPECT_EQ(frame[7], 0xD0);
}

TEST(RTagTest, MalformedPayloadsAreSkipped) {
    std::vector<std::vector<uint8_t>> capture;
    capture.push_back(EncodeRTag(1, 1));
    capture.push_back({0xF1, 0xC1, 0x00});             // truncated
    capture.push_back(EncodeRTag(1, 1));
    capture.push_back({0x86, 0xDD, 0, 0, 0, 0, 0, 2}); // not an R-TAG
    capture.push_back(EncodeRTag(1, 2));
    capture.push_back(EncodeRTag(1, 3));
    capture.push_back(EncodeRTag(1, 2));
    capture.push_back(EncodeRTag(1, 4));

    SequenceAnalysis a = AnalyzeTaggedPayloads(capture);
    EXPECT_EQ(a.skipped, 2u);
    EXPECT_EQ(a.total, 6u);
    EXPECT_EQ(a.unique, 4u);
    EXPECT_EQ(a.duplicates, 2u);
    EXPECT_EQ(a.out_of_order, 1u);
}

TEST(RTagTest, StreamFilterExcludesOtherStreams) {
    std::vector<std::vector<uint8_t>> capture{
        EncodeRTag(1, 10), EncodeRTag(2, 10), EncodeRTag(1, 10), EncodeRTag(2, 11)};
    SequenceAnalysis a = AnalyzeTaggedPayloads(capture, 1);
    EXPECT_EQ(a.total, 2u);
    EXPECT_EQ(a.duplicates, 1u);
    EXPECT_EQ(a.skipped, 2u);
}

TEST(SequenceAnalyzerTest, FieldNamesMatchReportKeys) {
    std::map<std::string, double> fields;
    for (const auto& [key, value] : ToFields(Analyze(MakeStream({1, 1, 2})))) {
        fields[key] = value;
    }
    EXPECT_DOUBLE_EQ(fields.at("unique_packets"), 2.0);
    EXPECT_DOUBLE_EQ(fields.at("duplicates"), 1.0);
    EXPECT_DOUBLE_EQ(fields.at("out_of_order"), 0.0);
    EXPECT_DOUBLE_EQ(fields.at("replication_ratio"), 50.0);
    EXPECT_NEAR(fields.at("elimination_efficiency"), 33.333333, 1e-5);
}
