#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"

namespace Tsnbench {

// EtherType of the 802.1CB redundancy tag carried in front of each replicated frame
constexpr uint16_t kRTagEtherType = 0xF1C1;
constexpr size_t kRTagSize = 8;

struct FrameSequenceRecord {
    uint32_t sequence_number = 0;
    uint64_t arrival_index = 0;
};

struct RTag {
    uint16_t ether_type = 0;
    uint16_t stream_id = 0;
    uint32_t sequence_number = 0;
};

struct SequenceAnalysis {
    size_t total = 0;
    size_t unique = 0;
    size_t duplicates = 0;
    size_t out_of_order = 0;
    double replication_ratio_pct = 0.0;
    double elimination_efficiency_pct = 0.0;
    // Entries excluded from the counts (undecodable or foreign stream)
    size_t skipped = 0;
};

/**
 * Classifies a received frame stream in arrival order.
 *
 * A frame is a duplicate when its sequence number was already observed. A
 * frame is out of order when its sequence number is lower than that of the
 * frame that arrived just before it, duplicates included, so a late
 * re-delivery moves the reference point backwards.
 */
class SequenceAnalyzer {
public:
    SequenceAnalyzer() = default;

    void Observe(const FrameSequenceRecord& record);
    void Observe(uint32_t sequence_number);

    // Counts an entry that could not be decoded and was left out of the analysis
    void Skip() { ++skipped_; }

    SequenceAnalysis Result() const;
    void Reset();

private:
    absl::flat_hash_set<uint32_t> seen_;
    int64_t prev_seq_ = -1;
    size_t duplicates_ = 0;
    size_t out_of_order_ = 0;
    size_t skipped_ = 0;
};

SequenceAnalysis Analyze(const std::vector<FrameSequenceRecord>& stream);

/**
 * Decodes the 8-byte big-endian R-TAG at the start of a frame payload.
 * @return nullopt when the payload is too short or carries another EtherType
 */
std::optional<RTag> DecodeRTag(const uint8_t* data, size_t len);

// Writes the tag in wire order followed by payload_size filler bytes
std::vector<uint8_t> EncodeRTag(uint16_t stream_id, uint32_t sequence_number,
                                size_t payload_size = 0);

/**
 * Runs the analysis over raw captured payloads in arrival order. Payloads
 * without a valid R-TAG, or tagged for a stream other than stream_filter
 * (when set), are skipped and counted in SequenceAnalysis::skipped.
 */
SequenceAnalysis AnalyzeTaggedPayloads(const std::vector<std::vector<uint8_t>>& payloads,
                                       std::optional<uint16_t> stream_filter = std::nullopt);

std::vector<std::pair<std::string, double>> ToFields(const SequenceAnalysis& analysis);

} // namespace Tsnbench
