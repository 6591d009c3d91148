#include "sequence_analyzer.h"

#include <glog/logging.h>

namespace Tsnbench {

void SequenceAnalyzer::Observe(const FrameSequenceRecord& record) {
    Observe(record.sequence_number);
}

void SequenceAnalyzer::Observe(uint32_t sequence_number) {
    if (!seen_.insert(sequence_number).second) {
        ++duplicates_;
    }
    const int64_t seq = static_cast<int64_t>(sequence_number);
    if (seq < prev_seq_) {
        ++out_of_order_;
    }
    prev_seq_ = seq;
}

SequenceAnalysis SequenceAnalyzer::Result() const {
    SequenceAnalysis a{};
    a.unique = seen_.size();
    a.duplicates = duplicates_;
    a.total = a.unique + a.duplicates;
    a.out_of_order = out_of_order_;
    a.skipped = skipped_;
    if (a.unique > 0) {
        a.replication_ratio_pct =
            static_cast<double>(a.duplicates) / static_cast<double>(a.unique) * 100.0;
    }
    if (a.total > 0) {
        a.elimination_efficiency_pct =
            static_cast<double>(a.duplicates) / static_cast<double>(a.total) * 100.0;
    }
    return a;
}

void SequenceAnalyzer::Reset() {
    seen_.clear();
    prev_seq_ = -1;
    duplicates_ = 0;
    out_of_order_ = 0;
    skipped_ = 0;
}

SequenceAnalysis Analyze(const std::vector<FrameSequenceRecord>& stream) {
    SequenceAnalyzer analyzer;
    for (const auto& record : stream) {
        analyzer.Observe(record);
    }
    return analyzer.Result();
}

std::optional<RTag> DecodeRTag(const uint8_t* data, size_t len) {
    if (data == nullptr || len < kRTagSize) {
        return std::nullopt;
    }
    RTag tag;
    tag.ether_type = static_cast<uint16_t>((data[0] << 8) | data[1]);
    if (tag.ether_type != kRTagEtherType) {
        return std::nullopt;
    }
    tag.stream_id = static_cast<uint16_t>((data[2] << 8) | data[3]);
    tag.sequence_number = (static_cast<uint32_t>(data[4]) << 24) |
                          (static_cast<uint32_t>(data[5]) << 16) |
                          (static_cast<uint32_t>(data[6]) << 8) |
                          static_cast<uint32_t>(data[7]);
    return tag;
}

std::vector<uint8_t> EncodeRTag(uint16_t stream_id, uint32_t sequence_number,
                                size_t payload_size) {
    std::vector<uint8_t> frame(kRTagSize + payload_size, 0);
    frame[0] = static_cast<uint8_t>(kRTagEtherType >> 8);
    frame[1] = static_cast<uint8_t>(kRTagEtherType & 0xFF);
    frame[2] = static_cast<uint8_t>(stream_id >> 8);
    frame[3] = static_cast<uint8_t>(stream_id & 0xFF);
    frame[4] = static_cast<uint8_t>(sequence_number >> 24);
    frame[5] = static_cast<uint8_t>((sequence_number >> 16) & 0xFF);
    frame[6] = static_cast<uint8_t>((sequence_number >> 8) & 0xFF);
    frame[7] = static_cast<uint8_t>(sequence_number & 0xFF);
    return frame;
}

SequenceAnalysis AnalyzeTaggedPayloads(const std::vector<std::vector<uint8_t>>& payloads,
                                       std::optional<uint16_t> stream_filter) {
    SequenceAnalyzer analyzer;
    for (size_t i = 0; i < payloads.size(); ++i) {
        const auto& payload = payloads[i];
        std::optional<RTag> tag = DecodeRTag(payload.data(), payload.size());
        if (!tag.has_value()) {
            VLOG(1) << "Skipping frame " << i << ": no R-TAG (" << payload.size() << " bytes)";
            analyzer.Skip();
            continue;
        }
        if (stream_filter.has_value() && tag->stream_id != *stream_filter) {
            VLOG(2) << "Skipping frame " << i << " of stream " << tag->stream_id;
            analyzer.Skip();
            continue;
        }
        analyzer.Observe(FrameSequenceRecord{tag->sequence_number, i});
    }

    SequenceAnalysis result = analyzer.Result();
    if (result.skipped > 0) {
        LOG(WARNING) << "Sequence analysis skipped " << result.skipped << " of "
                     << payloads.size() << " captured frames";
    }
    return result;
}

std::vector<std::pair<std::string, double>> ToFields(const SequenceAnalysis& analysis) {
    return {
        {"total_packets", static_cast<double>(analysis.total)},
        {"unique_packets", static_cast<double>(analysis.unique)},
        {"duplicates", static_cast<double>(analysis.duplicates)},
        {"out_of_order", static_cast<double>(analysis.out_of_order)},
        {"replication_ratio", analysis.replication_ratio_pct},
        {"elimination_efficiency", analysis.elimination_efficiency_pct},
    };
}

} // namespace Tsnbench
