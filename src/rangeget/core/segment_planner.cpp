// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/segment_planner.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/log.hpp>
#include <algorithm>

namespace rangeget::core {

namespace {

std::uint64_t chunk_for(const DownloadConfig& config, std::uint64_t total, std::uint32_t splits) noexcept {
    if (config.chunk_size_kb) {
        return *config.chunk_size_kb * KiB;
    }
    return SegmentPlanner::dynamic_chunk_size(total, splits);
}

bool record_matches(const ResumeRecord& record,
                    std::uint64_t total,
                    bool range_supported,
                    const DownloadConfig& config) {
    if (record.total_size != total || record.range_supported != range_supported) {
        return false;
    }
    if (record.segments.size() > config.max_segments) {
        return false;
    }
    if (!range_supported && record.segments.size() != 1) {
        return false;
    }

    std::vector<ByteRange> ranges;
    ranges.reserve(record.segments.size());
    for (const auto& s : record.segments) {
        ranges.push_back(ByteRange{s.start, s.end});
    }
    return SegmentPlanner::is_partition(ranges, total);
}

} // namespace

std::uint32_t SegmentPlanner::dynamic_splits(std::uint64_t total) noexcept {
    if (total < SMALL_FILE_LIMIT) return SMALL_FILE_SPLITS;
    if (total < MEDIUM_FILE_LIMIT) return MEDIUM_FILE_SPLITS;
    return LARGE_FILE_SPLITS;
}

std::uint64_t SegmentPlanner::dynamic_chunk_size(std::uint64_t total, std::uint32_t splits) noexcept {
    std::uint64_t per_segment = total / std::max<std::uint32_t>(splits, 1);
    return std::clamp(per_segment, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE);
}

std::vector<ByteRange> SegmentPlanner::partition(std::uint64_t total, std::uint32_t splits) {
    splits = std::max<std::uint32_t>(splits, 1);
    const std::uint64_t base = total / splits;

    std::vector<ByteRange> ranges;
    ranges.reserve(splits);
    for (std::uint32_t i = 0; i < splits; ++i) {
        std::uint64_t start = base * i;
        std::uint64_t end = (i + 1 == splits) ? total : base * (i + 1);
        ranges.push_back(ByteRange{start, end});
    }
    return ranges;
}

bool SegmentPlanner::is_partition(const std::vector<ByteRange>& ranges, std::uint64_t total) noexcept {
    if (ranges.empty()) return false;

    std::uint64_t expected = 0;
    for (const auto& r : ranges) {
        if (!r.bounded() || r.start != expected || r.end < r.start) {
            return false;
        }
        expected = r.end;
    }
    return expected == total;
}

SegmentPlan SegmentPlanner::plan(std::optional<std::uint64_t> total,
                                 bool range_supported,
                                 const DownloadConfig& config) {
    SegmentPlan plan;

    // Unknown size: stream everything into one open-ended segment
    if (!total) {
        plan.chunk_size = config.chunk_size_kb ? *config.chunk_size_kb * KiB : DEFAULT_CHUNK_SIZE;
        plan.ranges.push_back(ByteRange{0, UNBOUNDED});
        return plan;
    }

    if (*total == 0 || !range_supported) {
        plan.chunk_size = chunk_for(config, *total, 1);
        plan.ranges.push_back(ByteRange{0, *total});
        return plan;
    }

    std::uint64_t splits;
    if (config.splits) {
        splits = std::clamp<std::uint64_t>(*config.splits, 1, config.max_segments);
    } else {
        splits = std::min<std::uint64_t>(dynamic_splits(*total), config.max_segments);
        // Keep segments above the minimum size
        splits = std::min<std::uint64_t>(splits, std::max<std::uint64_t>(*total / config.min_segment_size, 1));
    }
    splits = std::min(splits, *total);

    plan.splits = static_cast<std::uint32_t>(splits);
    plan.chunk_size = chunk_for(config, *total, plan.splits);
    plan.ranges = partition(*total, plan.splits);
    return plan;
}

PlanOutcome SegmentPlanner::plan(std::optional<std::uint64_t> total,
                                 bool range_supported,
                                 const DownloadConfig& config,
                                 const ResumeRecord* record) {
    PlanOutcome outcome;

    if (record && total && record_matches(*record, *total, range_supported, config)) {
        outcome.reused = true;
        outcome.plan.splits = static_cast<std::uint32_t>(record->segments.size());
        outcome.plan.chunk_size = chunk_for(config, *total, outcome.plan.splits);
        for (const auto& s : record->segments) {
            outcome.plan.ranges.push_back(ByteRange{s.start, s.end});
        }
        log::logger()->debug("planner: reusing {} segments from resume record", outcome.plan.splits);
        return outcome;
    }

    if (record) {
        log::logger()->info("resume record does not match the resource (size {} vs {}), starting fresh",
                            record->total_size, total ? std::to_string(*total) : "unknown");
        outcome.discarded = make_error_code(DownloadErrc::resume_record_invalid);
    }

    outcome.plan = plan(total, range_supported, config);
    return outcome;
}

} // namespace rangeget::core
