// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/config.hpp>
#include <rangeget/core/resume_store.hpp>
#include <rangeget/core/transport.hpp>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace rangeget::core {

// Ordered, gapless, non-overlapping cover of [0, total)
struct SegmentPlan {
    std::uint32_t splits{1};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::vector<ByteRange> ranges;
};

struct PlanOutcome {
    SegmentPlan plan;
    bool reused{false};         // Boundaries came from the Resume Record
    std::error_code discarded;  // resume_record_invalid when a record was dropped
};

class SegmentPlanner {
public:
    // Fresh plan. Unknown total or no range support yields one segment,
    // open-ended when the total is unknown.
    [[nodiscard]] static SegmentPlan plan(std::optional<std::uint64_t> total,
                                          bool range_supported,
                                          const DownloadConfig& config);

    // Reuse the record's boundaries when they still describe this resource,
    // otherwise discard it and plan fresh
    [[nodiscard]] static PlanOutcome plan(std::optional<std::uint64_t> total,
                                          bool range_supported,
                                          const DownloadConfig& config,
                                          const ResumeRecord* record);

    // 4 / 8 / 16 segments for small / medium / large files
    [[nodiscard]] static std::uint32_t dynamic_splits(std::uint64_t total) noexcept;

    // min(MAX_CHUNK_SIZE, total / splits), at least MIN_CHUNK_SIZE
    [[nodiscard]] static std::uint64_t dynamic_chunk_size(std::uint64_t total, std::uint32_t splits) noexcept;

    // Split [0, total) into `splits` ranges; the last absorbs the remainder
    [[nodiscard]] static std::vector<ByteRange> partition(std::uint64_t total, std::uint32_t splits);

    // True if `ranges` exactly covers [0, total) in order
    [[nodiscard]] static bool is_partition(const std::vector<ByteRange>& ranges, std::uint64_t total) noexcept;
};

} // namespace rangeget::core
