#pragma once

#include "bitsd/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace bitsd::upload {

/**
 * @brief Sorted set of disjoint byte intervals, kept maximally merged
 *
 * Overlapping and adjacent intervals are coalesced on insertion, so the set
 * never holds two intervals that touch. Coverage of [0, total) therefore
 * reduces to "exactly one interval equal to [0, total)".
 */
class RangeSet {
public:
    void insert(ByteRange range);

    [[nodiscard]] bool covers(std::uint64_t total) const noexcept;

    /// End of the received run that starts at byte 0 (0 when byte 0 is missing)
    [[nodiscard]] std::uint64_t contiguous_prefix() const noexcept;

    /// Portions of @p range that were already received
    [[nodiscard]] std::vector<ByteRange> intersection(ByteRange range) const;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept;

    [[nodiscard]] const std::vector<ByteRange>& intervals() const noexcept { return intervals_; }
    [[nodiscard]] bool empty() const noexcept { return intervals_.empty(); }

    void clear() noexcept { intervals_.clear(); }

private:
    std::vector<ByteRange> intervals_;
};

} // namespace bitsd::upload
