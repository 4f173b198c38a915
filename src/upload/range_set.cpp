#include "bitsd/upload/range_set.hpp"

#include <algorithm>

namespace bitsd::upload {

void RangeSet::insert(ByteRange range) {
    if (range.empty()) {
        return;
    }

    // First interval whose end reaches the new start (touching counts)
    auto first = std::lower_bound(intervals_.begin(), intervals_.end(), range.start,
        [](const ByteRange& existing, std::uint64_t start) {
            return existing.end < start;
        });

    auto last = first;
    while (last != intervals_.end() && last->start <= range.end) {
        range.start = std::min(range.start, last->start);
        range.end = std::max(range.end, last->end);
        ++last;
    }

    first = intervals_.erase(first, last);
    intervals_.insert(first, range);
}

bool RangeSet::covers(std::uint64_t total) const noexcept {
    return intervals_.size() == 1 && intervals_.front().start == 0 && intervals_.front().end == total;
}

std::uint64_t RangeSet::contiguous_prefix() const noexcept {
    if (intervals_.empty() || intervals_.front().start != 0) {
        return 0;
    }
    return intervals_.front().end;
}

std::vector<ByteRange> RangeSet::intersection(ByteRange range) const {
    std::vector<ByteRange> overlaps;
    for (const auto& existing : intervals_) {
        if (existing.start >= range.end) {
            break;
        }
        const ByteRange overlap{std::max(existing.start, range.start), std::min(existing.end, range.end)};
        if (!overlap.empty()) {
            overlaps.push_back(overlap);
        }
    }
    return overlaps;
}

std::uint64_t RangeSet::total_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& interval : intervals_) {
        total += interval.length();
    }
    return total;
}

} // namespace bitsd::upload
