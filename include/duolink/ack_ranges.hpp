/**
 * @file ack_ranges.hpp
 * @brief Acknowledgment range scheduling
 *
 * Turns a sparse set of received chunk indices into a short list of
 * inclusive ranges for the backchannel, and expands such a list back into
 * indices on the sender side.
 *
 * The index space is circular: index total-1 is adjacent to index 0, so a
 * range with start > end covers start .. total-1 followed by 0 .. end.
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <set>
#include <vector>

namespace duolink
{

/**
 * @brief Inclusive acknowledged index range
 */
struct AckRange
{
  uint32_t start;
  uint32_t end;

  bool wraps() const
  {
    return start > end;
  }

  bool operator==(const AckRange& other) const
  {
    return start == other.start && end == other.end;
  }
};

using IndexSet = std::set<uint32_t>;

/**
 * @brief Build the range list acknowledging @p requested
 *
 * Every requested index is grown into the maximal run of @p received
 * indices containing it, so whole runs are re-confirmed and the list stays
 * short however fragmented the received set is. Runs are merged into
 * ranges; when the first range starts at 0 and the last ends at total-1
 * they are joined into one wrap-around range placed first.
 *
 * Requested indices missing from @p received are skipped.
 *
 * @param received  Every index received for the current message
 * @param requested Indices that must be acknowledged this round
 * @param total     Chunk count of the current message
 * @param out       Resulting ranges (cleared first)
 */
void schedule_ack_ranges(const IndexSet& received, const IndexSet& requested, uint32_t total,
                         std::vector<AckRange>& out);

/**
 * @brief Expand ranges into the indices they cover
 *
 * Indices >= @p total are dropped; they refer to another message.
 *
 * @param ranges Range list, normal or wrap-around
 * @param total  Chunk count of the current message
 * @param out    Indices are inserted into this set
 */
void expand_ack_ranges(const std::vector<AckRange>& ranges, uint32_t total, IndexSet& out);

}  // namespace duolink
