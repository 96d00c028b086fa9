/**
 * @file ack_ranges.cpp
 * @brief Acknowledgment range scheduling implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/ack_ranges.hpp"

namespace duolink
{

void schedule_ack_ranges(const IndexSet& received, const IndexSet& requested, uint32_t total,
                         std::vector<AckRange>& out)
{
  out.clear();

  // Flood-fill each seed through contiguous received indices
  IndexSet to_ack;
  for (const uint32_t seed : requested)
  {
    if (received.count(seed) == 0 || to_ack.count(seed) != 0)
    {
      continue;
    }

    uint32_t start = seed;
    uint32_t end = seed;

    while (start > 0 && received.count(start - 1) != 0)
    {
      --start;
    }
    while (end + 1 < total && received.count(end + 1) != 0)
    {
      ++end;
    }

    for (uint32_t i = start; i <= end; ++i)
    {
      to_ack.insert(i);
    }
  }

  if (to_ack.empty())
  {
    return;
  }

  // Merge sorted indices into ranges
  auto it = to_ack.begin();
  AckRange current = {*it, *it};
  for (++it; it != to_ack.end(); ++it)
  {
    if (*it == current.end + 1)
    {
      current.end = *it;
    }
    else
    {
      out.push_back(current);
      current = {*it, *it};
    }
  }
  out.push_back(current);

  // Join the ends of the circular index space
  if (out.size() > 1 && out.front().start == 0 && out.back().end == total - 1)
  {
    const AckRange wrapped = {out.back().start, out.front().end};
    out.pop_back();
    out.front() = wrapped;
  }
}

void expand_ack_ranges(const std::vector<AckRange>& ranges, uint32_t total, IndexSet& out)
{
  for (const AckRange& range : ranges)
  {
    if (!range.wraps())
    {
      for (uint32_t i = range.start; i <= range.end && i < total; ++i)
      {
        out.insert(i);
      }
      continue;
    }

    for (uint32_t i = range.start; i < total; ++i)
    {
      out.insert(i);
    }
    for (uint32_t i = 0; i <= range.end && i < total; ++i)
    {
      out.insert(i);
    }
  }
}

}  // namespace duolink
