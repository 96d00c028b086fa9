/**
 * @file frame.cpp
 * @brief Wire frame encoding/decoding implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include <limits>

#include "duolink/text_codec.hpp"

namespace duolink
{
namespace internal
{

namespace
{

constexpr int64_t MAX_INDEX = std::numeric_limits<uint32_t>::max();

struct CompiledCodec
{
  ErrorCode status;
  TextCodec codec;

  explicit CompiledCodec(const char* tmpl) : status(ErrorCode::OK), codec()
  {
    status = TextCodec::compile(tmpl, codec);
  }
};

// Compiled once; immutable afterwards
const CompiledCodec& primary_codec()
{
  static const CompiledCodec compiled(PRIMARY_FRAME_TEMPLATE);
  return compiled;
}

const CompiledCodec& back_codec()
{
  static const CompiledCodec compiled(BACK_FRAME_TEMPLATE);
  return compiled;
}

}  // namespace

ErrorCode encode_primary_frame(const PrimaryFrame& frame, std::string& out)
{
  const CompiledCodec& compiled = primary_codec();
  if (compiled.status != ErrorCode::OK)
  {
    return compiled.status;
  }

  TextRecord record;
  record.set_num("index", frame.index);
  record.set_num("total", frame.total);
  record.set_text("checksum", frame.checksum);
  record.set_payload(frame.payload);

  return compiled.codec.encode(record, out);
}

bool decode_primary_frame(const std::string& text, PrimaryFrame& out)
{
  const CompiledCodec& compiled = primary_codec();
  if (compiled.status != ErrorCode::OK)
  {
    return false;
  }

  TextRecord record;
  if (!compiled.codec.decode(text, record))
  {
    return false;
  }

  int64_t index = 0;
  int64_t total = 0;
  std::string checksum;
  if (!record.get_num("index", index) || !record.get_num("total", total) ||
      !record.get_text("checksum", checksum))
  {
    return false;
  }

  if (total <= 0 || total > MAX_INDEX || index >= total)
  {
    return false;
  }
  if (checksum.size() != CHECKSUM_LENGTH || record.payload().empty())
  {
    return false;
  }

  out.index = static_cast<uint32_t>(index);
  out.total = static_cast<uint32_t>(total);
  out.checksum = checksum;
  out.payload = record.payload();
  return true;
}

ErrorCode encode_back_frame(const std::vector<AckRange>& ranges, std::string& out)
{
  const CompiledCodec& compiled = back_codec();
  if (compiled.status != ErrorCode::OK)
  {
    return compiled.status;
  }

  std::vector<NumPair> pairs;
  pairs.reserve(ranges.size());
  for (const AckRange& range : ranges)
  {
    pairs.emplace_back(range.start, range.end);
  }

  TextRecord record;
  record.set_num_pairs("ranges", pairs);
  return compiled.codec.encode(record, out);
}

bool decode_back_frame(const std::string& text, std::vector<AckRange>& out)
{
  const CompiledCodec& compiled = back_codec();
  if (compiled.status != ErrorCode::OK)
  {
    return false;
  }

  TextRecord record;
  std::vector<NumPair> pairs;
  if (!compiled.codec.decode(text, record) || !record.payload().empty() ||
      !record.get_num_pairs("ranges", pairs))
  {
    return false;
  }

  std::vector<AckRange> ranges;
  ranges.reserve(pairs.size());
  for (const NumPair& pair : pairs)
  {
    if (pair.first > MAX_INDEX || pair.second > MAX_INDEX)
    {
      return false;
    }
    ranges.push_back({static_cast<uint32_t>(pair.first), static_cast<uint32_t>(pair.second)});
  }

  out.swap(ranges);
  return true;
}

}  // namespace internal
}  // namespace duolink
