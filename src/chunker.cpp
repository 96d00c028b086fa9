/**
 * @file chunker.cpp
 * @brief Message splitting and reassembly implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/chunker.hpp"

#include <utility>

namespace duolink
{

ErrorCode split_message(const std::string& message, size_t chunk_size, std::vector<Chunk>& out)
{
  if (chunk_size == 0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  out.clear();
  out.reserve((message.size() + chunk_size - 1) / chunk_size);

  for (size_t offset = 0; offset < message.size(); offset += chunk_size)
  {
    Chunk chunk;
    chunk.index = static_cast<uint32_t>(offset / chunk_size);
    chunk.payload = message.substr(offset, chunk_size);
    out.push_back(std::move(chunk));
  }

  return ErrorCode::OK;
}

bool reassemble_message(const ChunkMap& chunks, uint32_t total, std::string& out)
{
  std::string message;

  for (uint32_t i = 0; i < total; ++i)
  {
    const auto it = chunks.find(i);
    if (it == chunks.end())
    {
      return false;
    }
    message += it->second;
  }

  out.swap(message);
  return true;
}

}  // namespace duolink
