/**
 * @file chunker.hpp
 * @brief Message splitting and reassembly
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "duolink/protocol.hpp"

namespace duolink
{

/**
 * @brief Indexed slice of a message
 */
struct Chunk
{
  uint32_t index;
  std::string payload;
};

/**
 * @brief Received chunks keyed by index
 */
using ChunkMap = std::map<uint32_t, std::string>;

/**
 * @brief Split a message into fixed-size chunks
 *
 * Chunk 0 starts at offset 0; the last chunk may be shorter than
 * @p chunk_size. An empty message yields no chunks.
 *
 * @return ErrorCode::OK, or INVALID_ARGUMENT if @p chunk_size is 0
 */
ErrorCode split_message(const std::string& message, size_t chunk_size,
                        std::vector<Chunk>& out);

/**
 * @brief Concatenate chunks 0 .. total-1 in index order
 *
 * A missing index is the normal state of a transfer in progress.
 *
 * @return false if any index below @p total is missing (out untouched)
 */
bool reassemble_message(const ChunkMap& chunks, uint32_t total, std::string& out);

}  // namespace duolink
