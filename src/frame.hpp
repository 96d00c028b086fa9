/**
 * @file frame.hpp
 * @brief Wire frame encoding/decoding utilities (internal)
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "duolink/ack_ranges.hpp"
#include "duolink/protocol.hpp"

namespace duolink
{
namespace internal
{

/**
 * @brief Decoded primary-channel frame
 */
struct PrimaryFrame
{
  uint32_t index;
  uint32_t total;
  std::string checksum;  ///< Checksum of the whole message
  std::string payload;   ///< Chunk bytes
};

/**
 * @brief Encode a primary-channel frame
 *
 * Generates: QRTPB[INDEX]/[TOTAL]:[CHECKSUM]$[PAYLOAD]
 *
 * @param frame Frame fields
 * @param out   Encoded frame text
 * @return ErrorCode::OK, or the codec error for an invalid field
 */
ErrorCode encode_primary_frame(const PrimaryFrame& frame, std::string& out);

/**
 * @brief Decode a primary-channel frame
 *
 * Besides template mismatches, rejects frames with a zero total, an index
 * outside the total, a checksum that is not CHECKSUM_LENGTH characters, or
 * no payload.
 *
 * @return true if @p text is a valid frame
 */
bool decode_primary_frame(const std::string& text, PrimaryFrame& out);

/**
 * @brief Encode a backchannel acknowledgment frame
 *
 * Generates: QB[START];[END];[START];[END]...
 */
ErrorCode encode_back_frame(const std::vector<AckRange>& ranges, std::string& out);

/**
 * @brief Decode a backchannel acknowledgment frame
 * @return true if @p text is a valid frame
 */
bool decode_back_frame(const std::string& text, std::vector<AckRange>& out);

}  // namespace internal
}  // namespace duolink
