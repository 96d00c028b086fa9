/**
 * @file checksum.cpp
 * @brief Message checksum implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/checksum.hpp"

#include "duolink/protocol.hpp"

namespace duolink
{

std::string compute_checksum(const uint8_t* data, size_t len)
{
  uint32_t hash = 0;

  for (size_t i = 0; i < len; ++i)
  {
    hash = (hash << 5) - hash + data[i];
  }

  // Magnitude of the signed 32-bit value
  const int64_t signed_hash = static_cast<int32_t>(hash);
  const uint64_t magnitude =
      static_cast<uint64_t>(signed_hash < 0 ? -signed_hash : signed_hash);

  static const char HEX[] = "0123456789abcdef";
  std::string result(CHECKSUM_LENGTH, '0');
  uint64_t value = magnitude;
  for (size_t i = CHECKSUM_LENGTH; i > 0 && value != 0; --i)
  {
    result[i - 1] = HEX[value & 0x0F];
    value >>= 4;
  }

  return result;
}

}  // namespace duolink
