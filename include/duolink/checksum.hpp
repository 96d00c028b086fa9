/**
 * @file checksum.hpp
 * @brief Message checksum
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace duolink
{

/**
 * @brief Calculate the message checksum
 *
 * 32-bit rolling hash h = h * 31 + byte (two's complement wrap, initial
 * value 0). The magnitude of the signed result is rendered as lowercase
 * hex, zero-padded to CHECKSUM_LENGTH characters.
 *
 * Not a cryptographic digest; it only tells one message from another.
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return 8-character hex checksum
 */
std::string compute_checksum(const uint8_t* data, size_t len);

inline std::string compute_checksum(const std::string& message)
{
  return compute_checksum(reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

}  // namespace duolink
