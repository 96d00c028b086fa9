/**
 * @file protocol.hpp
 * @brief duolink protocol definitions
 *
 * Chunked transfer protocol over two one-way lossy channels: a primary
 * channel (sender to receiver) and a narrow backchannel (receiver to
 * sender) used only for acknowledgments.
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace duolink
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Primary-channel frame template
 *
 * [QRTPB][INDEX]/[TOTAL]:[CHECKSUM]$[PAYLOAD]
 *
 * - QRTPB:    literal tag
 * - INDEX:    decimal chunk index (0 <= INDEX < TOTAL)
 * - TOTAL:    decimal chunk count of the message
 * - CHECKSUM: 8 hex characters, checksum of the whole message
 * - PAYLOAD:  chunk bytes, everything after the first '$'
 *
 * Example: "QRTPB0/4:00017862$abc"
 */
constexpr const char* PRIMARY_FRAME_TEMPLATE = "QRTPB<index:num>/<total:num>:<checksum:text-8>";

/**
 * @brief Backchannel frame template
 *
 * [QB][START;END;START;END...]
 *
 * Each pair is one acknowledged range, inclusive. START > END denotes a
 * range that wraps past the last chunk index back to 0.
 *
 * Example: "QB8;1;4;5" acknowledges 8, 9, 0, 1, 4, 5 of a 10-chunk message
 */
constexpr const char* BACK_FRAME_TEMPLATE = "QB<ranges:numPairs>";

/**
 * @brief Separator between a text frame header and its payload
 */
constexpr char PAYLOAD_DELIMITER = '$';

/**
 * @brief Length of a message checksum in characters
 */
constexpr size_t CHECKSUM_LENGTH = 8;

/* ========================================================================= */
/* Session defaults                                                          */
/* ========================================================================= */

/**
 * @brief Default chunk size in bytes
 *
 * Sized so one primary frame fits a medium-density QR symbol.
 */
constexpr size_t DEFAULT_CHUNK_SIZE = 500;

/**
 * @brief Recommended primary-channel tick rate (frames per second)
 */
constexpr uint32_t DEFAULT_FRAME_RATE = 15;

/**
 * @brief Recommended backchannel tick interval in milliseconds
 *
 * Much slower than the primary cadence because the backchannel carries
 * only a few bytes per second.
 */
constexpr uint32_t DEFAULT_ACK_INTERVAL_MS = 2000;

/**
 * @brief Widest unsigned field supported by the bit codec
 */
constexpr uint32_t MAX_UINT_FIELD_BITS = 8;

/* ========================================================================= */
/* Transport                                                                 */
/* ========================================================================= */

/**
 * @brief Channel write callback function type
 *
 * User-provided function handing one encoded frame to the physical
 * transport (QR display, audio modem, ...). Must not block.
 *
 * @param user User context pointer passed during construction
 * @param data Frame text (not NUL-terminated)
 * @param len  Frame length in bytes
 */
using FrameWriteFn = void (*)(void* user, const char* data, size_t len);

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Error codes returned by codec compile/encode and session setup
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "duolink/errors.def"
#undef ERR
};

/**
 * @brief Get a static description of an error code
 */
const char* error_message(ErrorCode code);

}  // namespace duolink
