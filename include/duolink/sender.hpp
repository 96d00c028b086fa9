/**
 * @file sender.hpp
 * @brief duolink sending session
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
#include "duolink/chunker.hpp"
#include "duolink/protocol.hpp"

namespace duolink
{

/**
 * @brief Progress reported for each emitted primary frame
 */
struct SendProgress
{
  uint32_t index = 0;        ///< Chunk carried by the frame
  uint32_t total = 0;        ///< Chunk count of the message
  size_t acknowledged = 0;   ///< Chunks confirmed over the backchannel
  bool is_complete = false;  ///< Every chunk acknowledged
};

/**
 * @brief Sending end of a transfer
 *
 * Re-broadcasts every unacknowledged chunk round-robin, one frame per
 * primary-channel tick, until the backchannel has confirmed them all.
 * There are no retry counters or timeouts.
 *
 * Example usage:
 * @code
 * void show_frame(void* user, const char* data, size_t len) {
 *   qr_display(data, len);  // Platform-specific transport
 * }
 *
 * Sender sender(show_frame);
 * sender.send(message);
 *
 * // Every 1000 / DEFAULT_FRAME_RATE ms
 * SendProgress progress;
 * sender.tick(progress);
 *
 * // Whenever the audio modem decodes a message
 * sender.on_back_frame(text);
 * @endcode
 */
class Sender
{
 public:
  /**
   * @brief Sender lifecycle
   */
  enum class State
  {
    IDLE,      // No message
    SENDING,   // Unacknowledged chunks remain
    COMPLETE,  // Every chunk acknowledged
  };

  /**
   * @brief Construct Sender instance
   *
   * @param primary_write Callback for primary-channel frames (nullptr when
   *                      only next_frame() is used)
   * @param user          User context pointer passed to callback
   */
  explicit Sender(FrameWriteFn primary_write = nullptr, void* user = nullptr);

  /**
   * @brief Start sending a new message
   *
   * Discards the previous message and its acknowledgments. An empty
   * message is complete immediately.
   *
   * @param message    Bytes to transfer
   * @param chunk_size Payload bytes per frame
   * @return ErrorCode::OK, or INVALID_ARGUMENT if @p chunk_size is 0
   */
  ErrorCode send(const std::string& message, size_t chunk_size = DEFAULT_CHUNK_SIZE);

  /**
   * @brief Produce the frame for this primary tick
   *
   * Picks the first unacknowledged index at or after the round-robin
   * cursor, wrapping around, and moves the cursor past it.
   *
   * @param out      Encoded frame; left empty when there is nothing to send
   * @param progress Filled with the state after this frame
   */
  ErrorCode next_frame(std::string& out, SendProgress& progress);

  /**
   * @brief next_frame() and hand the frame to the write callback
   */
  ErrorCode tick(SendProgress& progress);

  /**
   * @brief Mark chunks acknowledged
   *
   * Indices outside the current message are ignored.
   */
  void apply_ack(const std::vector<AckRange>& ranges);

  /**
   * @brief Process one backchannel frame
   *
   * @return false if the frame is malformed (it is ignored)
   */
  bool on_back_frame(const std::string& frame);

  /**
   * @brief Drop the message and return to IDLE
   */
  void reset();

  /**
   * @brief Drop the message and detach the write callback
   */
  void dispose();

  State state() const
  {
    return state_;
  }

  bool is_complete() const
  {
    return state_ == State::COMPLETE;
  }

  uint32_t total() const
  {
    return static_cast<uint32_t>(chunks_.size());
  }

  const IndexSet& acknowledged() const
  {
    return acknowledged_;
  }

  const std::string& checksum() const
  {
    return checksum_;
  }

 private:
  void fill_progress(uint32_t index, SendProgress& progress) const;

  FrameWriteFn primary_write_;  ///< Primary channel write callback
  void* user_context_;          ///< User context for callback

  std::vector<Chunk> chunks_;  ///< Chunks of the current message
  IndexSet acknowledged_;      ///< Indices confirmed by the receiver
  uint32_t cursor_;            ///< Next index to consider
  std::string checksum_;       ///< Checksum of the current message
  State state_;
};

}  // namespace duolink
