/**
 * @file receiver.hpp
 * @brief duolink receiving session
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "duolink/ack_ranges.hpp"
#include "duolink/chunker.hpp"
#include "duolink/protocol.hpp"

namespace duolink
{

/**
 * @brief Progress reported for each decoded primary frame
 */
struct ReceiveProgress
{
  bool has_chunk = false;     ///< The frame carried a chunk not seen before
  uint32_t chunk_index = 0;   ///< Index of that chunk
  std::string chunk_payload;  ///< Payload of that chunk

  size_t received = 0;  ///< Distinct chunks held
  uint32_t total = 0;   ///< Chunk count of the message
  bool is_complete = false;
  std::string message;   ///< Reassembled message, set only by the completing frame
  std::string checksum;  ///< Checksum of the message being received
};

/**
 * @brief Receiving end of a transfer
 *
 * Frames are pushed in as the primary channel decodes them; an independent,
 * slower timer calls on_ack_tick() to send acknowledgments.
 *
 * Every decoded frame, duplicate or not, marks its index for the next
 * acknowledgment. A lost backchannel frame is thus repaired by the
 * sender's re-broadcast of the same chunk.
 *
 * A frame that does not belong to the tracked message starts a new one and
 * all chunks are discarded. That is the case when its checksum or total
 * differs, or when its payload length shows the message was split with
 * another chunk size.
 */
class Receiver
{
 public:
  /**
   * @brief Receiver lifecycle
   */
  enum class State
  {
    IDLE,       // No frame seen
    RECEIVING,  // Chunks missing
    COMPLETE,   // Message reassembled and verified
  };

  /**
   * @brief Construct Receiver instance
   *
   * @param back_write Callback for backchannel frames (nullptr when only
   *                   next_ack_frame() is used)
   * @param user       User context pointer passed to callback
   */
  explicit Receiver(FrameWriteFn back_write = nullptr, void* user = nullptr);

  /**
   * @brief Process one primary-channel frame
   *
   * @param frame    Frame text as decoded by the transport
   * @param progress Filled with the state after this frame
   * @return false if the frame is malformed (it is ignored)
   */
  bool on_primary_frame(const std::string& frame, ReceiveProgress& progress);

  /**
   * @brief Build the acknowledgment for every index awaiting one
   *
   * Clears the awaiting set.
   *
   * @param out Encoded backchannel frame; empty when nothing awaits
   */
  ErrorCode next_ack_frame(std::string& out);

  /**
   * @brief next_ack_frame() and hand the frame to the write callback
   */
  ErrorCode on_ack_tick();

  /**
   * @brief Drop all chunks and return to IDLE
   */
  void reset();

  /**
   * @brief Drop all chunks and detach the write callback
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
    return total_;
  }

  const IndexSet& received() const
  {
    return received_;
  }

  const IndexSet& awaiting_ack() const
  {
    return awaiting_ack_;
  }

  const std::string& message() const
  {
    return message_;
  }

  const std::string& checksum() const
  {
    return checksum_;
  }

 private:
  bool is_same_message(const std::string& checksum, uint32_t index, uint32_t total,
                       size_t length) const;
  void start_message(const std::string& checksum, uint32_t total);
  void complete_message();
  void fill_progress(ReceiveProgress& progress) const;

  FrameWriteFn back_write_;  ///< Backchannel write callback
  void* user_context_;       ///< User context for callback

  ChunkMap chunks_;        ///< Payloads by index
  IndexSet received_;      ///< Every index received
  IndexSet awaiting_ack_;  ///< Indices to acknowledge on the next tick
  uint32_t total_;         ///< Chunk count of the message
  size_t chunk_size_;      ///< Payload length of non-final chunks, 0 if unseen
  size_t last_size_;       ///< Payload length of the final chunk, 0 if unseen
  std::string checksum_;   ///< Checksum announced by the sender
  std::string message_;    ///< Reassembled message
  State state_;
};

}  // namespace duolink
