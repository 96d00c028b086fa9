/**
 * @file receiver.cpp
 * @brief duolink receiving session implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/receiver.hpp"

#include <vector>

#include "duolink/checksum.hpp"
#include "frame.hpp"

namespace duolink
{

Receiver::Receiver(FrameWriteFn back_write, void* user)
    : back_write_(back_write),
      user_context_(user),
      chunks_(),
      received_(),
      awaiting_ack_(),
      total_(0),
      chunk_size_(0),
      last_size_(0),
      checksum_(),
      message_(),
      state_(State::IDLE)
{
}

bool Receiver::on_primary_frame(const std::string& frame, ReceiveProgress& progress)
{
  progress.has_chunk = false;
  progress.chunk_payload.clear();
  progress.message.clear();

  internal::PrimaryFrame packet;
  if (!internal::decode_primary_frame(frame, packet))
  {
    fill_progress(progress);
    return false;
  }

  if (!is_same_message(packet.checksum, packet.index, packet.total, packet.payload.size()))
  {
    start_message(packet.checksum, packet.total);
  }

  const bool is_new = received_.count(packet.index) == 0;
  if (is_new)
  {
    if (packet.index + 1 == total_)
    {
      last_size_ = packet.payload.size();
    }
    else
    {
      chunk_size_ = packet.payload.size();
    }

    chunks_[packet.index] = packet.payload;
    received_.insert(packet.index);

    progress.has_chunk = true;
    progress.chunk_index = packet.index;
    progress.chunk_payload = packet.payload;
  }

  // Duplicates re-arm too: the previous acknowledgment may have been lost
  awaiting_ack_.insert(packet.index);

  if (is_new && state_ != State::COMPLETE && received_.size() == total_)
  {
    complete_message();
    if (state_ == State::COMPLETE)
    {
      progress.message = message_;
    }
  }

  fill_progress(progress);
  return true;
}

ErrorCode Receiver::next_ack_frame(std::string& out)
{
  out.clear();

  if (awaiting_ack_.empty())
  {
    return ErrorCode::OK;
  }

  std::vector<AckRange> ranges;
  schedule_ack_ranges(received_, awaiting_ack_, total_, ranges);
  awaiting_ack_.clear();

  if (ranges.empty())
  {
    return ErrorCode::OK;
  }

  const ErrorCode err = internal::encode_back_frame(ranges, out);
  if (err != ErrorCode::OK)
  {
    out.clear();
  }
  return err;
}

ErrorCode Receiver::on_ack_tick()
{
  std::string frame;
  const ErrorCode err = next_ack_frame(frame);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!frame.empty() && back_write_ != nullptr)
  {
    back_write_(user_context_, frame.data(), frame.size());
  }
  return ErrorCode::OK;
}

void Receiver::reset()
{
  chunks_.clear();
  received_.clear();
  awaiting_ack_.clear();
  total_ = 0;
  chunk_size_ = 0;
  last_size_ = 0;
  checksum_.clear();
  message_.clear();
  state_ = State::IDLE;
}

void Receiver::dispose()
{
  reset();
  back_write_ = nullptr;
  user_context_ = nullptr;
}

bool Receiver::is_same_message(const std::string& checksum, uint32_t index, uint32_t total,
                               size_t length) const
{
  if (state_ == State::IDLE || checksum != checksum_ || total != total_)
  {
    return false;
  }

  // Same message split with another chunk size: chunk lengths disagree
  if (index + 1 == total)
  {
    return (last_size_ == 0 || length == last_size_) && (chunk_size_ == 0 || length <= chunk_size_);
  }
  return (chunk_size_ == 0 || length == chunk_size_) && last_size_ <= length;
}

void Receiver::start_message(const std::string& checksum, uint32_t total)
{
  reset();
  checksum_ = checksum;
  total_ = total;
  state_ = State::RECEIVING;
}

void Receiver::complete_message()
{
  std::string message;
  if (!reassemble_message(chunks_, total_, message))
  {
    return;
  }

  if (compute_checksum(message) != checksum_)
  {
    // Corrupted chunk; everything held is suspect
    chunks_.clear();
    received_.clear();
    chunk_size_ = 0;
    last_size_ = 0;
    return;
  }

  message_.swap(message);
  state_ = State::COMPLETE;
}

void Receiver::fill_progress(ReceiveProgress& progress) const
{
  progress.received = received_.size();
  progress.total = total_;
  progress.is_complete = state_ == State::COMPLETE;
  progress.checksum = checksum_;
}

}  // namespace duolink
