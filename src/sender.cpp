/**
 * @file sender.cpp
 * @brief duolink sending session implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/sender.hpp"

#include "duolink/checksum.hpp"
#include "frame.hpp"

namespace duolink
{

Sender::Sender(FrameWriteFn primary_write, void* user)
    : primary_write_(primary_write),
      user_context_(user),
      chunks_(),
      acknowledged_(),
      cursor_(0),
      checksum_(),
      state_(State::IDLE)
{
}

ErrorCode Sender::send(const std::string& message, size_t chunk_size)
{
  std::vector<Chunk> chunks;
  const ErrorCode err = split_message(message, chunk_size, chunks);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  chunks_.swap(chunks);
  acknowledged_.clear();
  cursor_ = 0;
  checksum_ = compute_checksum(message);
  state_ = chunks_.empty() ? State::COMPLETE : State::SENDING;
  return ErrorCode::OK;
}

ErrorCode Sender::next_frame(std::string& out, SendProgress& progress)
{
  out.clear();

  if (state_ != State::SENDING)
  {
    fill_progress(0, progress);
    return ErrorCode::OK;
  }

  const uint32_t total = this->total();
  if (acknowledged_.size() >= total)
  {
    state_ = State::COMPLETE;
    fill_progress(0, progress);
    return ErrorCode::OK;
  }

  // Skip acknowledged indices, wrapping around
  uint32_t index = cursor_ % total;
  while (acknowledged_.count(index) != 0)
  {
    index = (index + 1) % total;
  }

  internal::PrimaryFrame frame;
  frame.index = index;
  frame.total = total;
  frame.checksum = checksum_;
  frame.payload = chunks_[index].payload;

  const ErrorCode err = internal::encode_primary_frame(frame, out);
  if (err != ErrorCode::OK)
  {
    out.clear();
    return err;
  }

  cursor_ = (index + 1) % total;
  fill_progress(index, progress);
  return ErrorCode::OK;
}

ErrorCode Sender::tick(SendProgress& progress)
{
  std::string frame;
  const ErrorCode err = next_frame(frame, progress);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!frame.empty() && primary_write_ != nullptr)
  {
    primary_write_(user_context_, frame.data(), frame.size());
  }
  return ErrorCode::OK;
}

void Sender::apply_ack(const std::vector<AckRange>& ranges)
{
  if (state_ == State::IDLE)
  {
    return;
  }

  expand_ack_ranges(ranges, total(), acknowledged_);

  if (acknowledged_.size() >= total())
  {
    state_ = State::COMPLETE;
  }
}

bool Sender::on_back_frame(const std::string& frame)
{
  std::vector<AckRange> ranges;
  if (!internal::decode_back_frame(frame, ranges))
  {
    return false;
  }

  apply_ack(ranges);
  return true;
}

void Sender::reset()
{
  chunks_.clear();
  acknowledged_.clear();
  cursor_ = 0;
  checksum_.clear();
  state_ = State::IDLE;
}

void Sender::dispose()
{
  reset();
  primary_write_ = nullptr;
  user_context_ = nullptr;
}

void Sender::fill_progress(uint32_t index, SendProgress& progress) const
{
  progress.index = index;
  progress.total = total();
  progress.acknowledged = acknowledged_.size();
  progress.is_complete = state_ == State::COMPLETE;
}

}  // namespace duolink
