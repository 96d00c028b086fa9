/**
 * @file session_c_api.cpp
 * @brief duolink C API implementation
 *
 * C wrapper for the C++ Sender and Receiver classes.
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>
#include <string>

#include "duolink/duolink.h"
#include "duolink/receiver.hpp"
#include "duolink/sender.hpp"

using namespace duolink;

/* ========================================================================= */
/* Internal wrapper structures                                               */
/* ========================================================================= */

struct DuolinkSender
{
  Sender session;

  DuolinkSender(duolink_write_fn write_fn, void* user_ctx) : session(write_fn, user_ctx) {}
};

struct DuolinkReceiver
{
  Receiver session;

  DuolinkReceiver(duolink_write_fn write_fn, void* user_ctx) : session(write_fn, user_ctx) {}
};

namespace
{

inline duolink_error_t to_c_error(ErrorCode err)
{
  return static_cast<duolink_error_t>(err);
}

}  // namespace

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* duolink_strerror(duolink_error_t err)
{
  return error_message(static_cast<ErrorCode>(err));
}

/* ========================================================================= */
/* Sender                                                                    */
/* ========================================================================= */

DuolinkSender* duolink_sender_create(duolink_write_fn primary_write, void* user)
{
  if (primary_write == nullptr)
  {
    return nullptr;
  }

  return new (std::nothrow) DuolinkSender(primary_write, user);
}

void duolink_sender_destroy(DuolinkSender* sender)
{
  delete sender;
}

duolink_error_t duolink_sender_send(DuolinkSender* sender, const char* data, size_t len,
                                    size_t chunk_size)
{
  if (sender == nullptr || (data == nullptr && len > 0))
  {
    return DUOLINK_ERR_INVALID_ARGUMENT;
  }

  if (chunk_size == 0)
  {
    chunk_size = DUOLINK_DEFAULT_CHUNK_SIZE;
  }

  const std::string message = len > 0 ? std::string(data, len) : std::string();
  return to_c_error(sender->session.send(message, chunk_size));
}

duolink_error_t duolink_sender_tick(DuolinkSender* sender)
{
  if (sender == nullptr)
  {
    return DUOLINK_ERR_INVALID_ARGUMENT;
  }

  SendProgress progress;
  return to_c_error(sender->session.tick(progress));
}

int duolink_sender_on_back_frame(DuolinkSender* sender, const char* data, size_t len)
{
  if (sender == nullptr || data == nullptr)
  {
    return 0;
  }
  return sender->session.on_back_frame(std::string(data, len)) ? 1 : 0;
}

int duolink_sender_is_complete(const DuolinkSender* sender)
{
  return (sender && sender->session.is_complete()) ? 1 : 0;
}

uint32_t duolink_sender_total(const DuolinkSender* sender)
{
  return sender ? sender->session.total() : 0;
}

uint32_t duolink_sender_acknowledged(const DuolinkSender* sender)
{
  return sender ? static_cast<uint32_t>(sender->session.acknowledged().size()) : 0;
}

/* ========================================================================= */
/* Receiver                                                                  */
/* ========================================================================= */

DuolinkReceiver* duolink_receiver_create(duolink_write_fn back_write, void* user)
{
  if (back_write == nullptr)
  {
    return nullptr;
  }

  return new (std::nothrow) DuolinkReceiver(back_write, user);
}

void duolink_receiver_destroy(DuolinkReceiver* receiver)
{
  delete receiver;
}

int duolink_receiver_on_primary_frame(DuolinkReceiver* receiver, const char* data, size_t len)
{
  if (receiver == nullptr || data == nullptr)
  {
    return 0;
  }

  ReceiveProgress progress;
  return receiver->session.on_primary_frame(std::string(data, len), progress) ? 1 : 0;
}

duolink_error_t duolink_receiver_on_ack_tick(DuolinkReceiver* receiver)
{
  if (receiver == nullptr)
  {
    return DUOLINK_ERR_INVALID_ARGUMENT;
  }
  return to_c_error(receiver->session.on_ack_tick());
}

int duolink_receiver_is_complete(const DuolinkReceiver* receiver)
{
  return (receiver && receiver->session.is_complete()) ? 1 : 0;
}

uint32_t duolink_receiver_received(const DuolinkReceiver* receiver)
{
  return receiver ? static_cast<uint32_t>(receiver->session.received().size()) : 0;
}

uint32_t duolink_receiver_total(const DuolinkReceiver* receiver)
{
  return receiver ? receiver->session.total() : 0;
}

size_t duolink_receiver_message(const DuolinkReceiver* receiver, char* buf, size_t cap)
{
  if (receiver == nullptr || !receiver->session.is_complete())
  {
    return 0;
  }

  const std::string& message = receiver->session.message();
  if (buf != nullptr && cap > 0)
  {
    std::memcpy(buf, message.data(), message.size() < cap ? message.size() : cap);
  }
  return message.size();
}
