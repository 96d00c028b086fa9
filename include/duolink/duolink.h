/**
 * @file duolink.h
 * @brief duolink C API
 *
 * C-compatible interface for the duolink transfer sessions.
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Default payload bytes per primary frame */
#define DUOLINK_DEFAULT_CHUNK_SIZE 500

  /** @brief Recommended primary-channel frames per second */
#define DUOLINK_DEFAULT_FRAME_RATE 15

  /** @brief Recommended backchannel tick interval in milliseconds */
#define DUOLINK_DEFAULT_ACK_INTERVAL_MS 2000

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) DUOLINK_ERR_##name = val,
#include "duolink/errors.def"
#undef ERR
  } duolink_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* duolink_strerror(duolink_error_t err);

  /* ========================================================================= */
  /* Session handles                                                           */
  /* ========================================================================= */

  /** @brief Opaque handle to a sending session */
  typedef struct DuolinkSender DuolinkSender;

  /** @brief Opaque handle to a receiving session */
  typedef struct DuolinkReceiver DuolinkReceiver;

  /**
   * @brief Channel write callback function type
   *
   * @param user User-defined context pointer
   * @param data Frame text (not NUL-terminated)
   * @param len  Frame length in bytes
   */
  typedef void (*duolink_write_fn)(void* user, const char* data, size_t len);

  /* ========================================================================= */
  /* Sender                                                                    */
  /* ========================================================================= */

  /**
   * @brief Create a sending session
   *
   * @param primary_write Primary-channel write callback
   * @param user          User context pointer (passed to primary_write)
   * @return Sender handle, or NULL on invalid argument or allocation failure
   */
  DuolinkSender* duolink_sender_create(duolink_write_fn primary_write, void* user);

  /**
   * @brief Destroy sending session
   * @param sender Sender handle (NULL-safe)
   */
  void duolink_sender_destroy(DuolinkSender* sender);

  /**
   * @brief Start sending a message
   *
   * @param sender     Sender handle
   * @param data       Message bytes
   * @param len        Message length
   * @param chunk_size Payload bytes per frame (0 selects the default)
   */
  duolink_error_t duolink_sender_send(DuolinkSender* sender, const char* data, size_t len,
                                      size_t chunk_size);

  /**
   * @brief Emit the frame for one primary-channel tick
   */
  duolink_error_t duolink_sender_tick(DuolinkSender* sender);

  /**
   * @brief Process one backchannel frame
   * @return 1 if the frame was valid, 0 otherwise
   */
  int duolink_sender_on_back_frame(DuolinkSender* sender, const char* data, size_t len);

  /** @brief 1 once every chunk is acknowledged */
  int duolink_sender_is_complete(const DuolinkSender* sender);

  /** @brief Chunk count of the current message */
  uint32_t duolink_sender_total(const DuolinkSender* sender);

  /** @brief Number of acknowledged chunks */
  uint32_t duolink_sender_acknowledged(const DuolinkSender* sender);

  /* ========================================================================= */
  /* Receiver                                                                  */
  /* ========================================================================= */

  /**
   * @brief Create a receiving session
   *
   * @param back_write Backchannel write callback
   * @param user       User context pointer (passed to back_write)
   * @return Receiver handle, or NULL on invalid argument or allocation failure
   */
  DuolinkReceiver* duolink_receiver_create(duolink_write_fn back_write, void* user);

  /**
   * @brief Destroy receiving session
   * @param receiver Receiver handle (NULL-safe)
   */
  void duolink_receiver_destroy(DuolinkReceiver* receiver);

  /**
   * @brief Process one primary-channel frame
   * @return 1 if the frame was valid, 0 otherwise
   */
  int duolink_receiver_on_primary_frame(DuolinkReceiver* receiver, const char* data, size_t len);

  /**
   * @brief Emit the acknowledgment for one backchannel tick
   */
  duolink_error_t duolink_receiver_on_ack_tick(DuolinkReceiver* receiver);

  /** @brief 1 once the message is reassembled and verified */
  int duolink_receiver_is_complete(const DuolinkReceiver* receiver);

  /** @brief Distinct chunks received */
  uint32_t duolink_receiver_received(const DuolinkReceiver* receiver);

  /** @brief Chunk count of the message being received */
  uint32_t duolink_receiver_total(const DuolinkReceiver* receiver);

  /**
   * @brief Copy the reassembled message
   *
   * @param receiver Receiver handle
   * @param buf      Destination buffer (may be NULL when cap is 0)
   * @param cap      Destination capacity
   * @return Full message length (0 while incomplete); at most cap bytes are copied
   */
  size_t duolink_receiver_message(const DuolinkReceiver* receiver, char* buf, size_t cap);

#ifdef __cplusplus
} /* extern "C" */
#endif
