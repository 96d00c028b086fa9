/**
 * @file errors.cpp
 * @brief Error code descriptions
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/protocol.hpp"

namespace duolink
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "duolink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace duolink
