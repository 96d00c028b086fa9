/**
 * @file bit_codec.hpp
 * @brief Fixed-width bit field codec
 *
 * Compiles an ordered list of named bit fields into a codec that packs a
 * Record into a big-endian bitstream (MSB first within each byte) and
 * unpacks it again.
 *
 * Schema text form:
 * @code
 * <flag:bool-1><count:num-3><type-4>
 * @endcode
 *
 * - bool: 1-bit boolean
 * - num:  unsigned integer, 1 to 8 bits (alias "uint")
 * - bits: raw '0'/'1' string (default when no kind is given, alias "raw")
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "duolink/protocol.hpp"

namespace duolink
{

/**
 * @brief Kind of a bit field
 */
enum class FieldKind : uint8_t
{
  BOOL,  // 1-bit boolean
  UINT,  // unsigned integer, up to MAX_UINT_FIELD_BITS
  RAW,   // raw bit string
};

/**
 * @brief One named field of a bit schema
 */
struct FieldSpec
{
  std::string name;
  FieldKind kind;
  uint32_t width;  ///< Width in bits
};

using FieldSchema = std::vector<FieldSpec>;

/**
 * @brief Value stored in a Record
 *
 * Only the member matching @c kind is meaningful.
 */
struct FieldValue
{
  FieldKind kind = FieldKind::RAW;
  bool flag = false;
  int64_t number = 0;
  std::string bits;

  bool operator==(const FieldValue& other) const;
  bool operator!=(const FieldValue& other) const
  {
    return !(*this == other);
  }
};

/**
 * @brief Field name to value mapping consumed by encode, produced by decode
 */
class Record
{
 public:
  void set_bool(const std::string& name, bool value);
  void set_uint(const std::string& name, int64_t value);
  void set_bits(const std::string& name, const std::string& bits);

  /**
   * @brief Look up a value
   * @return Pointer to the stored value, or nullptr if the field is absent
   */
  const FieldValue* find(const std::string& name) const;

  /**
   * @brief Typed getters
   * @return false if the field is absent or holds another kind
   */
  bool get_bool(const std::string& name, bool& out) const;
  bool get_uint(const std::string& name, int64_t& out) const;
  bool get_bits(const std::string& name, std::string& out) const;

  size_t size() const
  {
    return values_.size();
  }

  void clear()
  {
    values_.clear();
  }

  bool operator==(const Record& other) const
  {
    return values_ == other.values_;
  }
  bool operator!=(const Record& other) const
  {
    return !(*this == other);
  }

 private:
  std::map<std::string, FieldValue> values_;
};

/**
 * @brief Parse schema text into a field list
 *
 * @param pattern Schema text, e.g. "<flag:bool-1><count:num-3><type-4>"
 * @param out     Parsed fields (cleared first)
 * @return ErrorCode::OK, or INVALID_SCHEMA if the text is malformed
 */
ErrorCode parse_bit_schema(const std::string& pattern, FieldSchema& out);

/**
 * @brief Compiled bit field codec
 *
 * Immutable once compiled; safe to share between sessions.
 */
class BitCodec
{
 public:
  BitCodec();

  /**
   * @brief Compile a field list
   *
   * Fails with INVALID_WIDTH when a bool field is not 1 bit, a num field is
   * 0 or wider than MAX_UINT_FIELD_BITS, or a raw field is 0 bits wide;
   * with DUPLICATE_FIELD or INVALID_SCHEMA for repeated or empty names.
   *
   * @param schema Ordered field list
   * @param out    Compiled codec (unchanged on failure)
   */
  static ErrorCode compile(const FieldSchema& schema, BitCodec& out);

  /**
   * @brief Parse and compile schema text
   */
  static ErrorCode compile(const std::string& pattern, BitCodec& out);

  /**
   * @brief Encode a record
   *
   * Output length is ceil(total_bits / 8); unused trailing bits are zero.
   *
   * @param record Values for every schema field
   * @param out    Encoded bytes (unchanged on failure)
   * @return ErrorCode::OK or the first validation failure
   */
  ErrorCode encode(const Record& record, std::vector<uint8_t>& out) const;

  /**
   * @brief Decode bytes into a record
   *
   * Short input is a routine event on a lossy channel, not an error.
   *
   * @return false if @p len holds fewer bits than the schema needs
   */
  bool decode(const uint8_t* data, size_t len, Record& out) const;

  bool decode(const std::vector<uint8_t>& data, Record& out) const
  {
    return decode(data.data(), data.size(), out);
  }

  size_t total_bits() const
  {
    return total_bits_;
  }

  size_t total_bytes() const
  {
    return (total_bits_ + 7) / 8;
  }

  const FieldSchema& schema() const
  {
    return fields_;
  }

 private:
  FieldSchema fields_;
  std::vector<size_t> offsets_;  ///< Start bit of each field
  size_t total_bits_;
};

/**
 * @brief Render bytes as a '0'/'1' string, 8 characters per byte
 */
std::string to_binary_string(const uint8_t* data, size_t len);

/**
 * @brief Pack a '0'/'1' string into bytes, zero-padding the last byte
 * @return false if @p bits contains any other character
 */
bool from_binary_string(const std::string& bits, std::vector<uint8_t>& out);

}  // namespace duolink
