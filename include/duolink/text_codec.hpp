/**
 * @file text_codec.hpp
 * @brief Delimited text field codec
 *
 * Companion to the bit codec for frames whose fields are data-dependent in
 * length (chunk payloads, acknowledgment range lists). A template mixes
 * literal text with placeholders:
 *
 * @code
 * QRTPB<index:num>/<total:num>:<checksum:text-8>
 * QB<ranges:numPairs>
 * @endcode
 *
 * Placeholder types:
 * - text:     free text (default type)
 * - num:      non-negative decimal integer
 * - bool:     "true" / "false"
 * - list:     comma-separated strings
 * - nums:     comma-separated non-negative integers
 * - pairs:    semicolon-separated strings read as pairs, "k;v;k;v"
 * - numPairs: semicolon-separated integers read as pairs, "0;3;5;7"
 * - enum[a,b,...]: one of the listed values, sent as a single letter
 *                  ('a' for the first value, 'b' for the second, ...)
 *
 * "-N" after text or num makes the field fixed width (text is padded with
 * spaces on the right, num with zeros on the left). After list or nums it
 * makes every item N characters wide, concatenated without separators.
 *
 * Every record may carry a free payload, appended after PAYLOAD_DELIMITER.
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "duolink/protocol.hpp"

namespace duolink
{

/**
 * @brief Kind of a text field
 */
enum class TextKind : uint8_t
{
  TEXT,
  NUM,
  BOOL,
  LIST,
  NUMS,
  PAIRS,
  NUM_PAIRS,
  ENUM,
};

using NumPair = std::pair<int64_t, int64_t>;
using TextPair = std::pair<std::string, std::string>;

/**
 * @brief One placeholder of a text template
 */
struct TextFieldSpec
{
  std::string name;
  TextKind kind;
  uint32_t width;  ///< Fixed width in characters (per item for lists), 0 for none
  std::vector<std::string> options;  ///< Values of an enum field
};

/**
 * @brief Value stored in a TextRecord
 *
 * Only the member matching @c kind is meaningful; an enum value is kept in
 * @c text.
 */
struct TextValue
{
  TextKind kind = TextKind::TEXT;
  std::string text;
  int64_t number = 0;
  bool flag = false;
  std::vector<std::string> items;
  std::vector<int64_t> nums;
  std::vector<TextPair> text_pairs;
  std::vector<NumPair> pairs;

  bool operator==(const TextValue& other) const;
  bool operator!=(const TextValue& other) const
  {
    return !(*this == other);
  }
};

/**
 * @brief Field name to value mapping plus an optional payload
 */
class TextRecord
{
 public:
  void set_text(const std::string& name, const std::string& value);
  void set_num(const std::string& name, int64_t value);
  void set_bool(const std::string& name, bool value);
  void set_list(const std::string& name, const std::vector<std::string>& items);
  void set_nums(const std::string& name, const std::vector<int64_t>& values);
  void set_pairs(const std::string& name, const std::vector<TextPair>& pairs);
  void set_num_pairs(const std::string& name, const std::vector<NumPair>& pairs);
  void set_enum(const std::string& name, const std::string& value);

  const TextValue* find(const std::string& name) const;

  bool get_text(const std::string& name, std::string& out) const;
  bool get_num(const std::string& name, int64_t& out) const;
  bool get_bool(const std::string& name, bool& out) const;
  bool get_list(const std::string& name, std::vector<std::string>& out) const;
  bool get_nums(const std::string& name, std::vector<int64_t>& out) const;
  bool get_pairs(const std::string& name, std::vector<TextPair>& out) const;
  bool get_num_pairs(const std::string& name, std::vector<NumPair>& out) const;
  bool get_enum(const std::string& name, std::string& out) const;

  void set_payload(const std::string& payload)
  {
    payload_ = payload;
  }

  const std::string& payload() const
  {
    return payload_;
  }

  void clear()
  {
    values_.clear();
    payload_.clear();
  }

  bool operator==(const TextRecord& other) const
  {
    return values_ == other.values_ && payload_ == other.payload_;
  }
  bool operator!=(const TextRecord& other) const
  {
    return !(*this == other);
  }

 private:
  std::map<std::string, TextValue> values_;
  std::string payload_;
};

/**
 * @brief Compiled text template codec
 */
class TextCodec
{
 public:
  TextCodec() = default;

  /**
   * @brief Compile a template
   *
   * Two delimited fields must be separated by literal text; literals may
   * not contain PAYLOAD_DELIMITER. Fixed-width text, fixed-width num and
   * enum fields have a known length and need no separator.
   *
   * @return ErrorCode::OK, INVALID_SCHEMA, INVALID_WIDTH or DUPLICATE_FIELD
   */
  static ErrorCode compile(const std::string& tmpl, TextCodec& out);

  /**
   * @brief Encode a record to text
   * @param out Encoded text (unchanged on failure)
   */
  ErrorCode encode(const TextRecord& record, std::string& out) const;

  /**
   * @brief Decode text
   * @return false if the text does not match the template
   */
  bool decode(const std::string& input, TextRecord& out) const;

  const std::vector<TextFieldSpec>& fields() const
  {
    return fields_;
  }

 private:
  std::vector<std::string> literals_;  ///< fields_.size() + 1 entries
  std::vector<TextFieldSpec> fields_;
};

}  // namespace duolink
