/**
 * @file text_codec.cpp
 * @brief Delimited text field codec implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/text_codec.hpp"

#include <set>

namespace duolink
{

namespace
{

constexpr char LIST_DELIMITER = ',';
constexpr char PAIR_DELIMITER = ';';

/* Longest decimal accepted for a number (fits int64_t). */
constexpr size_t MAX_NUM_DIGITS = 18;

/* Enum values are sent as 'a' .. 'z'. */
constexpr size_t MAX_ENUM_VALUES = 26;
constexpr char ENUM_FIRST = 'a';
constexpr const char* ENUM_PREFIX = "enum[";

bool parse_kind(const std::string& text, TextKind& out)
{
  if (text == "text")
  {
    out = TextKind::TEXT;
  }
  else if (text == "num")
  {
    out = TextKind::NUM;
  }
  else if (text == "bool")
  {
    out = TextKind::BOOL;
  }
  else if (text == "list")
  {
    out = TextKind::LIST;
  }
  else if (text == "nums")
  {
    out = TextKind::NUMS;
  }
  else if (text == "pairs")
  {
    out = TextKind::PAIRS;
  }
  else if (text == "numPairs")
  {
    out = TextKind::NUM_PAIRS;
  }
  else
  {
    return false;
  }
  return true;
}

bool parse_number(const std::string& text, int64_t& out)
{
  if (text.empty() || text.size() > MAX_NUM_DIGITS)
  {
    return false;
  }

  int64_t value = 0;
  for (const char c : text)
  {
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + (c - '0');
  }

  out = value;
  return true;
}

/* Split on a delimiter; an empty string yields no items. */
std::vector<std::string> split(const std::string& text, char delim)
{
  std::vector<std::string> items;
  if (text.empty())
  {
    return items;
  }

  size_t start = 0;
  while (true)
  {
    const size_t next = text.find(delim, start);
    if (next == std::string::npos)
    {
      items.push_back(text.substr(start));
      break;
    }
    items.push_back(text.substr(start, next - start));
    start = next + 1;
  }
  return items;
}

/* Characters a field occupies in the header, 0 when delimited. */
size_t span_width(const TextFieldSpec& field)
{
  if (field.kind == TextKind::ENUM)
  {
    return 1;
  }
  if (field.kind == TextKind::TEXT || field.kind == TextKind::NUM)
  {
    return field.width;
  }
  return 0;
}

/* "enum[low,mid,high]" */
ErrorCode parse_enum_options(const std::string& type, std::vector<std::string>& out)
{
  const std::string prefix(ENUM_PREFIX);
  if (type.size() <= prefix.size() || type.back() != ']')
  {
    return ErrorCode::INVALID_SCHEMA;
  }

  const std::vector<std::string> options =
      split(type.substr(prefix.size(), type.size() - prefix.size() - 1), LIST_DELIMITER);
  if (options.empty() || options.size() > MAX_ENUM_VALUES)
  {
    return ErrorCode::INVALID_SCHEMA;
  }

  std::set<std::string> seen;
  for (const std::string& option : options)
  {
    if (option.empty() || !seen.insert(option).second)
    {
      return ErrorCode::INVALID_SCHEMA;
    }
  }

  out = options;
  return ErrorCode::OK;
}

/* Cut fixed-width items; false unless the text is a whole number of items. */
bool split_fixed(const std::string& text, uint32_t width, std::vector<std::string>& out)
{
  if (text.size() % width != 0)
  {
    return false;
  }

  out.clear();
  for (size_t pos = 0; pos < text.size(); pos += width)
  {
    out.push_back(text.substr(pos, width));
  }
  return true;
}

std::string trim_padding(const std::string& text)
{
  const size_t end = text.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

bool parse_bool(const std::string& text, bool& out)
{
  std::string lower(text);
  for (char& c : lower)
  {
    if (c >= 'A' && c <= 'Z')
    {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }

  if (lower == "true")
  {
    out = true;
    return true;
  }
  if (lower == "false")
  {
    out = false;
    return true;
  }
  return false;
}

bool parse_value(const TextFieldSpec& field, const std::string& text, TextRecord& out)
{
  switch (field.kind)
  {
    case TextKind::TEXT:
      out.set_text(field.name, field.width > 0 ? trim_padding(text) : text);
      return true;

    case TextKind::NUM:
    {
      int64_t value = 0;
      if (!parse_number(text, value))
      {
        return false;
      }
      out.set_num(field.name, value);
      return true;
    }

    case TextKind::BOOL:
    {
      bool value = false;
      if (!parse_bool(text, value))
      {
        return false;
      }
      out.set_bool(field.name, value);
      return true;
    }

    case TextKind::LIST:
    {
      std::vector<std::string> items;
      if (field.width == 0)
      {
        items = split(text, LIST_DELIMITER);
      }
      else
      {
        if (!split_fixed(text, field.width, items))
        {
          return false;
        }
        for (std::string& item : items)
        {
          item = trim_padding(item);
        }
      }
      out.set_list(field.name, items);
      return true;
    }

    case TextKind::NUMS:
    {
      std::vector<std::string> items;
      if (field.width == 0)
      {
        items = split(text, LIST_DELIMITER);
      }
      else if (!split_fixed(text, field.width, items))
      {
        return false;
      }

      std::vector<int64_t> values;
      for (const std::string& item : items)
      {
        int64_t value = 0;
        if (!parse_number(item, value))
        {
          return false;
        }
        values.push_back(value);
      }
      out.set_nums(field.name, values);
      return true;
    }

    case TextKind::PAIRS:
    {
      const std::vector<std::string> items = split(text, PAIR_DELIMITER);
      if (items.size() % 2 != 0)
      {
        return false;
      }

      std::vector<TextPair> pairs;
      for (size_t i = 0; i < items.size(); i += 2)
      {
        pairs.emplace_back(items[i], items[i + 1]);
      }
      out.set_pairs(field.name, pairs);
      return true;
    }

    case TextKind::NUM_PAIRS:
    {
      const std::vector<std::string> items = split(text, PAIR_DELIMITER);
      if (items.size() % 2 != 0)
      {
        return false;
      }

      std::vector<NumPair> pairs;
      for (size_t i = 0; i < items.size(); i += 2)
      {
        NumPair pair;
        if (!parse_number(items[i], pair.first) || !parse_number(items[i + 1], pair.second))
        {
          return false;
        }
        pairs.push_back(pair);
      }
      out.set_num_pairs(field.name, pairs);
      return true;
    }

    case TextKind::ENUM:
    {
      if (text.size() != 1 || text[0] < ENUM_FIRST)
      {
        return false;
      }
      const size_t index = static_cast<size_t>(text[0] - ENUM_FIRST);
      if (index >= field.options.size())
      {
        return false;
      }
      out.set_enum(field.name, field.options[index]);
      return true;
    }
  }
  return false;
}

ErrorCode format_number(int64_t value, uint32_t width, std::string& out)
{
  if (value < 0)
  {
    return ErrorCode::VALUE_OUT_OF_RANGE;
  }

  std::string digits = std::to_string(value);
  if (width > 0)
  {
    if (digits.size() > width)
    {
      return ErrorCode::VALUE_TOO_WIDE;
    }
    digits.insert(0, width - digits.size(), '0');
  }

  out += digits;
  return ErrorCode::OK;
}

ErrorCode format_value(const TextFieldSpec& field, const TextValue& value, std::string& out)
{
  switch (field.kind)
  {
    case TextKind::TEXT:
      if (field.width > 0)
      {
        if (value.text.size() > field.width)
        {
          return ErrorCode::VALUE_TOO_WIDE;
        }
        out += value.text;
        out.append(field.width - value.text.size(), ' ');
        return ErrorCode::OK;
      }
      out += value.text;
      return ErrorCode::OK;

    case TextKind::NUM:
      return format_number(value.number, field.width, out);

    case TextKind::BOOL:
      out += value.flag ? "true" : "false";
      return ErrorCode::OK;

    case TextKind::LIST:
      for (size_t i = 0; i < value.items.size(); ++i)
      {
        const std::string& item = value.items[i];
        if (field.width > 0)
        {
          if (item.size() > field.width)
          {
            return ErrorCode::VALUE_TOO_WIDE;
          }
          out += item;
          out.append(field.width - item.size(), ' ');
          continue;
        }

        if (item.find(LIST_DELIMITER) != std::string::npos)
        {
          return ErrorCode::INVALID_CHARACTER;
        }
        if (i > 0)
        {
          out.push_back(LIST_DELIMITER);
        }
        out += item;
      }
      return ErrorCode::OK;

    case TextKind::NUMS:
      for (size_t i = 0; i < value.nums.size(); ++i)
      {
        if (i > 0 && field.width == 0)
        {
          out.push_back(LIST_DELIMITER);
        }
        const ErrorCode err = format_number(value.nums[i], field.width, out);
        if (err != ErrorCode::OK)
        {
          return err;
        }
      }
      return ErrorCode::OK;

    case TextKind::PAIRS:
      for (size_t i = 0; i < value.text_pairs.size(); ++i)
      {
        const TextPair& pair = value.text_pairs[i];
        if (pair.first.find(PAIR_DELIMITER) != std::string::npos ||
            pair.second.find(PAIR_DELIMITER) != std::string::npos)
        {
          return ErrorCode::INVALID_CHARACTER;
        }
        if (i > 0)
        {
          out.push_back(PAIR_DELIMITER);
        }
        out += pair.first;
        out.push_back(PAIR_DELIMITER);
        out += pair.second;
      }
      return ErrorCode::OK;

    case TextKind::NUM_PAIRS:
      for (size_t i = 0; i < value.pairs.size(); ++i)
      {
        if (i > 0)
        {
          out.push_back(PAIR_DELIMITER);
        }
        ErrorCode err = format_number(value.pairs[i].first, 0, out);
        if (err != ErrorCode::OK)
        {
          return err;
        }
        out.push_back(PAIR_DELIMITER);
        err = format_number(value.pairs[i].second, 0, out);
        if (err != ErrorCode::OK)
        {
          return err;
        }
      }
      return ErrorCode::OK;

    case TextKind::ENUM:
      for (size_t i = 0; i < field.options.size(); ++i)
      {
        if (field.options[i] == value.text)
        {
          out.push_back(static_cast<char>(ENUM_FIRST + i));
          return ErrorCode::OK;
        }
      }
      return ErrorCode::VALUE_OUT_OF_RANGE;
  }
  return ErrorCode::TYPE_MISMATCH;
}

}  // namespace

/* ========================================================================= */
/* TextValue / TextRecord                                                    */
/* ========================================================================= */

bool TextValue::operator==(const TextValue& other) const
{
  if (kind != other.kind)
  {
    return false;
  }

  switch (kind)
  {
    case TextKind::TEXT:
      return text == other.text;
    case TextKind::NUM:
      return number == other.number;
    case TextKind::BOOL:
      return flag == other.flag;
    case TextKind::LIST:
      return items == other.items;
    case TextKind::NUMS:
      return nums == other.nums;
    case TextKind::PAIRS:
      return text_pairs == other.text_pairs;
    case TextKind::NUM_PAIRS:
      return pairs == other.pairs;
    case TextKind::ENUM:
      return text == other.text;
  }
  return false;
}

void TextRecord::set_text(const std::string& name, const std::string& value)
{
  TextValue v;
  v.kind = TextKind::TEXT;
  v.text = value;
  values_[name] = v;
}

void TextRecord::set_num(const std::string& name, int64_t value)
{
  TextValue v;
  v.kind = TextKind::NUM;
  v.number = value;
  values_[name] = v;
}

void TextRecord::set_bool(const std::string& name, bool value)
{
  TextValue v;
  v.kind = TextKind::BOOL;
  v.flag = value;
  values_[name] = v;
}

void TextRecord::set_list(const std::string& name, const std::vector<std::string>& items)
{
  TextValue v;
  v.kind = TextKind::LIST;
  v.items = items;
  values_[name] = v;
}

void TextRecord::set_nums(const std::string& name, const std::vector<int64_t>& values)
{
  TextValue v;
  v.kind = TextKind::NUMS;
  v.nums = values;
  values_[name] = v;
}

void TextRecord::set_pairs(const std::string& name, const std::vector<TextPair>& pairs)
{
  TextValue v;
  v.kind = TextKind::PAIRS;
  v.text_pairs = pairs;
  values_[name] = v;
}

void TextRecord::set_num_pairs(const std::string& name, const std::vector<NumPair>& pairs)
{
  TextValue v;
  v.kind = TextKind::NUM_PAIRS;
  v.pairs = pairs;
  values_[name] = v;
}

void TextRecord::set_enum(const std::string& name, const std::string& value)
{
  TextValue v;
  v.kind = TextKind::ENUM;
  v.text = value;
  values_[name] = v;
}

const TextValue* TextRecord::find(const std::string& name) const
{
  const auto it = values_.find(name);
  return it == values_.end() ? nullptr : &it->second;
}

bool TextRecord::get_text(const std::string& name, std::string& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::TEXT)
  {
    return false;
  }
  out = v->text;
  return true;
}

bool TextRecord::get_num(const std::string& name, int64_t& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::NUM)
  {
    return false;
  }
  out = v->number;
  return true;
}

bool TextRecord::get_bool(const std::string& name, bool& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::BOOL)
  {
    return false;
  }
  out = v->flag;
  return true;
}

bool TextRecord::get_list(const std::string& name, std::vector<std::string>& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::LIST)
  {
    return false;
  }
  out = v->items;
  return true;
}

bool TextRecord::get_nums(const std::string& name, std::vector<int64_t>& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::NUMS)
  {
    return false;
  }
  out = v->nums;
  return true;
}

bool TextRecord::get_pairs(const std::string& name, std::vector<TextPair>& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::PAIRS)
  {
    return false;
  }
  out = v->text_pairs;
  return true;
}

bool TextRecord::get_num_pairs(const std::string& name, std::vector<NumPair>& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::NUM_PAIRS)
  {
    return false;
  }
  out = v->pairs;
  return true;
}

bool TextRecord::get_enum(const std::string& name, std::string& out) const
{
  const TextValue* v = find(name);
  if (!v || v->kind != TextKind::ENUM)
  {
    return false;
  }
  out = v->text;
  return true;
}

/* ========================================================================= */
/* TextCodec                                                                 */
/* ========================================================================= */

ErrorCode TextCodec::compile(const std::string& tmpl, TextCodec& out)
{
  std::vector<std::string> literals;
  std::vector<TextFieldSpec> fields;
  std::set<std::string> names;
  std::string literal;
  size_t pos = 0;

  while (pos < tmpl.size())
  {
    const char c = tmpl[pos];
    if (c == PAYLOAD_DELIMITER || c == '>')
    {
      return ErrorCode::INVALID_SCHEMA;
    }
    if (c != '<')
    {
      literal.push_back(c);
      ++pos;
      continue;
    }

    const size_t close = tmpl.find('>', pos + 1);
    if (close == std::string::npos)
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    // <name>, <name:type>, <name:type-width> or <name:enum[a,b,...]>
    const std::string body = tmpl.substr(pos + 1, close - pos - 1);
    TextFieldSpec field;
    field.kind = TextKind::TEXT;
    field.width = 0;

    const size_t colon = body.find(':');
    field.name = body.substr(0, colon);
    if (colon != std::string::npos)
    {
      std::string type = body.substr(colon + 1);
      if (type.compare(0, std::char_traits<char>::length(ENUM_PREFIX), ENUM_PREFIX) == 0)
      {
        const ErrorCode err = parse_enum_options(type, field.options);
        if (err != ErrorCode::OK)
        {
          return err;
        }
        field.kind = TextKind::ENUM;
      }
      else
      {
        const size_t dash = type.find('-');
        if (dash != std::string::npos)
        {
          int64_t width = 0;
          if (!parse_number(type.substr(dash + 1), width) || width > 0xFFFF)
          {
            return ErrorCode::INVALID_SCHEMA;
          }
          field.width = static_cast<uint32_t>(width);
          type.erase(dash);

          if (field.width == 0)
          {
            return ErrorCode::INVALID_WIDTH;
          }
        }

        if (!parse_kind(type, field.kind))
        {
          return ErrorCode::INVALID_SCHEMA;
        }
        if (field.width > 0 && field.kind != TextKind::TEXT && field.kind != TextKind::NUM &&
            field.kind != TextKind::LIST && field.kind != TextKind::NUMS)
        {
          return ErrorCode::INVALID_WIDTH;
        }
      }
    }

    if (field.name.empty() || field.name.find('<') != std::string::npos)
    {
      return ErrorCode::INVALID_SCHEMA;
    }
    if (!names.insert(field.name).second)
    {
      return ErrorCode::DUPLICATE_FIELD;
    }

    literals.push_back(literal);
    literal.clear();
    fields.push_back(field);
    pos = close + 1;
  }
  literals.push_back(literal);

  // A delimited field needs literal text before the next field
  for (size_t i = 0; i + 1 < fields.size(); ++i)
  {
    if (span_width(fields[i]) == 0 && literals[i + 1].empty())
    {
      return ErrorCode::INVALID_SCHEMA;
    }
  }

  out.literals_ = literals;
  out.fields_ = fields;
  return ErrorCode::OK;
}

ErrorCode TextCodec::encode(const TextRecord& record, std::string& out) const
{
  std::string result = literals_.front();

  for (size_t i = 0; i < fields_.size(); ++i)
  {
    const TextFieldSpec& field = fields_[i];
    const TextValue* value = record.find(field.name);
    if (value == nullptr)
    {
      return ErrorCode::MISSING_FIELD;
    }
    if (value->kind != field.kind)
    {
      return ErrorCode::TYPE_MISMATCH;
    }

    const size_t start = result.size();
    const ErrorCode err = format_value(field, *value, result);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    // The decoder must find the value's end where it ends
    const std::string& next = literals_[i + 1];
    if (result.find(PAYLOAD_DELIMITER, start) != std::string::npos ||
        (span_width(field) == 0 && !next.empty() && result.find(next, start) != std::string::npos))
    {
      return ErrorCode::INVALID_CHARACTER;
    }
    result += next;
  }

  if (!record.payload().empty())
  {
    result.push_back(PAYLOAD_DELIMITER);
    result += record.payload();
  }

  out.swap(result);
  return ErrorCode::OK;
}

bool TextCodec::decode(const std::string& input, TextRecord& out) const
{
  // Split header from payload at the first delimiter
  const size_t split_at = input.find(PAYLOAD_DELIMITER);
  const std::string header = input.substr(0, split_at);

  const std::string& tag = literals_.front();
  if (header.compare(0, tag.size(), tag) != 0)
  {
    return false;
  }

  TextRecord result;
  size_t pos = tag.size();

  for (size_t i = 0; i < fields_.size(); ++i)
  {
    const TextFieldSpec& field = fields_[i];
    const std::string& next = literals_[i + 1];
    const size_t span = span_width(field);
    std::string value;

    if (span > 0)
    {
      if (pos + span > header.size())
      {
        return false;
      }
      value = header.substr(pos, span);
      pos += span;
      if (header.compare(pos, next.size(), next) != 0)
      {
        return false;
      }
      pos += next.size();
    }
    else if (i + 1 == fields_.size())
    {
      // Last delimited field runs up to the trailing literal
      if (header.size() < pos + next.size() ||
          header.compare(header.size() - next.size(), next.size(), next) != 0)
      {
        return false;
      }
      value = header.substr(pos, header.size() - next.size() - pos);
      pos = header.size();
    }
    else
    {
      const size_t end = header.find(next, pos);
      if (end == std::string::npos)
      {
        return false;
      }
      value = header.substr(pos, end - pos);
      pos = end + next.size();
    }

    if (!parse_value(field, value, result))
    {
      return false;
    }
  }

  if (pos != header.size())
  {
    return false;
  }

  if (split_at != std::string::npos)
  {
    result.set_payload(input.substr(split_at + 1));
  }

  out = result;
  return true;
}

}  // namespace duolink
