/**
 * @file bit_codec.cpp
 * @brief Fixed-width bit field codec implementation
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "duolink/bit_codec.hpp"

#include <set>

namespace duolink
{

namespace
{

/* Widest field accepted by the schema parser (digits in the width). */
constexpr size_t MAX_WIDTH_DIGITS = 6;

bool parse_width(const std::string& text, uint32_t& out)
{
  if (text.empty() || text.size() > MAX_WIDTH_DIGITS)
  {
    return false;
  }

  uint32_t value = 0;
  for (const char c : text)
  {
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }

  out = value;
  return true;
}

bool parse_kind(const std::string& text, FieldKind& out)
{
  if (text == "bool")
  {
    out = FieldKind::BOOL;
  }
  else if (text == "num" || text == "uint")
  {
    out = FieldKind::UINT;
  }
  else if (text == "bits" || text == "raw")
  {
    out = FieldKind::RAW;
  }
  else
  {
    return false;
  }
  return true;
}

inline void write_bit(std::vector<uint8_t>& buf, size_t pos, bool bit)
{
  if (bit)
  {
    buf[pos / 8] |= static_cast<uint8_t>(0x80 >> (pos % 8));
  }
}

inline bool read_bit(const uint8_t* data, size_t pos)
{
  return (data[pos / 8] & (0x80 >> (pos % 8))) != 0;
}

}  // namespace

/* ========================================================================= */
/* FieldValue / Record                                                       */
/* ========================================================================= */

bool FieldValue::operator==(const FieldValue& other) const
{
  if (kind != other.kind)
  {
    return false;
  }

  switch (kind)
  {
    case FieldKind::BOOL:
      return flag == other.flag;
    case FieldKind::UINT:
      return number == other.number;
    case FieldKind::RAW:
      return bits == other.bits;
  }
  return false;
}

void Record::set_bool(const std::string& name, bool value)
{
  FieldValue v;
  v.kind = FieldKind::BOOL;
  v.flag = value;
  values_[name] = v;
}

void Record::set_uint(const std::string& name, int64_t value)
{
  FieldValue v;
  v.kind = FieldKind::UINT;
  v.number = value;
  values_[name] = v;
}

void Record::set_bits(const std::string& name, const std::string& bits)
{
  FieldValue v;
  v.kind = FieldKind::RAW;
  v.bits = bits;
  values_[name] = v;
}

const FieldValue* Record::find(const std::string& name) const
{
  const auto it = values_.find(name);
  return it == values_.end() ? nullptr : &it->second;
}

bool Record::get_bool(const std::string& name, bool& out) const
{
  const FieldValue* v = find(name);
  if (!v || v->kind != FieldKind::BOOL)
  {
    return false;
  }
  out = v->flag;
  return true;
}

bool Record::get_uint(const std::string& name, int64_t& out) const
{
  const FieldValue* v = find(name);
  if (!v || v->kind != FieldKind::UINT)
  {
    return false;
  }
  out = v->number;
  return true;
}

bool Record::get_bits(const std::string& name, std::string& out) const
{
  const FieldValue* v = find(name);
  if (!v || v->kind != FieldKind::RAW)
  {
    return false;
  }
  out = v->bits;
  return true;
}

/* ========================================================================= */
/* Schema parsing                                                            */
/* ========================================================================= */

ErrorCode parse_bit_schema(const std::string& pattern, FieldSchema& out)
{
  out.clear();
  size_t pos = 0;

  while (pos < pattern.size())
  {
    const char c = pattern[pos];
    if (c == ' ' || c == '\t' || c == '\n')
    {
      ++pos;
      continue;
    }
    if (c != '<')
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    const size_t close = pattern.find('>', pos + 1);
    if (close == std::string::npos)
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    // <name:kind-width> or <name-width>
    const std::string body = pattern.substr(pos + 1, close - pos - 1);
    const size_t dash = body.rfind('-');
    if (dash == std::string::npos)
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    FieldSpec field;
    field.kind = FieldKind::RAW;
    if (!parse_width(body.substr(dash + 1), field.width))
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    const std::string head = body.substr(0, dash);
    const size_t colon = head.find(':');
    if (colon == std::string::npos)
    {
      field.name = head;
    }
    else
    {
      field.name = head.substr(0, colon);
      if (!parse_kind(head.substr(colon + 1), field.kind))
      {
        return ErrorCode::INVALID_SCHEMA;
      }
    }

    if (field.name.empty() || field.name.find_first_of("<:-") != std::string::npos)
    {
      return ErrorCode::INVALID_SCHEMA;
    }

    out.push_back(field);
    pos = close + 1;
  }

  return ErrorCode::OK;
}

/* ========================================================================= */
/* BitCodec                                                                  */
/* ========================================================================= */

BitCodec::BitCodec() : fields_(), offsets_(), total_bits_(0) {}

ErrorCode BitCodec::compile(const FieldSchema& schema, BitCodec& out)
{
  std::set<std::string> names;
  std::vector<size_t> offsets;
  offsets.reserve(schema.size());
  size_t bit = 0;

  for (const FieldSpec& field : schema)
  {
    if (field.name.empty())
    {
      return ErrorCode::INVALID_SCHEMA;
    }
    if (!names.insert(field.name).second)
    {
      return ErrorCode::DUPLICATE_FIELD;
    }

    switch (field.kind)
    {
      case FieldKind::BOOL:
        if (field.width != 1)
        {
          return ErrorCode::INVALID_WIDTH;
        }
        break;

      case FieldKind::UINT:
        if (field.width == 0 || field.width > MAX_UINT_FIELD_BITS)
        {
          return ErrorCode::INVALID_WIDTH;
        }
        break;

      case FieldKind::RAW:
        if (field.width == 0)
        {
          return ErrorCode::INVALID_WIDTH;
        }
        break;
    }

    offsets.push_back(bit);
    bit += field.width;
  }

  out.fields_ = schema;
  out.offsets_ = offsets;
  out.total_bits_ = bit;
  return ErrorCode::OK;
}

ErrorCode BitCodec::compile(const std::string& pattern, BitCodec& out)
{
  FieldSchema schema;
  const ErrorCode err = parse_bit_schema(pattern, schema);
  if (err != ErrorCode::OK)
  {
    return err;
  }
  return compile(schema, out);
}

ErrorCode BitCodec::encode(const Record& record, std::vector<uint8_t>& out) const
{
  std::vector<uint8_t> buf(total_bytes(), 0x00);

  for (size_t i = 0; i < fields_.size(); ++i)
  {
    const FieldSpec& field = fields_[i];
    const size_t start = offsets_[i];

    const FieldValue* value = record.find(field.name);
    if (value == nullptr)
    {
      return ErrorCode::MISSING_FIELD;
    }
    if (value->kind != field.kind)
    {
      return ErrorCode::TYPE_MISMATCH;
    }

    switch (field.kind)
    {
      case FieldKind::BOOL:
        write_bit(buf, start, value->flag);
        break;

      case FieldKind::UINT:
      {
        const int64_t limit = int64_t{1} << field.width;
        if (value->number < 0 || value->number >= limit)
        {
          return ErrorCode::VALUE_OUT_OF_RANGE;
        }
        for (uint32_t b = 0; b < field.width; ++b)
        {
          const uint32_t shift = field.width - 1 - b;
          write_bit(buf, start + b, ((value->number >> shift) & 1) != 0);
        }
        break;
      }

      case FieldKind::RAW:
        if (value->bits.size() != field.width)
        {
          return ErrorCode::INVALID_BITS;
        }
        for (uint32_t b = 0; b < field.width; ++b)
        {
          const char c = value->bits[b];
          if (c != '0' && c != '1')
          {
            return ErrorCode::INVALID_BITS;
          }
          write_bit(buf, start + b, c == '1');
        }
        break;
    }
  }

  out.swap(buf);
  return ErrorCode::OK;
}

bool BitCodec::decode(const uint8_t* data, size_t len, Record& out) const
{
  if (len * 8 < total_bits_ || (data == nullptr && total_bits_ > 0))
  {
    return false;
  }

  out.clear();

  for (size_t i = 0; i < fields_.size(); ++i)
  {
    const FieldSpec& field = fields_[i];
    const size_t start = offsets_[i];

    switch (field.kind)
    {
      case FieldKind::BOOL:
        out.set_bool(field.name, read_bit(data, start));
        break;

      case FieldKind::UINT:
      {
        int64_t value = 0;
        for (uint32_t b = 0; b < field.width; ++b)
        {
          value = (value << 1) | (read_bit(data, start + b) ? 1 : 0);
        }
        out.set_uint(field.name, value);
        break;
      }

      case FieldKind::RAW:
      {
        std::string bits(field.width, '0');
        for (uint32_t b = 0; b < field.width; ++b)
        {
          if (read_bit(data, start + b))
          {
            bits[b] = '1';
          }
        }
        out.set_bits(field.name, bits);
        break;
      }
    }
  }

  return true;
}

/* ========================================================================= */
/* Binary string helpers                                                     */
/* ========================================================================= */

std::string to_binary_string(const uint8_t* data, size_t len)
{
  std::string result;
  result.reserve(len * 8);

  for (size_t i = 0; i < len; ++i)
  {
    for (int bit = 7; bit >= 0; --bit)
    {
      result.push_back(((data[i] >> bit) & 1) ? '1' : '0');
    }
  }

  return result;
}

bool from_binary_string(const std::string& bits, std::vector<uint8_t>& out)
{
  std::vector<uint8_t> buf((bits.size() + 7) / 8, 0x00);

  for (size_t i = 0; i < bits.size(); ++i)
  {
    if (bits[i] != '0' && bits[i] != '1')
    {
      return false;
    }
    write_bit(buf, i, bits[i] == '1');
  }

  out.swap(buf);
  return true;
}

}  // namespace duolink
