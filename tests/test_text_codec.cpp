/**
 * @file test_text_codec.cpp
 * @brief Text field codec and wire frame unit tests
 *
 * @copyright Copyright 2026 The duolink Authors
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <string>
#include <vector>

#include "duolink/text_codec.hpp"
#include "frame.hpp"

using namespace duolink;

/* ========================================================================= */
/* Template Compile Tests                                                    */
/* ========================================================================= */

TEST_CASE("Text template compile")
{
  TextCodec codec;

  SUBCASE("Frame templates")
  {
    REQUIRE(TextCodec::compile(PRIMARY_FRAME_TEMPLATE, codec) == ErrorCode::OK);
    REQUIRE(codec.fields().size() == 3);
    CHECK(codec.fields()[2].name == "checksum");
    CHECK(codec.fields()[2].width == CHECKSUM_LENGTH);

    REQUIRE(TextCodec::compile(BACK_FRAME_TEMPLATE, codec) == ErrorCode::OK);
    REQUIRE(codec.fields().size() == 1);
    CHECK(codec.fields()[0].kind == TextKind::NUM_PAIRS);
  }

  SUBCASE("Invalid templates")
  {
    CHECK(TextCodec::compile("A<x:num", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:float>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:num><y:num>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A$<x:num>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:num>/<x:text>", codec) == ErrorCode::DUPLICATE_FIELD);
    CHECK(TextCodec::compile("A<x:numPairs-3>", codec) == ErrorCode::INVALID_WIDTH);
    CHECK(TextCodec::compile("A<x:pairs-2>", codec) == ErrorCode::INVALID_WIDTH);
    CHECK(TextCodec::compile("A<x:bool-4>", codec) == ErrorCode::INVALID_WIDTH);
    CHECK(TextCodec::compile("A<x:enum[]>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:enum[a,a]>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:enum[a,b>", codec) == ErrorCode::INVALID_SCHEMA);
    CHECK(TextCodec::compile("A<x:text-0>", codec) == ErrorCode::INVALID_WIDTH);
  }

  SUBCASE("Fixed width fields need no separator")
  {
    CHECK(TextCodec::compile("A<x:num-2><y:num>", codec) == ErrorCode::OK);
    CHECK(TextCodec::compile("A<mode:enum[on,off]><y:num>", codec) == ErrorCode::OK);
    CHECK(TextCodec::compile("A<x:nums-2><y:num>", codec) == ErrorCode::INVALID_SCHEMA);
  }

  SUBCASE("Item width on lists")
  {
    REQUIRE(TextCodec::compile("A<x:nums-3>", codec) == ErrorCode::OK);
    CHECK(codec.fields()[0].kind == TextKind::NUMS);
    CHECK(codec.fields()[0].width == 3);

    REQUIRE(TextCodec::compile("A<x:list-2>", codec) == ErrorCode::OK);
    CHECK(codec.fields()[0].kind == TextKind::LIST);
  }
}

/* ========================================================================= */
/* Encoding/Decoding Tests                                                   */
/* ========================================================================= */

TEST_CASE("Text codec fields")
{
  TextCodec codec;

  SUBCASE("Numbers and text with literals")
  {
    REQUIRE(TextCodec::compile("ID<id:num>:<name>!", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_num("id", 42);
    record.set_text("name", "sensor");

    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "ID42:sensor!");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);
  }

  SUBCASE("Fixed width padding")
  {
    REQUIRE(TextCodec::compile("<code:text-4><n:num-3>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_text("code", "ab");
    record.set_num("n", 7);

    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "ab  007");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);

    record.set_num("n", 1000);
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_TOO_WIDE);
    record.set_num("n", 1);
    record.set_text("code", "abcde");
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_TOO_WIDE);
  }

  SUBCASE("Booleans decode case-insensitively")
  {
    REQUIRE(TextCodec::compile("F<on:bool>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_bool("on", true);
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "Ftrue");

    TextRecord decoded;
    bool on = false;
    REQUIRE(codec.decode("FFALSE", decoded));
    REQUIRE(decoded.get_bool("on", on));
    CHECK_FALSE(on);

    CHECK_FALSE(codec.decode("Fyes", decoded));
  }

  SUBCASE("Number lists")
  {
    REQUIRE(TextCodec::compile("L<values:nums>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_nums("values", {3, 14, 159});
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "L3,14,159");

    TextRecord decoded;
    std::vector<int64_t> values;
    REQUIRE(codec.decode("L", decoded));
    REQUIRE(decoded.get_nums("values", values));
    CHECK(values.empty());

    CHECK_FALSE(codec.decode("L1,,2", decoded));
  }

  SUBCASE("Number pairs")
  {
    REQUIRE(TextCodec::compile("QB<ranges:numPairs>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_num_pairs("ranges", {{0, 3}, {5, 7}});
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "QB0;3;5;7");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);

    CHECK_FALSE(codec.decode("QB0;3;5", decoded));
    CHECK_FALSE(codec.decode("QB0;x", decoded));

    record.set_num_pairs("ranges", {{-1, 3}});
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_OUT_OF_RANGE);
  }

  SUBCASE("Missing field and wrong kind")
  {
    REQUIRE(TextCodec::compile("ID<id:num>", codec) == ErrorCode::OK);

    std::string out;
    TextRecord record;
    CHECK(codec.encode(record, out) == ErrorCode::MISSING_FIELD);

    record.set_text("id", "12");
    CHECK(codec.encode(record, out) == ErrorCode::TYPE_MISMATCH);
  }
}

TEST_CASE("Text codec list and enum fields")
{
  TextCodec codec;

  SUBCASE("String lists")
  {
    REQUIRE(TextCodec::compile("L<names:list>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_list("names", {"red", "green", "blue"});
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "Lred,green,blue");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);

    std::vector<std::string> names;
    REQUIRE(codec.decode("L", decoded));
    REQUIRE(decoded.get_list("names", names));
    CHECK(names.empty());

    record.set_list("names", {"a,b"});
    CHECK(codec.encode(record, out) == ErrorCode::INVALID_CHARACTER);
  }

  SUBCASE("Fixed width lists")
  {
    REQUIRE(TextCodec::compile("F<codes:list-3>|<ids:nums-2>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_list("codes", {"ab", "xyz", ""});
    record.set_nums("ids", {7, 42, 0});
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "Fab xyz   |074200");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);

    CHECK_FALSE(codec.decode("Fab xy|07", decoded));
    CHECK_FALSE(codec.decode("Fab |074", decoded));

    record.set_nums("ids", {100});
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_TOO_WIDE);
    record.set_nums("ids", {1});
    record.set_list("codes", {"long"});
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_TOO_WIDE);
  }

  SUBCASE("String pairs")
  {
    REQUIRE(TextCodec::compile("P<attrs:pairs>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_pairs("attrs", {{"mode", "fast"}, {"level", ""}});
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "Pmode;fast;level;");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded == record);

    CHECK_FALSE(codec.decode("Pmode;fast;level", decoded));

    record.set_pairs("attrs", {{"a;b", "c"}});
    CHECK(codec.encode(record, out) == ErrorCode::INVALID_CHARACTER);
  }

  SUBCASE("Enums travel as one letter")
  {
    REQUIRE(TextCodec::compile("E<level:enum[low,mid,high]><n:num>", codec) == ErrorCode::OK);

    TextRecord record;
    record.set_enum("level", "high");
    record.set_num("n", 12);
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "Ec12");

    TextRecord decoded;
    std::string level;
    REQUIRE(codec.decode("Ea5", decoded));
    REQUIRE(decoded.get_enum("level", level));
    CHECK(level == "low");

    CHECK_FALSE(codec.decode("Ed5", decoded));
    CHECK_FALSE(codec.decode("EA5", decoded));

    record.set_enum("level", "max");
    CHECK(codec.encode(record, out) == ErrorCode::VALUE_OUT_OF_RANGE);
    record.set_text("level", "low");
    CHECK(codec.encode(record, out) == ErrorCode::TYPE_MISMATCH);
  }
}

TEST_CASE("Text codec payload")
{
  TextCodec codec;
  REQUIRE(TextCodec::compile("P<index:num>/<total:num>", codec) == ErrorCode::OK);

  TextRecord record;
  record.set_num("index", 1);
  record.set_num("total", 4);

  SUBCASE("Payload follows the delimiter verbatim")
  {
    record.set_payload("cost: $5 / unit");

    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "P1/4$cost: $5 / unit");

    TextRecord decoded;
    REQUIRE(codec.decode(out, decoded));
    CHECK(decoded.payload() == "cost: $5 / unit");
    CHECK(decoded == record);
  }

  SUBCASE("Empty payload emits no delimiter")
  {
    std::string out;
    REQUIRE(codec.encode(record, out) == ErrorCode::OK);
    CHECK(out == "P1/4");
  }

  SUBCASE("Header values may not contain delimiters")
  {
    TextCodec text_codec;
    REQUIRE(TextCodec::compile("T<a>:<b>", text_codec) == ErrorCode::OK);

    TextRecord bad;
    bad.set_text("a", "x:y");
    bad.set_text("b", "z");
    std::string out;
    CHECK(text_codec.encode(bad, out) == ErrorCode::INVALID_CHARACTER);

    bad.set_text("a", "x$y");
    CHECK(text_codec.encode(bad, out) == ErrorCode::INVALID_CHARACTER);
  }

  SUBCASE("Malformed input")
  {
    TextRecord decoded;
    CHECK_FALSE(codec.decode("", decoded));
    CHECK_FALSE(codec.decode("X1/4$abc", decoded));
    CHECK_FALSE(codec.decode("P1-4$abc", decoded));
    CHECK_FALSE(codec.decode("P1/four$abc", decoded));
    CHECK_FALSE(codec.decode("P/4$abc", decoded));
  }
}

/* ========================================================================= */
/* Wire Frame Tests                                                          */
/* ========================================================================= */

TEST_CASE("Primary frame")
{
  internal::PrimaryFrame frame;
  frame.index = 2;
  frame.total = 4;
  frame.checksum = "00017862";
  frame.payload = "ghi";

  std::string text;
  REQUIRE(internal::encode_primary_frame(frame, text) == ErrorCode::OK);
  CHECK(text == "QRTPB2/4:00017862$ghi");

  SUBCASE("Decode")
  {
    internal::PrimaryFrame decoded;
    REQUIRE(internal::decode_primary_frame(text, decoded));
    CHECK(decoded.index == 2);
    CHECK(decoded.total == 4);
    CHECK(decoded.checksum == "00017862");
    CHECK(decoded.payload == "ghi");
  }

  SUBCASE("Rejected frames")
  {
    internal::PrimaryFrame decoded;
    CHECK_FALSE(internal::decode_primary_frame("QRTPB4/4:00017862$ghi", decoded));
    CHECK_FALSE(internal::decode_primary_frame("QRTPB0/0:00017862$ghi", decoded));
    CHECK_FALSE(internal::decode_primary_frame("QRTPB2/4:00017862", decoded));
    CHECK_FALSE(internal::decode_primary_frame("QRTPB2/4:0001$ghi", decoded));
    CHECK_FALSE(internal::decode_primary_frame("QB0;3", decoded));
  }
}

TEST_CASE("Backchannel frame")
{
  const std::vector<AckRange> ranges = {{8, 1}, {4, 5}};

  std::string text;
  REQUIRE(internal::encode_back_frame(ranges, text) == ErrorCode::OK);
  CHECK(text == "QB8;1;4;5");

  std::vector<AckRange> decoded;
  REQUIRE(internal::decode_back_frame(text, decoded));
  CHECK(decoded == ranges);

  CHECK_FALSE(internal::decode_back_frame("QB8;1;4", decoded));
  CHECK_FALSE(internal::decode_back_frame("QRTPB0/1:00000000$x", decoded));
  CHECK_FALSE(internal::decode_back_frame("QB99999999999;1", decoded));
}
