/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Kickoff;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(trueVal.getType(), JsonType::Boolean);

  JsonValue numberVal(3.5);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.asNumber(), 3.5, 0.001);
  BOOST_CHECK_EQUAL(numberVal.asInt(), 3);

  JsonValue stringVal(std::string("pitch"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "pitch");
}

BOOST_AUTO_TEST_CASE(TestTryAccessors) {
  JsonValue numberVal(12.0);
  BOOST_CHECK(numberVal.tryAsNumber().has_value());
  BOOST_CHECK_EQUAL(*numberVal.tryAsInt(), 12);
  BOOST_CHECK(!numberVal.tryAsBool().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(numberVal.tryAsArray() == nullptr);
  BOOST_CHECK(numberVal.tryAsObject() == nullptr);

  BOOST_CHECK_THROW(numberVal.asString(), std::bad_variant_access);
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsAreNull) {
  JsonObject obj;
  obj["ticks"] = JsonValue(600.0);
  JsonValue objectVal(obj);

  BOOST_CHECK(objectVal.hasKey("ticks"));
  BOOST_CHECK(!objectVal.hasKey("seed"));
  BOOST_CHECK(objectVal["seed"].isNull());
  BOOST_CHECK(objectVal[0].isNull());
  BOOST_CHECK(objectVal["seed"]["nested"].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParseTests)

BOOST_AUTO_TEST_CASE(TestParseScalars) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse("  false "));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_REQUIRE(reader.parse("-12.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -125.0, 0.001);

  BOOST_REQUIRE(reader.parse("\"kick\\toff\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "kick\toff");
}

BOOST_AUTO_TEST_CASE(TestParseNestedDocument) {
  JsonReader reader;
  const std::string json = R"({
    "pitch": { "width": 100, "height": 60 },
    "formation": [1, 2, 2],
    "labels": ["red", "blue"],
    "enabled": true,
    "empty": {}
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue& root = reader.getRoot();

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 5u);
  BOOST_CHECK_EQUAL(root["pitch"]["width"].asInt(), 100);
  BOOST_CHECK_EQUAL(root["pitch"]["height"].asInt(), 60);
  BOOST_CHECK_EQUAL(root["formation"].size(), 3u);
  BOOST_CHECK_EQUAL(root["formation"][2].asInt(), 2);
  BOOST_CHECK(root["formation"].isArray());
  BOOST_CHECK_EQUAL(root["formation"].asArray().size(), 3u);
  BOOST_CHECK_EQUAL(root["pitch"].asObject().count("width"), 1u);
  BOOST_CHECK_EQUAL(root["labels"][1].asString(), "blue");
  BOOST_CHECK_EQUAL(root["enabled"].asBool(), true);
  BOOST_CHECK(root["empty"].isObject());
  BOOST_CHECK_EQUAL(root["empty"].size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestUnicodeEscape) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("\"caf\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "caf\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestMalformedInput) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{ \"a\": 1, }"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("\"bad \\q escape\""));
  BOOST_CHECK(!reader.parse(""));
}

BOOST_AUTO_TEST_CASE(TestTrailingCharactersRejected) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{} {}"));
  BOOST_CHECK(reader.getLastError().find("trailing") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestErrorReportsLine) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": 1,\n  \"b\": ?\n}"));
  BOOST_CHECK(reader.getLastError().find("line 3") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const std::string deep = std::string(100, '[') + std::string(100, ']');
  BOOST_CHECK(!reader.parse(deep));

  const std::string shallow = std::string(10, '[') + std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestFailedParseResetsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"a\": 1}"));
  BOOST_CHECK(!reader.parse("{\"a\": }"));
  BOOST_CHECK(reader.getRoot().isNull());

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("nonexistent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());

  std::filesystem::create_directories("tests/test_data");
  const std::string path = "tests/test_data/json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"simulation": {"seed": 42}})";
  }

  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["simulation"]["seed"].asInt(), 42);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_SUITE_END()
