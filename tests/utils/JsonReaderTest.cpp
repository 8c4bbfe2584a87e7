#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace JournalEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue boolVal(true);
  BOOST_CHECK(boolVal.isBool());
  BOOST_CHECK_EQUAL(boolVal.asBool(), true);

  JsonValue numberVal(0.25);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.asNumber(), 0.25, 0.001);

  JsonValue stringVal(std::string("fade"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.getType(), JsonType::String);
  BOOST_CHECK_EQUAL(stringVal.asString(), "fade");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal(std::string("CSUSelect"));
  JsonValue numberVal(3.0);

  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "CSUSelect");
  BOOST_CHECK_EQUAL(numberVal.tryAsInt().value(), 3);
  BOOST_CHECK(!stringVal.tryAsInt().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(!numberVal.tryAsBool().has_value());

  // Wrong-type access through as*() throws
  BOOST_CHECK_THROW(stringVal.asNumber(), std::bad_variant_access);
}

BOOST_AUTO_TEST_CASE(TestMissingMembersAreNull) {
  JsonObject obj;
  obj["name"] = JsonValue(std::string("Home"));
  JsonValue objectVal(std::move(obj));

  BOOST_CHECK(objectVal.hasKey("name"));
  BOOST_CHECK(!objectVal.hasKey("journal"));
  BOOST_CHECK(objectVal["journal"].isNull());
  BOOST_CHECK(objectVal["journal"]["deeper"].isNull());
  BOOST_CHECK(objectVal[5].isNull());
  BOOST_CHECK_EQUAL(objectVal.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse("true"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_REQUIRE(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_REQUIRE(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_REQUIRE(reader.parse("\"journal\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "journal");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse(R"("line\nbreak")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak");

  BOOST_REQUIRE(reader.parse(R"("quote\"here")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_REQUIRE(reader.parse(R"("A")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  BOOST_REQUIRE(reader.parse(R"("é")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;
  const std::string json = R"({
    "screens": [
      {"name": "Splash", "transition": "none"},
      {"name": "Journal", "journal": true, "color": [69, 90, 100]}
    ],
    "trackers": [],
    "version": 2
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue& root = reader.getRoot();
  BOOST_REQUIRE(root.isObject());

  const JsonValue& screens = root["screens"];
  BOOST_REQUIRE(screens.isArray());
  BOOST_REQUIRE_EQUAL(screens.size(), 2u);
  BOOST_CHECK_EQUAL(screens[0]["name"].asString(), "Splash");
  BOOST_CHECK_EQUAL(screens[1]["journal"].asBool(), true);
  BOOST_CHECK_EQUAL(screens[1]["color"][2].asInt(), 100);

  BOOST_CHECK(root["trackers"].isArray());
  BOOST_CHECK_EQUAL(root["trackers"].size(), 0u);
  BOOST_CHECK_EQUAL(root["version"].asInt(), 2);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("  \n\t 42 \r\n"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_REQUIRE(reader.parse("[ 1 ,\n 2 ,\t 3 ]"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  // Missing quotes
  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  // Trailing commas
  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));

  // Unclosed containers
  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.parse("[1, 2, 3"));

  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.parse("\"hello\\x\""));

  // Multiple root values
  BOOST_CHECK(!reader.parse("42 43"));
}

BOOST_AUTO_TEST_CASE(TestMalformedStructures) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\"key\" \"value\"}"));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("{\"a\": 1 \"b\": 2}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
}

BOOST_AUTO_TEST_CASE(TestInvalidTokens) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.parse("nul"));
  BOOST_CHECK(!reader.parse("@"));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"name\": @\n}"));
  const std::string& error = reader.getLastError();
  BOOST_CHECK(error.find("line 2") != std::string::npos);
  BOOST_CHECK(error.find("column 11") != std::string::npos);

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestFailedParseResetsRoot) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("[1, 2]"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(reader.getRoot().isNull());
}

BOOST_AUTO_TEST_CASE(TestDepthLimit) {
  JsonReader reader;

  BOOST_CHECK(reader.parse(std::string(32, '[') + std::string(32, ']')));
  BOOST_CHECK(!reader.parse(std::string(100, '[') + std::string(100, ']')));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string testFile = "test_layout.json";
  {
    std::ofstream file(testFile);
    file << R"({"screens": [{"name": "Home", "duration": 0.5}]})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(testFile));
  BOOST_CHECK_EQUAL(reader.getRoot()["screens"][0]["name"].asString(), "Home");
  BOOST_CHECK_CLOSE(reader.getRoot()["screens"][0]["duration"].asNumber(), 0.5, 0.001);

  std::filesystem::remove(testFile);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("nonexistent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
