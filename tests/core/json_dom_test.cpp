#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using camkit::core::json::Value;

TEST_CASE("JSON parser builds nested objects and arrays", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(camkit::core::json::Parse(
      R"({"video":{"width":{"ideal":640}},"audio":false,"ids":["a","b"],"ratio":-1.5e1,"none":null})",
      root, error));
  REQUIRE(error.empty());
  REQUIRE(root.IsObject());

  const Value* width = root.Find("video")->Find("width");
  REQUIRE(width != nullptr);
  REQUIRE(width->Find("ideal")->number_value == 640.0);
  REQUIRE(root.Find("audio")->type == Value::Type::kBool);
  REQUIRE_FALSE(root.Find("audio")->bool_value);
  REQUIRE(root.Find("ids")->array_value.size() == 2U);
  REQUIRE(root.Find("ratio")->number_value == -15.0);
  REQUIRE(root.Find("none")->type == Value::Type::kNull);
  REQUIRE(root.Find("missing") == nullptr);
  REQUIRE(width->Find("ideal")->Find("x") == nullptr);
}

TEST_CASE("JSON parser decodes escapes", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(camkit::core::json::Parse(R"("a\"b\\c\n\u00e9")", root, error));
  REQUIRE(root.string_value == "a\"b\\c\n\xC3\xA9");

  REQUIRE_FALSE(camkit::core::json::Parse(R"("\ud83d")", root, error));
  REQUIRE(error.find("surrogate") != std::string::npos);
}

TEST_CASE("JSON parser reports line and column of the failure", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(camkit::core::json::Parse("{\n  \"a\": 1,\n  \"b\" 2\n}", root, error));
  REQUIRE(error.rfind("line 3, column 7: ", 0) == 0U);

  REQUIRE_FALSE(camkit::core::json::Parse(R"({"a":1} x)", root, error));
  REQUIRE(error.find("trailing characters") != std::string::npos);

  REQUIRE_FALSE(camkit::core::json::Parse(R"({"deviceId":{"ideal":"ab"c"}})", root, error));
  REQUIRE_FALSE(camkit::core::json::Parse("", root, error));
  REQUIRE_FALSE(camkit::core::json::Parse("01", root, error));
  REQUIRE_FALSE(camkit::core::json::Parse("1e999", root, error));
}

TEST_CASE("JSON parser limits nesting depth", "[core][json]") {
  Value root;
  std::string error;
  const std::string deep = std::string(65U, '[') + std::string(65U, ']');
  REQUIRE(camkit::core::json::Parse(deep, root, error));

  const std::string too_deep = std::string(66U, '[') + std::string(66U, ']');
  REQUIRE_FALSE(camkit::core::json::Parse(too_deep, root, error));
  REQUIRE(error.find("nesting") != std::string::npos);
}
