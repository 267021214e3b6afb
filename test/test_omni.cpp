#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <string>

#include "omni/errors.hpp"
#include "omni/handler.hpp"
#include "omni/models.hpp"
#include "omni/registry.hpp"

namespace json = boost::json;
namespace omni = xpto::omni;
namespace models = xpto::omni::models;

namespace {

using reply_t = omni::asio::awaitable<std::optional<json::value>>;

std::shared_ptr<omni::endpoint_handler> tagged(
    std::string_view name, std::string_view language, std::string tag) {
  return omni::make_handler<json::value, json::value>(
      name, language,
      [tag](json::value) -> reply_t { co_return json::value_from(tag); });
}

}  // namespace

TEST_CASE("registry-resolves-exact-language") {
  omni::endpoint_registry registry;
  auto x = tagged("format", "x", "x");
  auto y = tagged("format", "y", "y");
  registry.add(x);
  registry.add(y);

  CHECK(&registry.resolve("format", "x") == x.get());
  CHECK(&registry.resolve("format", "y") == y.get());
}

TEST_CASE("registry-falls-back-to-any-language") {
  omni::endpoint_registry registry;
  auto x = tagged("format", "x", "x");
  auto any = tagged("format", omni::any_language, "any");
  registry.add(x);
  registry.add(any);

  CHECK(&registry.resolve("format", "x") == x.get());
  CHECK(&registry.resolve("format", "z") == any.get());
  CHECK(&registry.resolve("format", "") == any.get());
}

TEST_CASE("registry-unknown-endpoint") {
  omni::endpoint_registry registry;
  registry.add(tagged("format", "x", "x"));

  CHECK_THROWS_AS(
      registry.resolve("format", "y"), omni::unknown_endpoint_error);
  CHECK_THROWS_AS(
      registry.resolve("findsymbols", "x"), omni::unknown_endpoint_error);
}

TEST_CASE("registry-duplicate-leaves-table-intact") {
  omni::endpoint_registry registry;
  auto first = tagged("format", "x", "first");
  registry.add(first);
  registry.add(tagged("format", omni::any_language, "any"));

  CHECK_THROWS_AS(
      registry.add(tagged("format", "x", "second")),
      omni::duplicate_handler_error);
  CHECK_THROWS_AS(
      registry.add(tagged("/Format", "X", "third")),
      omni::duplicate_handler_error);

  CHECK(registry.size() == 2);
  CHECK(&registry.resolve("format", "x") == first.get());
}

TEST_CASE("registry-normalizes-names") {
  omni::endpoint_registry registry;
  auto h = tagged("/CodeFormat", "CSharp", "h");
  registry.add(h);

  CHECK(h->descriptor().name == "codeformat");
  CHECK(h->descriptor().language == "csharp");
  CHECK(&registry.resolve("codeformat", "csharp") == h.get());
  CHECK(&registry.resolve("/codeformat", "CSHARP") == h.get());
  CHECK(registry.contains("/CODEFORMAT"));
  CHECK_FALSE(registry.contains("code"));
}

TEST_CASE("registry-lists-endpoints") {
  omni::endpoint_registry registry;
  registry.add(tagged("b", "x", "1"));
  registry.add(tagged("a", omni::any_language, "2"));

  auto list = registry.endpoints();
  REQUIRE(list.size() == 2);
  CHECK(list[0].name == "a");
  CHECK(list[1].name == "b");
  CHECK(list[1].language == "x");
}

TEST_CASE("models-fields-ignore-case") {
  auto req = json::value_to<models::fix_usings_request>(
      json::parse(R"({"fileName":"a.cs","BUFFER":"using B;","wantsTextChanges":true})"));
  CHECK(req.file_name == "a.cs");
  CHECK(req.buffer == "using B;");
  CHECK(req.wants_text_changes);
  CHECK(req.apply_text_changes);

  req = json::value_to<models::fix_usings_request>(
      json::parse(R"({"FileName":"a.cs","ApplyTextChanges":false})"));
  CHECK_FALSE(req.buffer);
  CHECK_FALSE(req.apply_text_changes);
}

TEST_CASE("models-find-symbols-all-optional") {
  auto req = json::value_to<models::find_symbols_request>(json::parse("{}"));
  CHECK_FALSE(req.language);
  CHECK_FALSE(req.filter);

  CHECK_THROWS(json::value_to<models::find_symbols_request>(
      json::parse(R"({"Filter":42})")));
}

TEST_CASE("models-fix-usings-response-shape") {
  models::fix_usings_response res{};
  res.changes.push_back({"using A;\n", 0, 0, 0, 0});
  res.ambiguous_results.push_back({"a.cs", 4, 1, 4, 6, "Console"});

  auto jv = json::value_from(res);
  auto& obj = jv.as_object();
  CHECK(obj.at("Buffer").is_null());
  REQUIRE(obj.at("Changes").as_array().size() == 1);
  auto& amb = obj.at("AmbiguousResults").as_array();
  REQUIRE(amb.size() == 1);
  CHECK(amb[0].as_object().at("Text").as_string() == "Console");
  CHECK(amb[0].as_object().at("Line").as_int64() == 4);
}
