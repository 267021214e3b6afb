#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xpto::omni::models {

namespace json = boost::json;

// Field names follow the wire (PascalCase); reading ignores case.

struct text_change {
  std::string new_text;
  int64_t start_line{};
  int64_t start_column{};
  int64_t end_line{};
  int64_t end_column{};
};

struct quick_fix {
  std::string file_name;
  int64_t line{};
  int64_t column{};
  int64_t end_line{};
  int64_t end_column{};
  std::string text;
};

/// codeformat

struct code_format_request {
  std::string file_name;
  std::optional<std::string> buffer;
  bool wants_text_changes{};
};

struct code_format_response {
  std::optional<std::string> buffer;
  std::vector<text_change> changes;
};

/// findsymbols

struct find_symbols_request {
  std::optional<std::string> language;
  std::optional<std::string> filter;
};

struct quick_fix_response {
  std::vector<quick_fix> quick_fixes;
};

/// fixusings

struct fix_usings_request {
  std::string file_name;
  std::optional<std::string> buffer;
  bool wants_text_changes{};
  bool apply_text_changes{true};
};

struct fix_usings_response {
  std::optional<std::string> buffer;
  std::vector<text_change> changes;
  std::vector<quick_fix> ambiguous_results;
};

text_change tag_invoke(json::value_to_tag<text_change>, const json::value& jv);
void tag_invoke(json::value_from_tag, json::value& jv, const text_change& c);

quick_fix tag_invoke(json::value_to_tag<quick_fix>, const json::value& jv);
void tag_invoke(json::value_from_tag, json::value& jv, const quick_fix& q);

code_format_request tag_invoke(
    json::value_to_tag<code_format_request>, const json::value& jv);
void tag_invoke(
    json::value_from_tag, json::value& jv, const code_format_response& r);

find_symbols_request tag_invoke(
    json::value_to_tag<find_symbols_request>, const json::value& jv);
void tag_invoke(
    json::value_from_tag, json::value& jv, const quick_fix_response& r);

fix_usings_request tag_invoke(
    json::value_to_tag<fix_usings_request>, const json::value& jv);
void tag_invoke(
    json::value_from_tag, json::value& jv, const fix_usings_response& r);

}  // namespace xpto::omni::models
