#include "omni/models.hpp"

#include "json_helpers.hpp"

namespace xpto::omni::models {

namespace {

const json::object& as_request_object(const json::value& jv) {
  auto* obj = jv.if_object();
  if (!obj) utils::throwf<std::invalid_argument>("request is not an object");
  return *obj;
}

void put_optional(
    json::object& obj, std::string_view key,
    const std::optional<std::string>& s) {
  if (s)
    obj[key] = *s;
  else
    obj[key] = nullptr;
}

}  // namespace

text_change tag_invoke(json::value_to_tag<text_change>, const json::value& jv) {
  const auto& obj = as_request_object(jv);
  text_change c{};
  c.new_text = optional_string(obj, "NewText").value_or("");
  c.start_line = optional_int(obj, "StartLine", 0);
  c.start_column = optional_int(obj, "StartColumn", 0);
  c.end_line = optional_int(obj, "EndLine", 0);
  c.end_column = optional_int(obj, "EndColumn", 0);
  return c;
}

void tag_invoke(json::value_from_tag, json::value& jv, const text_change& c) {
  json::object obj{};
  obj["NewText"] = c.new_text;
  obj["StartLine"] = c.start_line;
  obj["StartColumn"] = c.start_column;
  obj["EndLine"] = c.end_line;
  obj["EndColumn"] = c.end_column;
  jv = std::move(obj);
}

quick_fix tag_invoke(json::value_to_tag<quick_fix>, const json::value& jv) {
  const auto& obj = as_request_object(jv);
  quick_fix q{};
  q.file_name = optional_string(obj, "FileName").value_or("");
  q.line = optional_int(obj, "Line", 0);
  q.column = optional_int(obj, "Column", 0);
  q.end_line = optional_int(obj, "EndLine", 0);
  q.end_column = optional_int(obj, "EndColumn", 0);
  q.text = optional_string(obj, "Text").value_or("");
  return q;
}

void tag_invoke(json::value_from_tag, json::value& jv, const quick_fix& q) {
  json::object obj{};
  obj["FileName"] = q.file_name;
  obj["Line"] = q.line;
  obj["Column"] = q.column;
  obj["EndLine"] = q.end_line;
  obj["EndColumn"] = q.end_column;
  obj["Text"] = q.text;
  jv = std::move(obj);
}

code_format_request tag_invoke(
    json::value_to_tag<code_format_request>, const json::value& jv) {
  const auto& obj = as_request_object(jv);
  code_format_request r{};
  r.file_name = required_string(obj, "FileName");
  r.buffer = optional_string(obj, "Buffer");
  r.wants_text_changes = optional_bool(obj, "WantsTextChanges", false);
  return r;
}

void tag_invoke(
    json::value_from_tag, json::value& jv, const code_format_response& r) {
  json::object obj{};
  put_optional(obj, "Buffer", r.buffer);
  obj["Changes"] = json::value_from(r.changes);
  jv = std::move(obj);
}

find_symbols_request tag_invoke(
    json::value_to_tag<find_symbols_request>, const json::value& jv) {
  const auto& obj = as_request_object(jv);
  find_symbols_request r{};
  r.language = optional_string(obj, "Language");
  r.filter = optional_string(obj, "Filter");
  return r;
}

void tag_invoke(
    json::value_from_tag, json::value& jv, const quick_fix_response& r) {
  json::object obj{};
  obj["QuickFixes"] = json::value_from(r.quick_fixes);
  jv = std::move(obj);
}

fix_usings_request tag_invoke(
    json::value_to_tag<fix_usings_request>, const json::value& jv) {
  const auto& obj = as_request_object(jv);
  fix_usings_request r{};
  r.file_name = required_string(obj, "FileName");
  r.buffer = optional_string(obj, "Buffer");
  r.wants_text_changes = optional_bool(obj, "WantsTextChanges", false);
  r.apply_text_changes = optional_bool(obj, "ApplyTextChanges", true);
  return r;
}

void tag_invoke(
    json::value_from_tag, json::value& jv, const fix_usings_response& r) {
  json::object obj{};
  put_optional(obj, "Buffer", r.buffer);
  obj["Changes"] = json::value_from(r.changes);
  obj["AmbiguousResults"] = json::value_from(r.ambiguous_results);
  jv = std::move(obj);
}

}  // namespace xpto::omni::models
