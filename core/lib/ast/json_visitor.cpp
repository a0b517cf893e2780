// cwcheck/ast/json_visitor.cpp - JSON serialization implementation
//
#include "cwcheck/ast/json_visitor.hpp"

#include <string>
#include <type_traits>

namespace cwcheck
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.begin_offset()}, {"end", r.end_offset()}};
}

json j_items(const std::vector<Value> & items)
{
  json arr = json::array();
  for (const auto & item : items) {
    arr.push_back(to_json(item));
  }
  return arr;
}

json j_entry(const Entry & e)
{
  json j{
    {"key", std::string(e.key.str())},
    {"op", std::string(to_string(e.op))},
    {"range", j_range(e.range)},
    {"value", to_json(e.value)}};
  if (e.key.quoted) {
    j["quotedKey"] = true;
  }
  if (e.condition) {
    j["condition"] = json{
      {"param", std::string(e.condition->param.str())}, {"negated", e.condition->negated}};
  }
  if (!e.annotations.empty()) {
    json notes = json::array();
    for (const auto & a : e.annotations) {
      notes.push_back(json{
        {"kind", a.kind == Annotation::Kind::Doc ? "doc" : "directive"}, {"text", a.text}});
    }
    j["annotations"] = std::move(notes);
  }
  return j;
}

}  // namespace

json to_json(const Value & value)
{
  return std::visit(
    [](const auto & v) -> json {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Scalar>) {
        return json{
          {"type", "Scalar"},
          {"range", j_range(v.range)},
          {"text", std::string(v.str())},
          {"quoted", v.quoted}};
      } else if constexpr (std::is_same_v<T, Reference>) {
        return json{
          {"type", "Reference"},
          {"range", j_range(v.range)},
          {"kind", std::string(to_string(v.kind))},
          {"name", std::string(v.name.str())}};
      } else if constexpr (std::is_same_v<T, Box<Block>>) {
        return to_json(*v);
      } else {
        json j{{"type", "Array"}, {"range", j_range(v->range)}, {"items", j_items(v->items)}};
        if (v->tag) {
          j["tag"] = std::string(v->tag->str());
        }
        return j;
      }
    },
    value);
}

json to_json(const Block & block)
{
  json entries = json::array();
  for (const auto & e : block.entries) {
    entries.push_back(j_entry(e));
  }
  json j{
    {"type", "Block"},
    {"range", j_range(block.range)},
    {"entries", std::move(entries)},
    {"items", j_items(block.items)}};
  if (block.tag) {
    j["tag"] = std::string(block.tag->str());
  }
  return j;
}

}  // namespace cwcheck
