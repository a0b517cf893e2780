#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "cwcheck/lsp.hpp"
#include "cwcheck/project/engine_config.hpp"

using json = nlohmann::json;

static uint32_t find_byte_offset(const std::string & text, const std::string & needle)
{
  const auto pos = text.find(needle);
  EXPECT_NE(pos, std::string::npos) << "needle must exist: '" << needle << "'";
  if (pos == std::string::npos) return 0U;
  return static_cast<uint32_t>(pos);
}

static constexpr const char * k_schema_uri = "file:///cfg/main.cwt";
static constexpr const char * k_event_uri = "file:///mod/events/a.txt";
static constexpr const char * k_trait_uri = "file:///mod/traits/t.txt";

static std::string schema_source()
{
  return "types = {\n"
         "  type[event] = {\n"
         "    path = \"game/events\"\n"
         "    localisation = {\n"
         "      ## required\n"
         "      title = \"$_title\"\n"
         "    }\n"
         "  }\n"
         "  type[trait] = { path = \"game/traits\" }\n"
         "}\n"
         "enums = { enum[weekday] = { monday tuesday } }\n"
         "event = {\n"
         "  ## cardinality = 0..1\n"
         "  day = enum[weekday]\n"
         "  ## cardinality = 0..1\n"
         "  hidden = bool\n"
         "  ## cardinality = 0..inf\n"
         "  trait = <trait>\n"
         "}\n"
         "trait = { }\n";
}

static cwcheck::EngineConfig mod_config()
{
  cwcheck::EngineConfig cfg;
  cfg.config_root = "/";
  cfg.workspace.roots = {"mod"};
  cfg.analysis.workers = 2;
  return cfg;
}

static std::vector<std::string> labels_of(const json & items)
{
  std::vector<std::string> out;
  for (const auto & it : items) {
    out.push_back(it["label"].get<std::string>());
  }
  return out;
}

class LspWorkspace : public ::testing::Test
{
protected:
  LspWorkspace() : ws_(mod_config()) {}

  void SetUp() override
  {
    const auto j = json::parse(ws_.load_schema_text({{k_schema_uri, schema_source()}}));
    ASSERT_TRUE(j["success"].get<bool>()) << j.dump();
  }

  cwcheck::lsp::Workspace ws_;
};

TEST_F(LspWorkspace, SchemaLoadResult)
{
  const auto ok = json::parse(ws_.load_schema_text({{k_schema_uri, schema_source()}}));
  EXPECT_TRUE(ok["success"].get<bool>());
  EXPECT_EQ(ok["generation"], 2);
  EXPECT_TRUE(ok["items"].empty());

  const auto failed = json::parse(ws_.load_schema_text({{"file:///cfg/broken.cwt", "types = {\n"}}));
  EXPECT_FALSE(failed["success"].get<bool>());
  ASSERT_FALSE(failed["items"].empty());
  EXPECT_EQ(failed["items"][0]["source"], "schema");
  EXPECT_EQ(failed["items"][0]["severity"], "Error");
  EXPECT_EQ(failed["items"][0]["uri"], "file:///cfg/broken.cwt");

  // The previous schema stays in force.
  ws_.set_document(k_event_uri, "ev = { day = monday }\n");
  ws_.set_localisation_keys({"ev_title"});
  EXPECT_TRUE(json::parse(ws_.diagnostics_json(k_event_uri))["items"].empty());
}

TEST_F(LspWorkspace, UnreadableSchemaFiles)
{
  const auto j = json::parse(ws_.load_schema_files({"/nonexistent/cwcheck/schema.cwt"}));
  EXPECT_FALSE(j["success"].get<bool>());
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_EQ(j["items"][0]["message"], "cannot read schema file: /nonexistent/cwcheck/schema.cwt");
}

TEST_F(LspWorkspace, Diagnostics)
{
  ws_.set_document(k_event_uri, "ev = { bogus = 1 }\n");
  EXPECT_TRUE(ws_.has_document(k_event_uri));

  const auto j = json::parse(ws_.diagnostics_json(k_event_uri));
  EXPECT_EQ(j["uri"], k_event_uri);
  ASSERT_TRUE(j["items"].is_array());
  ASSERT_EQ(j["items"].size(), 1U);

  const auto & d = j["items"][0];
  EXPECT_EQ(d["message"], "unexpected key 'bogus'");
  EXPECT_EQ(d["code"], "unexpected-key");
  EXPECT_EQ(d["source"], "validator");
  EXPECT_EQ(d["severity"], "Error");
  EXPECT_EQ(d["uri"], k_event_uri);
  EXPECT_EQ(d["range"]["startByte"], 7);
  EXPECT_EQ(d["range"]["endByte"], 12);
  EXPECT_EQ(d["range"]["startLine"], 1);
}

TEST_F(LspWorkspace, DiagnosticsText)
{
  ws_.set_document(k_event_uri, "ev = { bogus = 1 }\n");
  const std::string text = ws_.diagnostics_text(k_event_uri);
  EXPECT_EQ(text.rfind("error[unexpected-key]: unexpected key 'bogus'\n --> events/a.txt:1:8\n", 0), 0U) << text;
  EXPECT_NE(text.find("1 | ev = { bogus = 1 }\n"), std::string::npos) << text;
  EXPECT_NE(text.find("  |        ^^^^^"), std::string::npos) << text;

  ws_.set_document(k_event_uri, "ev = { day = monday }\n");
  EXPECT_TRUE(ws_.diagnostics_text(k_event_uri).empty());
  EXPECT_TRUE(ws_.diagnostics_text("file:///mod/events/unknown.txt").empty());
}

TEST_F(LspWorkspace, ParseErrorsComeFromTheParser)
{
  ws_.set_document(k_event_uri, "ev = { day = monday\n");
  const auto j = json::parse(ws_.diagnostics_json(k_event_uri));
  ASSERT_FALSE(j["items"].empty());
  EXPECT_EQ(j["items"][0]["source"], "parser");
  EXPECT_EQ(j["items"][0]["code"], "syntax-error");
}

TEST_F(LspWorkspace, CardinalityDetails)
{
  ws_.set_document(k_event_uri, "ev = { day = monday day = tuesday }\n");
  const auto j = json::parse(ws_.diagnostics_json(k_event_uri));
  ASSERT_EQ(j["items"].size(), 1U);
  const auto & c = j["items"][0]["cardinality"];
  EXPECT_EQ(c["count"], 2);
  EXPECT_EQ(c["min"], 0);
  EXPECT_EQ(c["max"], 1);
}

TEST_F(LspWorkspace, UnknownDocumentsAreEmpty)
{
  EXPECT_FALSE(ws_.has_document("file:///mod/events/none.txt"));
  EXPECT_TRUE(json::parse(ws_.diagnostics_json("file:///mod/events/none.txt"))["items"].empty());
  EXPECT_TRUE(json::parse(ws_.completion_json("file:///mod/events/none.txt", 0))["items"].empty());
  EXPECT_TRUE(json::parse(ws_.definition_json("file:///mod/events/none.txt", 0))["locations"].empty());
  EXPECT_TRUE(json::parse(ws_.document_symbols_json("file:///mod/events/none.txt"))["symbols"].empty());
}

TEST_F(LspWorkspace, CompletionFiltersByTypedPrefix)
{
  const std::string src = "ev = { day = mo }\n";
  ws_.set_document(k_event_uri, src);

  const uint32_t off = find_byte_offset(src, "mo") + 2U;
  const auto j = json::parse(ws_.completion_json(k_event_uri, off));
  ASSERT_TRUE(j.contains("items"));
  EXPECT_EQ(labels_of(j["items"]), (std::vector<std::string>{"monday"}));

  const auto & item = j["items"][0];
  EXPECT_EQ(item["kind"], "EnumMember");
  EXPECT_EQ(item["detail"], "weekday");
  EXPECT_EQ(item["insertText"], "monday");
  EXPECT_EQ(item["replaceRange"]["startByte"], off - 2U);
  EXPECT_EQ(item["replaceRange"]["endByte"], off);
}

TEST_F(LspWorkspace, CompletionOfKeys)
{
  const std::string src = "ev = {\n  \n}\n";
  ws_.set_document(k_event_uri, src);

  const uint32_t off = find_byte_offset(src, "  \n") + 2U;
  const auto j = json::parse(ws_.completion_json(k_event_uri, off));
  EXPECT_EQ(labels_of(j["items"]), (std::vector<std::string>{"day", "hidden", "trait"}));
  EXPECT_EQ(j["items"][0]["kind"], "Property");
}

TEST_F(LspWorkspace, DefinitionAcrossDocuments)
{
  ws_.set_document(k_trait_uri, "calm = { }\nbrave = { }\n");
  const std::string src = "ev = { trait = brave }\n";
  ws_.set_document(k_event_uri, src);

  const uint32_t off = find_byte_offset(src, "brave") + 2U;
  const auto j = json::parse(ws_.definition_json(k_event_uri, off));
  ASSERT_EQ(j["locations"].size(), 1U);

  const auto & loc = j["locations"][0];
  EXPECT_EQ(loc["uri"], k_trait_uri);
  EXPECT_EQ(loc["type"], "trait");
  EXPECT_EQ(loc["name"], "brave");
  EXPECT_EQ(loc["range"]["startLine"], 2);

  // Entity keys resolve to their own declaration.
  const auto self = json::parse(ws_.definition_json(k_event_uri, 0U));
  ASSERT_EQ(self["locations"].size(), 1U);
  EXPECT_EQ(self["locations"][0]["type"], "event");
  EXPECT_EQ(self["locations"][0]["uri"], k_event_uri);
}

TEST_F(LspWorkspace, SymbolListings)
{
  ws_.set_documents({{k_trait_uri, "calm = { }\nbrave = { }\n"}, {k_event_uri, "ev = { trait = calm }\n"}});

  const auto all = json::parse(ws_.symbols_json("trait"));
  EXPECT_EQ(all["type"], "trait");
  ASSERT_EQ(all["symbols"].size(), 2U);
  EXPECT_EQ(all["symbols"][0]["name"], "brave");
  EXPECT_EQ(all["symbols"][1]["name"], "calm");
  EXPECT_EQ(all["symbols"][0]["uri"], k_trait_uri);

  const auto outline = json::parse(ws_.document_symbols_json(k_trait_uri));
  ASSERT_EQ(outline["symbols"].size(), 2U);
  std::vector<std::string> names;
  for (const auto & s : outline["symbols"]) {
    EXPECT_EQ(s["kind"], "type");
    EXPECT_EQ(s["detail"], "trait");
    names.push_back(s["name"].get<std::string>());
  }
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"brave", "calm"}));

  EXPECT_TRUE(json::parse(ws_.diagnostics_json(k_event_uri))["items"].empty());
}

TEST_F(LspWorkspace, LocalisationKeys)
{
  ws_.set_document(k_event_uri, "ev = { }\n");
  EXPECT_TRUE(json::parse(ws_.diagnostics_json(k_event_uri))["items"].empty());

  ws_.set_localisation_keys({"other_title"});
  const auto missing = json::parse(ws_.diagnostics_json(k_event_uri));
  ASSERT_EQ(missing["items"].size(), 1U);
  EXPECT_EQ(missing["items"][0]["message"], "missing localisation key 'ev_title' for event 'ev'");
  EXPECT_EQ(missing["items"][0]["code"], "missing-localisation-key");

  ws_.set_localisation_keys({"other_title", "ev_title"});
  EXPECT_TRUE(json::parse(ws_.diagnostics_json(k_event_uri))["items"].empty());
}

TEST_F(LspWorkspace, RemoveDocument)
{
  ws_.set_document(k_trait_uri, "brave = { }\n");
  ws_.set_document(k_event_uri, "ev = { trait = brave }\n");
  EXPECT_TRUE(json::parse(ws_.diagnostics_json(k_event_uri))["items"].empty());

  ws_.remove_document(k_trait_uri);
  EXPECT_FALSE(ws_.has_document(k_trait_uri));
  const auto j = json::parse(ws_.diagnostics_json(k_event_uri));
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_EQ(j["items"][0]["message"], "undefined trait 'brave'");

  // Removing twice is harmless.
  ws_.remove_document(k_trait_uri);
}

TEST_F(LspWorkspace, Diff)
{
  const std::string uri_b = "file:///mod/events/b.txt";
  ws_.set_document(k_event_uri, "ev = { day = monday }\n");
  ws_.set_document(uri_b, "ev = { day = tuesday hidden = yes }\n");

  const auto j = json::parse(ws_.diff_json(k_event_uri, uri_b));
  EXPECT_EQ(j["uriA"], k_event_uri);
  EXPECT_EQ(j["uriB"], uri_b);
  ASSERT_EQ(j["changes"].size(), 2U);
  EXPECT_EQ(j["changes"][0]["kind"], "Changed");
  EXPECT_EQ(j["changes"][0]["path"], "ev/day");
  EXPECT_EQ(j["changes"][0]["old"], "monday");
  EXPECT_EQ(j["changes"][0]["new"], "tuesday");
  EXPECT_EQ(j["changes"][1]["kind"], "Added");
  EXPECT_EQ(j["changes"][1]["path"], "ev/hidden");

  EXPECT_TRUE(json::parse(ws_.diff_json(k_event_uri, "file:///mod/events/none.txt"))["changes"].empty());
}

TEST_F(LspWorkspace, AstDump)
{
  ws_.set_document(k_event_uri, "ev = { day = monday }\n");
  const auto j = json::parse(ws_.ast_json(k_event_uri));
  ASSERT_TRUE(j["ast"].is_object());
  EXPECT_EQ(j["ast"]["type"], "Block");
  ASSERT_EQ(j["ast"]["entries"].size(), 1U);
  EXPECT_EQ(j["ast"]["entries"][0]["key"], "ev");
  EXPECT_EQ(j["ast"]["entries"][0]["value"]["entries"][0]["value"]["text"], "monday");

  EXPECT_TRUE(json::parse(ws_.ast_json("file:///mod/events/none.txt"))["ast"].is_null());
}

TEST(LspWorkspaceMove, MovedWorkspaceKeepsItsDocuments)
{
  cwcheck::lsp::Workspace first(mod_config());
  first.set_document(k_event_uri, "ev = { }\n");

  cwcheck::lsp::Workspace second(std::move(first));
  EXPECT_TRUE(second.has_document(k_event_uri));

  cwcheck::lsp::Workspace third;
  third = std::move(second);
  EXPECT_TRUE(third.has_document(k_event_uri));
}
