#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "cwcheck/analysis/analysis_store.hpp"
#include "cwcheck/sema/localisation.hpp"
#include "cwcheck/syntax/frontend.hpp"

using namespace cwcheck;
using namespace cwcheck::analysis;

namespace
{

const char * k_schema =
  "types = {\n"
  "  type[event] = {\n"
  "    path = \"game/events\"\n"
  "    localisation = {\n"
  "      ## required\n"
  "      title = \"$_title\"\n"
  "    }\n"
  "  }\n"
  "  type[trait] = { path = \"game/traits\" }\n"
  "}\n"
  "event = {\n"
  "  ## cardinality = 0..1\n"
  "  day = int\n"
  "  ## cardinality = 0..inf\n"
  "  trait = <trait>\n"
  "}\n"
  "trait = { }\n";

StoreOptions two_workers()
{
  StoreOptions options;
  options.workers = 2;
  return options;
}

size_t count(const std::vector<Diagnostic> & diags, RuleCode rule)
{
  return static_cast<size_t>(
    std::count_if(diags.begin(), diags.end(), [rule](const Diagnostic & d) { return d.rule == rule; }));
}

class UnavailableOracle : public sema::LocalisationOracle
{
public:
  [[nodiscard]] bool contains(std::string_view /*key*/) const override
  {
    throw std::runtime_error("localisation backend unavailable");
  }
};

class AnalysisStoreTest : public ::testing::Test
{
protected:
  AnalysisStoreTest() : store_(two_workers()) {}

  void SetUp() override
  {
    const auto result = store_.load_schema({schema::SchemaSource{"<test>.cwt", k_schema}});
    ASSERT_TRUE(result.success);
  }

  AnalysisStore store_;
};

}  // namespace

TEST_F(AnalysisStoreTest, OpenPublishesParseAndValidationDiagnostics)
{
  store_.open("events/a.txt", "ev = { bogus = 1 day = }\n");
  const auto diags = store_.diagnostics("events/a.txt");
  ASSERT_GE(diags.size(), 2U);
  EXPECT_EQ(diags.front().rule, RuleCode::SyntaxError);
  EXPECT_EQ(count(diags, RuleCode::UnexpectedKey), 1U);
  EXPECT_EQ(store_.revision("events/a.txt"), 1U);
  EXPECT_TRUE(store_.engine_errors().empty());
}

TEST_F(AnalysisStoreTest, ChangeReplacesDiagnostics)
{
  store_.open("events/a.txt", "ev = { day = soon }\n");
  EXPECT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::TypeMismatch), 1U);

  store_.change("events/a.txt", "ev = { day = 3 }\n");
  EXPECT_EQ(store_.revision("events/a.txt"), 2U);
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());
}

TEST_F(AnalysisStoreTest, ChangeOnUnknownPathOpensIt)
{
  EXPECT_FALSE(store_.has_document("events/new.txt"));
  store_.change("events/new.txt", "ev = { day = 1 }\n");
  EXPECT_TRUE(store_.has_document("events/new.txt"));
  EXPECT_EQ(store_.revision("events/new.txt"), 1U);
  EXPECT_TRUE(store_.diagnostics("events/new.txt").empty());
}

TEST_F(AnalysisStoreTest, PathsAreNormalised)
{
  store_.open(".\\events\\a.txt", "ev = { }\n");
  EXPECT_TRUE(store_.has_document("events/a.txt"));
  EXPECT_TRUE(store_.has_document("./events/a.txt"));
  EXPECT_EQ(store_.document_paths(), (std::vector<std::string>{"events/a.txt"}));
}

TEST_F(AnalysisStoreTest, DependentsRevalidateWhenSymbolsChange)
{
  store_.open("events/a.txt", "ev = { trait = brave }\n");
  ASSERT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::UndefinedReference), 1U);

  store_.open("traits/t.txt", "brave = { }\n");
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());

  store_.close("traits/t.txt");
  EXPECT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::UndefinedReference), 1U);
}

TEST_F(AnalysisStoreTest, RenamingADeclarationRevalidatesReferrers)
{
  store_.open("traits/t.txt", "brave = { }\n");
  store_.open("events/a.txt", "ev = { trait = brave }\n");
  ASSERT_TRUE(store_.diagnostics("events/a.txt").empty());

  store_.change("traits/t.txt", "bold = { }\n");
  EXPECT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::UndefinedReference), 1U);
}

TEST_F(AnalysisStoreTest, CloseForgetsTheDocument)
{
  store_.open("events/a.txt", "ev = { bogus = 1 }\n");
  ASSERT_FALSE(store_.diagnostics("events/a.txt").empty());
  store_.close("events/a.txt");
  EXPECT_FALSE(store_.has_document("events/a.txt"));
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());
  EXPECT_EQ(store_.revision("events/a.txt"), 0U);
  EXPECT_EQ(store_.parsed("events/a.txt"), nullptr);

  // Closing twice is harmless.
  store_.close("events/a.txt");
}

TEST_F(AnalysisStoreTest, OpenManyIndexesEverything)
{
  std::vector<SourceText> files;
  for (int i = 0; i < 20; ++i) {
    files.emplace_back("traits/t" + std::to_string(i) + ".txt", "trait_" + std::to_string(i) + " = { }\n");
  }
  files.emplace_back("events/a.txt", "ev = { trait = trait_7 trait = trait_99 }\n");
  store_.open_many(std::move(files));

  EXPECT_EQ(store_.symbols("trait").size(), 20U);
  EXPECT_EQ(store_.document_paths().size(), 21U);

  const auto defs = store_.definition("trait", "TRAIT_7");
  ASSERT_EQ(defs.size(), 1U);
  EXPECT_EQ(store_.path_of(defs[0].file), "traits/t7.txt");
  EXPECT_EQ(store_.full_range(defs[0].range).start_line, 1U);

  const auto diags = store_.diagnostics("events/a.txt");
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].message, "undefined trait 'trait_99'");

  const auto outline = store_.document_symbols("traits/t3.txt");
  ASSERT_EQ(outline.size(), 1U);
  EXPECT_EQ(outline[0].name.str(), "trait_3");
}

TEST_F(AnalysisStoreTest, LocalisationOracleTriggersRevalidation)
{
  store_.open("events/a.txt", "ev = { }\n");
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());

  auto oracle = std::make_shared<sema::SetLocalisationOracle>();
  store_.set_localisation(oracle);
  const auto missing = store_.diagnostics("events/a.txt");
  ASSERT_EQ(missing.size(), 1U);
  EXPECT_EQ(missing[0].message, "missing localisation key 'ev_title' for event 'ev'");

  oracle->add("ev_title");
  store_.set_localisation(oracle);
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());
}

TEST_F(AnalysisStoreTest, SchemaReloadRevalidatesAndFailedReloadKeepsState)
{
  store_.open("events/a.txt", "ev = { day = 1 colour = red }\n");
  ASSERT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::UnexpectedKey), 1U);

  const auto failed = store_.load_schema({schema::SchemaSource{"broken.cwt", "types = {\n"}});
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(store_.schema()->generation(), 1U);
  EXPECT_EQ(count(store_.diagnostics("events/a.txt"), RuleCode::UnexpectedKey), 1U);

  const auto reloaded = store_.load_schema({schema::SchemaSource{
    "<test>.cwt",
    "types = { type[event] = { path = \"game/events\" } }\n"
    "event = {\n"
    "  ## cardinality = 0..1\n"
    "  day = int\n"
    "  ## cardinality = 0..1\n"
    "  colour = scalar\n"
    "}\n"}});
  ASSERT_TRUE(reloaded.success);
  EXPECT_EQ(store_.schema()->generation(), 2U);
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());
}

TEST_F(AnalysisStoreTest, DocumentsOpenedBeforeTheSchemaAreValidatedOnLoad)
{
  AnalysisStore fresh(two_workers());
  fresh.open("events/a.txt", "ev = { bogus = 1 }\n");
  EXPECT_TRUE(fresh.diagnostics("events/a.txt").empty());

  ASSERT_TRUE(fresh.load_schema({schema::SchemaSource{"<test>.cwt", k_schema}}).success);
  EXPECT_EQ(count(fresh.diagnostics("events/a.txt"), RuleCode::UnexpectedKey), 1U);
}

TEST_F(AnalysisStoreTest, MaxDiagnosticsAppliesToTheWholeDocument)
{
  StoreOptions options = two_workers();
  options.validation.max_diagnostics = 2;
  AnalysisStore limited(options);
  ASSERT_TRUE(limited.load_schema({schema::SchemaSource{"<test>.cwt", k_schema}}).success);
  limited.open("events/a.txt", "a = { x = 1 }\nb = { y = 1 }\nc = { z = 1 }\n");
  EXPECT_EQ(limited.diagnostics("events/a.txt").size(), 2U);
}

TEST_F(AnalysisStoreTest, ConcurrentEditsPublishTheLatestRevision)
{
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t] {
      const std::string path = "events/e" + std::to_string(t) + ".txt";
      for (int i = 0; i < 25; ++i) {
        store_.change(path, "ev = { day = " + std::to_string(i) + " }\n");
      }
      store_.change(path, "ev = { day = final }\n");
    });
  }
  for (auto & th : threads) {
    th.join();
  }
  store_.wait_idle();

  for (int t = 0; t < 4; ++t) {
    const std::string path = "events/e" + std::to_string(t) + ".txt";
    EXPECT_EQ(store_.revision(path), 26U);
    const auto diags = store_.diagnostics(path);
    ASSERT_EQ(diags.size(), 1U);
    EXPECT_EQ(diags[0].message, "expected an integer, found 'final'");
  }
}

TEST_F(AnalysisStoreTest, ReparsingTheCachedTextGivesAnEqualTree)
{
  store_.open("events/a.txt", "ev = {\n  day = 3 # third\n  trait = brave\n}\nother = { day = }\n");
  const auto cached = store_.parsed("events/a.txt");
  ASSERT_NE(cached, nullptr);

  const auto reparsed = parse_script(cached->file_id, cached->source);
  EXPECT_TRUE(structurally_equal(cached->root, reparsed->root));
  EXPECT_EQ(reparsed->diagnostics.size(), cached->diagnostics.size());
}

TEST_F(AnalysisStoreTest, EditDuringValidationPublishesOnlyTheNewRevision)
{
  std::string large;
  for (int i = 0; i < 2000; ++i) {
    large += "ev_" + std::to_string(i) + " = { day = soon bogus = 1 trait = missing_" + std::to_string(i) + " }\n";
  }
  store_.open("events/big.txt", std::move(large));
  store_.change("events/big.txt", "ev = { day = 1 }\n");

  EXPECT_EQ(store_.revision("events/big.txt"), 2U);
  EXPECT_TRUE(store_.diagnostics("events/big.txt").empty());
  EXPECT_TRUE(store_.engine_errors().empty());
  ASSERT_EQ(store_.document_symbols("events/big.txt").size(), 1U);
}

TEST_F(AnalysisStoreTest, FailedValidationKeepsParseDiagnosticsAndReleasesTheDocument)
{
  store_.set_localisation(std::make_shared<UnavailableOracle>());
  store_.open("events/a.txt", "ev = { day = 1 }\n}\n");

  const auto diags = store_.diagnostics("events/a.txt");
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].rule, RuleCode::SyntaxError);
  EXPECT_EQ(diags[0].message, "unmatched '}'");

  const auto errors = store_.engine_errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0], "events/a.txt: unexpected exception: localisation backend unavailable");

  // The document is not left in flight: later edits still publish.
  auto keys = std::make_shared<sema::SetLocalisationOracle>();
  keys->add("ev_title");
  store_.set_localisation(keys);
  store_.change("events/a.txt", "ev = { day = 1 }\n");
  EXPECT_TRUE(store_.diagnostics("events/a.txt").empty());
  EXPECT_EQ(store_.revision("events/a.txt"), 2U);
}
