#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

#include "cwcheck/sema/symbol_extractor.hpp"
#include "cwcheck/sema/symbol_index.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;
using namespace cwcheck::sema;

namespace
{

SymbolDecl type_decl(std::string_view type, std::string_view name, uint32_t file, uint32_t offset)
{
  SymbolDecl d;
  d.kind = SymbolKind::TypeInstance;
  d.group = intern(type);
  d.name = intern(name);
  d.range = SourceRange(FileId{file}, offset, offset + static_cast<uint32_t>(name.size()));
  return d;
}

bool has_name(const std::vector<SymbolDecl> & decls, SymbolKind kind, std::string_view group, std::string_view name)
{
  return std::any_of(decls.begin(), decls.end(), [&](const SymbolDecl & d) {
    return d.kind == kind && d.group.folded() == intern(group).folded() && d.name.str() == name;
  });
}

}  // namespace

TEST(SymbolIndex, ReplaceReportsChangedGroups)
{
  SymbolIndex index;
  const auto first = index.replace_document_symbols(
    FileId{1}, {type_decl("event", "foo", 1, 0), type_decl("trait", "brave", 1, 10)});
  ASSERT_EQ(first.size(), 2U);
  EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));

  EXPECT_TRUE(index.contains(SymbolKind::TypeInstance, intern("Event"), intern("FOO")));
  EXPECT_FALSE(index.contains(SymbolKind::ValueSetMember, intern("event"), intern("foo")));

  // Same names at new positions: nothing a reader could observe changed.
  const auto moved = index.replace_document_symbols(
    FileId{1}, {type_decl("event", "foo", 1, 4), type_decl("trait", "brave", 1, 14)});
  EXPECT_TRUE(moved.empty());
  const auto locs = index.lookup(SymbolKind::TypeInstance, intern("event"), intern("foo"));
  ASSERT_EQ(locs.size(), 1U);
  EXPECT_EQ(locs[0].range.begin_offset(), 4U);

  const auto renamed = index.replace_document_symbols(
    FileId{1}, {type_decl("event", "bar", 1, 4), type_decl("trait", "brave", 1, 14)});
  ASSERT_EQ(renamed.size(), 1U);
  EXPECT_EQ(renamed[0].kind, SymbolKind::TypeInstance);
  EXPECT_EQ(renamed[0].group, intern("event"));
  EXPECT_FALSE(index.contains(SymbolKind::TypeInstance, intern("event"), intern("foo")));
  EXPECT_TRUE(index.contains(SymbolKind::TypeInstance, intern("event"), intern("bar")));
}

TEST(SymbolIndex, NamesDeclaredInSeveralDocuments)
{
  SymbolIndex index;
  (void)index.replace_document_symbols(FileId{1}, {type_decl("event", "shared", 1, 0)});
  (void)index.replace_document_symbols(FileId{2}, {type_decl("event", "Shared", 2, 0)});

  EXPECT_EQ(index.lookup(SymbolKind::TypeInstance, intern("event"), intern("shared")).size(), 2U);
  EXPECT_EQ(index.size(), 1U);

  const auto removed = index.remove_document(FileId{1});
  ASSERT_EQ(removed.size(), 1U);
  EXPECT_TRUE(index.contains(SymbolKind::TypeInstance, intern("event"), intern("shared")));

  (void)index.remove_document(FileId{2});
  EXPECT_FALSE(index.contains(SymbolKind::TypeInstance, intern("event"), intern("shared")));
  EXPECT_EQ(index.size(), 0U);

  EXPECT_TRUE(index.remove_document(FileId{9}).empty());
}

TEST(SymbolIndex, NamesAreSortedCaseInsensitively)
{
  SymbolIndex index;
  (void)index.replace_document_symbols(
    FileId{1},
    {type_decl("event", "Zulu", 1, 0), type_decl("event", "alpha", 1, 10), type_decl("event", "Bravo", 1, 20)});
  const auto names = index.names(SymbolKind::TypeInstance, intern("event"));
  ASSERT_EQ(names.size(), 3U);
  EXPECT_EQ(names[0].str(), "alpha");
  EXPECT_EQ(names[1].str(), "Bravo");
  EXPECT_EQ(names[2].str(), "Zulu");
  EXPECT_TRUE(index.names(SymbolKind::TypeInstance, intern("missing")).empty());
}

TEST(SymbolIndex, DocumentSymbolsAndClear)
{
  SymbolIndex index;
  (void)index.replace_document_symbols(FileId{3}, {type_decl("event", "a", 3, 0), type_decl("event", "b", 3, 5)});
  EXPECT_EQ(index.document_symbols(FileId{3}).size(), 2U);
  EXPECT_TRUE(index.document_symbols(FileId{4}).empty());

  index.clear();
  EXPECT_EQ(index.size(), 0U);
  EXPECT_TRUE(index.document_symbols(FileId{3}).empty());
}

TEST(SymbolIndex, ConcurrentWritersAndReaders)
{
  SymbolIndex index(4);
  std::vector<std::thread> threads;
  for (uint32_t t = 0; t < 8; ++t) {
    threads.emplace_back([&index, t] {
      for (uint32_t i = 0; i < 50; ++i) {
        std::vector<SymbolDecl> decls;
        decls.push_back(type_decl("event", "ev_" + std::to_string(t) + "_" + std::to_string(i), t, i));
        (void)index.replace_document_symbols(FileId{t}, std::move(decls));
        (void)index.contains(SymbolKind::TypeInstance, intern("event"), intern("ev_0_0"));
      }
    });
  }
  for (auto & th : threads) {
    th.join();
  }
  // Each document keeps only its last declaration.
  EXPECT_EQ(index.size(), 8U);
  for (uint32_t t = 0; t < 8; ++t) {
    EXPECT_TRUE(index.contains(
      SymbolKind::TypeInstance, intern("event"), intern("ev_" + std::to_string(t) + "_49")));
  }
}

TEST(SymbolExtractor, ValueSetsAndComplexEnums)
{
  auto schema = test_support::load_schema(
    "types = { type[event] = { path = \"game/events\" name_field = id } }\n"
    "enums = {\n"
    "  complex_enum[event_ids] = { path = \"game/events\" name = { id = enum_name } }\n"
    "  complex_enum[files] = { path = \"game/events\" start_from_root = yes name = { enum_name = { } } }\n"
    "  complex_enum[tags] = { path = \"game/events\" name = { tags = { enum_name } } }\n"
    "}\n"
    "event = {\n"
    "  id = scalar\n"
    "  ## cardinality = 0..inf\n"
    "  set_flag = value_set[flag]\n"
    "  ## cardinality = 0..1\n"
    "  option = {\n"
    "    ## cardinality = 0..inf\n"
    "    set_flag = value_set[flag]\n"
    "  }\n"
    "  ## cardinality = 0..1\n"
    "  tags = { value_set[tag] }\n"
    "}\n");
  ASSERT_TRUE(schema->ok());

  auto unit = test_support::parse(
    "first = { id = ev.1 set_flag = top option = { set_flag = nested } tags = { red blue } }\n"
    "second = { id = ev.2 }\n",
    "events/a.txt");
  ASSERT_TRUE(unit.diags.empty());

  const SymbolExtractor extractor(schema->snap());
  const auto decls = extractor.extract(unit.root, "events/a.txt");

  EXPECT_TRUE(has_name(decls, SymbolKind::TypeInstance, "event", "ev.1"));
  EXPECT_TRUE(has_name(decls, SymbolKind::TypeInstance, "event", "ev.2"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ValueSetMember, "flag", "top"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ValueSetMember, "flag", "nested"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ValueSetMember, "tag", "red"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ComplexEnumMember, "event_ids", "ev.1"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ComplexEnumMember, "event_ids", "ev.2"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ComplexEnumMember, "files", "first"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ComplexEnumMember, "files", "second"));
  EXPECT_TRUE(has_name(decls, SymbolKind::ComplexEnumMember, "tags", "blue"));

  // Documents outside the declared paths contribute nothing.
  EXPECT_TRUE(extractor.extract(unit.root, "common/a.txt").empty());
}
