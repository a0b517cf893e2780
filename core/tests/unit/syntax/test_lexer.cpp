#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "cwcheck/syntax/lexer.hpp"
#include "cwcheck/syntax/token.hpp"

using cwcheck::FileId;
using cwcheck::syntax::LexMode;
using cwcheck::syntax::Lexer;
using cwcheck::syntax::Token;
using cwcheck::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src, LexMode mode = LexMode::Script)
{
  Lexer lexer(FileId{0}, src, mode);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, KeyValuePairs)
{
  const auto toks = lex("namespace = my_mod\nhidden=yes");
  ASSERT_EQ(toks.size(), 7U);
  EXPECT_EQ(toks[0].kind, TokenKind::Word);
  EXPECT_EQ(toks[0].text, "namespace");
  EXPECT_EQ(toks[1].kind, TokenKind::Eq);
  EXPECT_EQ(toks[2].text, "my_mod");
  EXPECT_EQ(toks[3].text, "hidden");
  EXPECT_EQ(toks[4].kind, TokenKind::Eq);
  EXPECT_EQ(toks[5].text, "yes");
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, AllOperators)
{
  const auto toks = lex("a == b != c <> d <= e >= f += g -= h *= i ?= j < k > l");
  const std::vector<TokenKind> expected = {
    TokenKind::Word, TokenKind::EqEq,       TokenKind::Word, TokenKind::Ne,      TokenKind::Word,
    TokenKind::Ne,   TokenKind::Word,       TokenKind::Le,   TokenKind::Word,    TokenKind::Ge,
    TokenKind::Word, TokenKind::PlusEq,     TokenKind::Word, TokenKind::MinusEq, TokenKind::Word,
    TokenKind::MulEq, TokenKind::Word,      TokenKind::QuestionEq, TokenKind::Word, TokenKind::Lt,
    TokenKind::Word, TokenKind::Gt,         TokenKind::Word, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
}

TEST(SyntaxLexer, WordStopsBeforeCompoundAssignment)
{
  const auto toks = lex("value+=1 count-=2");
  ASSERT_GE(toks.size(), 6U);
  EXPECT_EQ(toks[0].text, "value");
  EXPECT_EQ(toks[1].kind, TokenKind::PlusEq);
  EXPECT_EQ(toks[2].text, "1");
  EXPECT_EQ(toks[3].text, "count");
  EXPECT_EQ(toks[4].kind, TokenKind::MinusEq);
}

TEST(SyntaxLexer, NumbersDatesAndNegatives)
{
  const auto toks = lex("x = -1.5 start = 1444.11.11");
  ASSERT_GE(toks.size(), 6U);
  EXPECT_EQ(toks[2].kind, TokenKind::Word);
  EXPECT_EQ(toks[2].text, "-1.5");
  EXPECT_EQ(toks[5].text, "1444.11.11");
}

TEST(SyntaxLexer, StringTextIsInterior)
{
  const auto toks = lex(R"(name = "Hello \"World\"")");
  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[2].kind, TokenKind::String);
  EXPECT_EQ(toks[2].text, R"(Hello \"World\")");
  EXPECT_EQ(toks[2].range.begin_offset(), 7U);
  EXPECT_EQ(toks[2].range.end_offset(), 24U);
}

TEST(SyntaxLexer, UnterminatedStringStopsAtLineEnd)
{
  const auto toks = lex("a = \"oops\nb = c");
  ASSERT_GE(toks.size(), 7U);
  EXPECT_EQ(toks[2].kind, TokenKind::Invalid);
  EXPECT_EQ(toks[2].text, "\"oops");
  EXPECT_EQ(toks[3].text, "b");
  EXPECT_EQ(toks[4].kind, TokenKind::Eq);
  EXPECT_EQ(toks[5].text, "c");
}

TEST(SyntaxLexer, CommentKinds)
{
  const auto toks = lex("# plain\n## cardinality = 0..1\n### Documentation  \nkey = v");
  ASSERT_GE(toks.size(), 6U);
  EXPECT_EQ(toks[0].kind, TokenKind::Comment);
  EXPECT_EQ(toks[0].text, "plain");
  EXPECT_EQ(toks[1].kind, TokenKind::Directive);
  EXPECT_EQ(toks[1].text, "cardinality = 0..1");
  EXPECT_EQ(toks[2].kind, TokenKind::DocComment);
  EXPECT_EQ(toks[2].text, "Documentation");
  EXPECT_EQ(toks[3].text, "key");
}

TEST(SyntaxLexer, SkipsUtf8Bom)
{
  const auto toks = lex("\xEF\xBB\xBFkey = value");
  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Word);
  EXPECT_EQ(toks[0].text, "key");
  EXPECT_EQ(toks[0].range.begin_offset(), 3U);
}

TEST(SyntaxLexer, VariablesMathsAndParameters)
{
  const auto toks = lex("cost = @base_cost\nmod = @[ base_cost * 2 ]\nflag = has_$FLAG$");
  ASSERT_GE(toks.size(), 9U);
  EXPECT_EQ(toks[2].text, "@base_cost");
  EXPECT_EQ(toks[5].kind, TokenKind::Word);
  EXPECT_EQ(toks[5].text, "@[ base_cost * 2 ]");
  EXPECT_EQ(toks[8].text, "has_$FLAG$");
}

TEST(SyntaxLexer, ScriptBracketsArePunctuation)
{
  const auto toks = lex("[[!FLAG] a = b ]");
  const std::vector<TokenKind> expected = {
    TokenKind::LBracket, TokenKind::LBracket, TokenKind::Word, TokenKind::RBracket,
    TokenKind::Word,     TokenKind::Eq,       TokenKind::Word, TokenKind::RBracket,
    TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[2].text, "!FLAG");
}

TEST(SyntaxLexer, SchemaWordsEmbedBracketsAndTypeRefs)
{
  const auto toks = lex("alias[effect:add_gold] = <event>\nx = enum[weekday]", LexMode::Schema);
  ASSERT_GE(toks.size(), 7U);
  EXPECT_EQ(toks[0].kind, TokenKind::Word);
  EXPECT_EQ(toks[0].text, "alias[effect:add_gold]");
  EXPECT_EQ(toks[1].kind, TokenKind::Eq);
  EXPECT_EQ(toks[2].kind, TokenKind::Word);
  EXPECT_EQ(toks[2].text, "<event>");
  EXPECT_EQ(toks[5].text, "enum[weekday]");
}

TEST(SyntaxLexer, SchemaWordKeepsComparisonOperatorApart)
{
  const auto toks = lex("a<=b", LexMode::Schema);
  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[0].text, "a");
  EXPECT_EQ(toks[1].kind, TokenKind::Le);
  EXPECT_EQ(toks[2].text, "b");
}

TEST(SyntaxLexer, EofRepeatsAndRestart)
{
  Lexer lexer(FileId{0}, "a = b");
  (void)lexer.lex_all();
  EXPECT_EQ(lexer.next_token().kind, TokenKind::Eof);
  EXPECT_EQ(lexer.next_token().kind, TokenKind::Eof);

  lexer.restart_at(4);
  const Token t = lexer.next_token();
  EXPECT_EQ(t.kind, TokenKind::Word);
  EXPECT_EQ(t.text, "b");
}

TEST(SyntaxLexer, BaseOffsetShiftsRanges)
{
  Lexer lexer(FileId{0}, "x = 1", LexMode::Script, 100);
  const Token t = lexer.next_token();
  EXPECT_EQ(t.range.begin_offset(), 100U);
  EXPECT_EQ(t.range.end_offset(), 101U);
}
