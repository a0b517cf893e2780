#pragma once

#include <cstdint>
#include <string_view>

#include "cwcheck/basic/source_manager.hpp"

namespace cwcheck::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Invalid,

  // Comment tokens are preserved: schema files carry metadata in them.
  Comment,     // # ...
  Directive,   // ## ...
  DocComment,  // ### ...

  Word,    // bare identifiers, numbers, dates, yes/no, @vars, $PARAMS$
  String,  // token.text is the string *contents* (without quotes)

  // Operators
  Eq,          // =
  EqEq,        // ==
  Ne,          // != or <>
  Lt,          // <
  Le,          // <=
  Gt,          // >
  Ge,          // >=
  PlusEq,      // +=
  MinusEq,     // -=
  MulEq,       // *=
  QuestionEq,  // ?=

  // Punctuation
  LBrace,
  RBrace,
  LBracket,
  RBracket,
};

struct Token
{
  TokenKind kind = TokenKind::Invalid;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for String: interior, for comments: payload)

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end_offset(); }
};

[[nodiscard]] constexpr bool is_operator(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eq:
    case TokenKind::EqEq:
    case TokenKind::Ne:
    case TokenKind::Lt:
    case TokenKind::Le:
    case TokenKind::Gt:
    case TokenKind::Ge:
    case TokenKind::PlusEq:
    case TokenKind::MinusEq:
    case TokenKind::MulEq:
    case TokenKind::QuestionEq:
      return true;
    default:
      return false;
  }
}

[[nodiscard]] constexpr bool is_comment(TokenKind k) noexcept
{
  return k == TokenKind::Comment || k == TokenKind::Directive || k == TokenKind::DocComment;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Invalid:
      return "<invalid>";
    case TokenKind::Comment:
      return "<comment>";
    case TokenKind::Directive:
      return "<directive>";
    case TokenKind::DocComment:
      return "<doc_comment>";
    case TokenKind::Word:
      return "word";
    case TokenKind::String:
      return "string";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::MulEq:
      return "*=";
    case TokenKind::QuestionEq:
      return "?=";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
  }
  return "";
}

}  // namespace cwcheck::syntax
