#include "cwcheck/syntax/lexer.hpp"

namespace cwcheck::syntax
{
namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

bool is_space(unsigned char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_ident_start(unsigned char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

}  // namespace

Lexer::Lexer(FileId file_id, std::string_view src, LexMode mode, uint32_t base_offset)
: file_id_(file_id), src_(src), mode_(mode), base_(base_offset)
{
  if (base_ == 0 && starts_with(k_utf8_bom)) {
    advance(k_utf8_bom.size());
  }
}

void Lexer::restart_at(uint32_t absolute_offset) noexcept
{
  if (absolute_offset < base_) {
    absolute_offset = base_;
  }
  pos_ = absolute_offset - base_;
  if (pos_ > src_.size()) {
    pos_ = src_.size();
  }
  if (absolute_offset == 0 && starts_with(k_utf8_bom)) {
    advance(k_utf8_bom.size());
  }
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_space(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
}

bool Lexer::is_word_char(unsigned char c) const noexcept
{
  if (is_space(c) || c < 0x20) {
    return false;
  }
  switch (c) {
    case '=':
    case '{':
    case '}':
    case '#':
    case '"':
      return false;
    case '<':
    case '>':
    case '[':
    case ']':
    case '!':
      return mode_ == LexMode::Schema;
    default:
      return true;
  }
}

Token Lexer::lex_comment()
{
  const size_t start = pos_;
  size_t hashes = 0;
  while (peek() == '#' && hashes < 3) {
    advance(1);
    ++hashes;
  }

  while (!eof() && peek() != '\n') {
    advance(1);
  }
  const size_t end = pos_;

  // Payload without markers and surrounding blanks.
  size_t payload_start = start + hashes;
  size_t payload_end = end;
  while (payload_start < payload_end && is_space(static_cast<unsigned char>(src_[payload_start]))) {
    ++payload_start;
  }
  while (payload_end > payload_start &&
         is_space(static_cast<unsigned char>(src_[payload_end - 1]))) {
    --payload_end;
  }

  TokenKind kind = TokenKind::Comment;
  if (hashes == 3) {
    kind = TokenKind::DocComment;
  } else if (hashes == 2) {
    kind = TokenKind::Directive;
  }

  Token t;
  t.kind = kind;
  t.range = make_range(start, end);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  advance(1);  // opening quote
  const size_t payload_start = pos_;

  while (!eof()) {
    const char c = peek();
    if (c == '"') {
      break;
    }
    if (c == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof()) {
    // Unterminated: report only the rest of the opening line, then resume
    // lexing on the next line so a single stray quote does not eat the file.
    size_t line_end = payload_start;
    while (line_end < src_.size() && src_[line_end] != '\n') {
      ++line_end;
    }
    pos_ = line_end;
    return make(TokenKind::Invalid, start, line_end);
  }

  const size_t payload_end = pos_;
  advance(1);  // closing quote

  Token t;
  t.kind = TokenKind::String;
  t.range = make_range(start, pos_);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_maths()
{
  // @[ expression ], possibly with nested brackets
  const size_t start = pos_;
  advance(2);
  int depth = 1;
  while (!eof() && depth > 0) {
    const char c = peek();
    if (c == '[') {
      ++depth;
    } else if (c == ']') {
      --depth;
    } else if (c == '\n') {
      break;
    }
    advance(1);
  }
  if (depth != 0) {
    return make(TokenKind::Invalid, start, pos_);
  }
  return make(TokenKind::Word, start, pos_);
}

Token Lexer::lex_word()
{
  const size_t start = pos_;
  advance(1);
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if ((c == '+' || c == '-' || c == '*' || c == '?') && peek(1) == '=') {
      break;
    }
    if (!is_word_char(c)) {
      break;
    }
    // A schema word never swallows a trailing comparison operator.
    if (mode_ == LexMode::Schema && (c == '<' || c == '>' || c == '!') && peek(1) == '=') {
      break;
    }
    advance(1);
  }
  return make(TokenKind::Word, start, pos_);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    return make(TokenKind::Eof, src_.size(), src_.size());
  }

  const auto c = static_cast<unsigned char>(peek());
  const size_t start = pos_;

  if (c == '#') {
    return lex_comment();
  }
  if (c == '"') {
    return lex_string();
  }
  if (starts_with("@[")) {
    return lex_maths();
  }

  // Multi-char operators
  static constexpr struct
  {
    std::string_view text;
    TokenKind kind;
  } k_operators[] = {
    {"==", TokenKind::EqEq},    {"!=", TokenKind::Ne},      {"<>", TokenKind::Ne},
    {"<=", TokenKind::Le},      {">=", TokenKind::Ge},      {"+=", TokenKind::PlusEq},
    {"-=", TokenKind::MinusEq}, {"*=", TokenKind::MulEq},   {"?=", TokenKind::QuestionEq},
  };
  for (const auto & op : k_operators) {
    if (starts_with(op.text)) {
      advance(op.text.size());
      return make(op.kind, start, pos_);
    }
  }

  switch (c) {
    case '=':
      advance(1);
      return make(TokenKind::Eq, start, pos_);
    case '{':
      advance(1);
      return make(TokenKind::LBrace, start, pos_);
    case '}':
      advance(1);
      return make(TokenKind::RBrace, start, pos_);
    case '[':
      advance(1);
      return make(TokenKind::LBracket, start, pos_);
    case ']':
      advance(1);
      return make(TokenKind::RBracket, start, pos_);
    case '<':
      if (mode_ == LexMode::Schema && is_ident_start(static_cast<unsigned char>(peek(1)))) {
        return lex_word();
      }
      advance(1);
      return make(TokenKind::Lt, start, pos_);
    case '>':
      advance(1);
      return make(TokenKind::Gt, start, pos_);
    case '!':
      // `!PARAM` in conditional blocks
      if (is_ident_start(static_cast<unsigned char>(peek(1)))) {
        return lex_word();
      }
      advance(1);
      return make(TokenKind::Invalid, start, pos_);
    default:
      break;
  }

  if (c < 0x20) {
    advance(1);
    return make(TokenKind::Invalid, start, pos_);
  }

  return lex_word();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace cwcheck::syntax
