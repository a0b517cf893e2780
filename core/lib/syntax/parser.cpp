#include "cwcheck/syntax/parser.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace cwcheck::syntax
{
namespace
{

constexpr size_t k_max_depth = 256;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

[[nodiscard]] std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::Invalid:
    case TokenKind::Word:
      return fmt::format("'{}'", t.text);
    case TokenKind::String:
      return fmt::format("\"{}\"", t.text);
    default:
      return fmt::format("'{}'", to_string(t.kind));
  }
}

}  // namespace

Parser::Parser(FileId file_id, gsl::span<const Token> tokens, DiagnosticBag & diags, LexMode mode)
: file_id_(file_id), diags_(diags), mode_(mode)
{
  toks_.reserve(tokens.size());
  auto pending_begin = static_cast<uint32_t>(0);
  for (const Token & t : tokens) {
    if (is_comment(t.kind)) {
      if (mode_ == LexMode::Schema && t.kind != TokenKind::Comment) {
        const auto kind = t.kind == TokenKind::DocComment ? Annotation::Kind::Doc
                                                          : Annotation::Kind::Directive;
        annotations_.push_back(Annotation{kind, std::string(t.text), t.range});
      }
      continue;
    }
    const auto pending_end = static_cast<uint32_t>(annotations_.size());
    toks_.push_back(Significant{t, pending_begin, pending_end});
    pending_begin = pending_end;
  }
  if (toks_.empty() || toks_.back().token.kind != TokenKind::Eof) {
    const uint32_t at = toks_.empty() ? 0 : toks_.back().token.end();
    Token eof;
    eof.kind = TokenKind::Eof;
    eof.range = SourceRange(file_id_, at, at);
    toks_.push_back(Significant{eof, pending_begin, static_cast<uint32_t>(annotations_.size())});
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= toks_.size()) {
    return toks_.back().token;
  }
  return toks_[i].token;
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_key_op() const
{
  return (at(TokenKind::Word) || at(TokenKind::String)) && is_operator(cur(1).kind);
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

void Parser::error_at(const Token & t, std::string message, std::string label)
{
  diags_.report_error(t.range, std::move(message), std::move(label))
    .with_code(RuleCode::SyntaxError);
}

void Parser::synchronize(bool in_block)
{
  // Silent skip: the caller has already reported the problem.
  while (!at_eof()) {
    if (at_key_op()) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      if (in_block) {
        return;
      }
      advance();
      continue;
    }
    if (at(TokenKind::RBracket) && in_block) {
      return;
    }
    if (at(TokenKind::LBrace)) {
      skip_balanced_block();
      continue;
    }
    advance();
  }
}

void Parser::skip_balanced_block()
{
  size_t depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RBrace)) {
      if (depth <= 1) {
        advance();
        return;
      }
      --depth;
    }
    advance();
  }
}

std::vector<Annotation> Parser::take_annotations(size_t significant_index) const
{
  if (significant_index >= toks_.size()) {
    return {};
  }
  const auto & s = toks_[significant_index];
  return {annotations_.begin() + s.annotations_begin, annotations_.begin() + s.annotations_end};
}

bool Parser::is_colour_tag(std::string_view word) noexcept
{
  return iequals(word, "rgb") || iequals(word, "hsv") || iequals(word, "hsv360") ||
         iequals(word, "hex");
}

Operator Parser::to_operator(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::EqEq:
      return Operator::EqEq;
    case TokenKind::Ne:
      return Operator::Ne;
    case TokenKind::Lt:
      return Operator::Lt;
    case TokenKind::Le:
      return Operator::Le;
    case TokenKind::Gt:
      return Operator::Gt;
    case TokenKind::Ge:
      return Operator::Ge;
    case TokenKind::PlusEq:
      return Operator::PlusEq;
    case TokenKind::MinusEq:
      return Operator::MinusEq;
    case TokenKind::MulEq:
      return Operator::MulEq;
    case TokenKind::QuestionEq:
      return Operator::QuestionEq;
    default:
      return Operator::Eq;
  }
}

// ============================================================================
// Grammar
// ============================================================================

Block Parser::parse_file(uint32_t file_size)
{
  Block root;
  root.range = SourceRange(file_id_, 0, file_size);
  parse_body(root, Terminator::Eof);
  return root;
}

void Parser::parse_body(Block & block, Terminator term)
{
  while (!at_eof()) {
    if (at(TokenKind::RBrace)) {
      if (term != Terminator::Eof) {
        return;
      }
      error_at(cur(), "unmatched '}'", "no open block to close");
      advance();
      continue;
    }
    if (at(TokenKind::RBracket) && term == Terminator::Bracket) {
      return;
    }
    parse_statement(block, term);
  }
}

void Parser::parse_statement(Block & block, Terminator term)
{
  const Token & t = cur();

  if (mode_ == LexMode::Script && at(TokenKind::LBracket) && cur(1).kind == TokenKind::LBracket) {
    parse_conditional(block);
    return;
  }

  const bool keyish = t.kind == TokenKind::Word || t.kind == TokenKind::String;
  const bool shorthand_block = t.kind == TokenKind::Word && cur(1).kind == TokenKind::LBrace &&
                               !is_colour_tag(t.text);

  if (keyish && (is_operator(cur(1).kind) || shorthand_block)) {
    const size_t key_index = idx_;
    const Key key{intern(t.text), t.kind == TokenKind::String, t.range};
    advance();

    Operator op = Operator::Eq;
    Token op_tok = cur();
    if (!shorthand_block) {
      op_tok = advance();
      op = to_operator(op_tok.kind);
    }

    auto value = parse_value();
    if (!value) {
      error_at(
        op_tok, fmt::format("missing value after '{}'", key.str()),
        fmt::format("expected a value, found {}", describe(cur())));
      const bool clean_stop = at_eof() || at(TokenKind::RBrace) || at_key_op() ||
                              (term == Terminator::Bracket && at(TokenKind::RBracket));
      if (!clean_stop) {
        synchronize(term != Terminator::Eof);
      }
      return;
    }

    Entry e;
    e.key = key;
    e.op = op;
    e.range = join_ranges(key.range, get_range(*value));
    e.value = std::move(*value);
    e.annotations = take_annotations(key_index);
    block.entries.push_back(std::move(e));
    return;
  }

  if (keyish || t.kind == TokenKind::LBrace) {
    if (auto value = parse_value()) {
      block.items.push_back(std::move(*value));
      return;
    }
  }

  std::string message;
  if (t.kind == TokenKind::Invalid) {
    message = fmt::format("unexpected input {}", describe(t));
  } else if (is_operator(t.kind)) {
    message = fmt::format("expected a key before '{}'", to_string(t.kind));
  } else {
    message = fmt::format("unexpected {}", describe(t));
  }
  error_at(t, std::move(message));
  advance();
  synchronize(term != Terminator::Eof);
}

void Parser::parse_conditional(Block & block)
{
  const Token open = advance();
  advance();

  Condition cond;
  if (at(TokenKind::Word)) {
    std::string_view name = cur().text;
    if (!name.empty() && name.front() == '!') {
      cond.negated = true;
      name.remove_prefix(1);
    }
    cond.param = intern(name);
    cond.range = cur().range;
    advance();
  } else {
    error_at(cur(), "expected a parameter name in conditional block");
  }
  if (!match(TokenKind::RBracket)) {
    error_at(cur(), "expected ']' after conditional parameter");
  }

  Block body;
  parse_body(body, Terminator::Bracket);
  if (!match(TokenKind::RBracket)) {
    diags_.report_error(cur().range, "unclosed conditional block", "expected ']'")
      .with_code(RuleCode::SyntaxError)
      .with_secondary_label(open.range, "conditional block opened here");
  }

  for (auto & e : body.entries) {
    if (!e.condition) {
      e.condition = cond;
    }
    block.entries.push_back(std::move(e));
  }
  for (auto & item : body.items) {
    block.items.push_back(std::move(item));
  }
}

std::optional<Value> Parser::parse_value()
{
  if (at(TokenKind::Word) || at(TokenKind::String)) {
    if (is_operator(cur(1).kind)) {
      return std::nullopt;
    }
    const Token t = advance();
    if (t.kind == TokenKind::String) {
      return Scalar{intern(t.text), true, t.range};
    }
    if (is_colour_tag(t.text) && at(TokenKind::LBrace)) {
      return parse_braced(intern(t.text), t.range);
    }
    return word_value(t);
  }
  if (at(TokenKind::LBrace)) {
    return parse_braced(std::nullopt, {});
  }
  return std::nullopt;
}

Value Parser::parse_braced(const std::optional<Symbol> & tag, SourceRange tag_range)
{
  const Token open = cur();
  const uint32_t begin = tag_range.is_valid() ? tag_range.begin_offset() : open.begin();

  if (depth_ >= k_max_depth) {
    error_at(open, "blocks are nested too deeply");
    skip_balanced_block();
    Block empty;
    empty.range = SourceRange(file_id_, begin, open.end());
    return Box<Block>(std::move(empty));
  }

  advance();
  ++depth_;
  Block body;
  parse_body(body, Terminator::Brace);
  --depth_;

  uint32_t end = 0;
  if (at(TokenKind::RBrace)) {
    end = advance().end();
  } else {
    diags_.report_error(cur().range, "unclosed '{'", "expected '}' before end of file")
      .with_code(RuleCode::SyntaxError)
      .with_secondary_label(open.range, "block opened here");
    end = cur().end();
  }

  const SourceRange range(file_id_, begin, std::max(end, open.end()));
  if (body.entries.empty() && !body.items.empty()) {
    Array arr;
    arr.items = std::move(body.items);
    arr.tag = tag;
    arr.range = range;
    return Box<Array>(std::move(arr));
  }
  body.tag = tag;
  body.range = range;
  return Box<Block>(std::move(body));
}

Value Parser::word_value(const Token & t) const
{
  const std::string_view text = t.text;
  if (text.size() >= 3 && text.substr(0, 2) == "@[") {
    return Reference{ReferenceKind::Maths, intern(trim(text.substr(2, text.size() - 3))), t.range};
  }
  if (text.size() > 1 && text.front() == '@') {
    return Reference{ReferenceKind::Variable, intern(text.substr(1)), t.range};
  }
  if (std::count(text.begin(), text.end(), '$') >= 2) {
    return Reference{ReferenceKind::Parameter, intern(text), t.range};
  }
  return Scalar{intern(text), false, t.range};
}

}  // namespace cwcheck::syntax
