#pragma once

#include <gsl/span>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/syntax/lexer.hpp"
#include "cwcheck/syntax/token.hpp"

namespace cwcheck::syntax
{

/**
 * Recursive-descent parser producing a file-root Block.
 *
 * Error recovery resynchronises at the next `key op` pair or at the closing
 * brace of an open block, emitting one diagnostic per resynchronisation.
 */
class Parser
{
public:
  Parser(
    FileId file_id, gsl::span<const Token> tokens, DiagnosticBag & diags,
    LexMode mode = LexMode::Script);

  /// Parse the whole token stream. `file_size` sizes the root range.
  [[nodiscard]] Block parse_file(uint32_t file_size);

private:
  struct Significant
  {
    Token token;
    // [begin, end) into annotations_ for the comments that precede the token
    uint32_t annotations_begin = 0;
    uint32_t annotations_end = 0;
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_key_op() const;

  const Token & advance();
  bool match(TokenKind k);

  void error_at(const Token & t, std::string message, std::string label = "");
  void synchronize(bool in_block);
  void skip_balanced_block();

  // Grammar
  enum class Terminator : uint8_t { Eof, Brace, Bracket };

  void parse_body(Block & block, Terminator term);
  void parse_statement(Block & block, Terminator term);
  void parse_conditional(Block & block);
  [[nodiscard]] std::optional<Value> parse_value();
  [[nodiscard]] Value parse_braced(const std::optional<Symbol> & tag, SourceRange tag_range);
  [[nodiscard]] Value word_value(const Token & t) const;
  [[nodiscard]] std::vector<Annotation> take_annotations(size_t significant_index) const;

  [[nodiscard]] static bool is_colour_tag(std::string_view word) noexcept;
  [[nodiscard]] static Operator to_operator(TokenKind k) noexcept;

  FileId file_id_;
  DiagnosticBag & diags_;
  LexMode mode_;
  std::vector<Significant> toks_;
  std::vector<Annotation> annotations_;
  size_t idx_ = 0;
  size_t depth_ = 0;
};

}  // namespace cwcheck::syntax
