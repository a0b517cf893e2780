#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "cwcheck/syntax/token.hpp"

namespace cwcheck::syntax
{

enum class LexMode : uint8_t {
  Script,  // game/mod script
  Schema,  // CWT: words may embed <type>, enum[x], alias_name[x]
};

/**
 * Tokenizer for Clausewitz script and CWT schema text.
 *
 * Never fails: unrecognised input becomes TokenKind::Invalid. Offsets are
 * absolute: `base_offset` is the position of src[0] in the original buffer,
 * which lets callers re-lex a tail slice for incremental updates.
 */
class Lexer
{
public:
  Lexer(
    FileId file_id, std::string_view src, LexMode mode = LexMode::Script,
    uint32_t base_offset = 0);

  /// Produce the next token; returns Eof repeatedly once exhausted.
  [[nodiscard]] Token next_token();

  [[nodiscard]] std::vector<Token> lex_all();

  /// Continue lexing from an absolute byte offset.
  void restart_at(uint32_t absolute_offset) noexcept;

  [[nodiscard]] uint32_t position() const noexcept
  {
    return base_ + static_cast<uint32_t>(pos_);
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_comment();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_word();
  [[nodiscard]] Token lex_maths();
  [[nodiscard]] bool is_word_char(unsigned char c) const noexcept;

  [[nodiscard]] SourceRange make_range(size_t start, size_t end) const noexcept
  {
    return {file_id_, base_ + static_cast<uint32_t>(start), base_ + static_cast<uint32_t>(end)};
  }
  [[nodiscard]] Token make(TokenKind kind, size_t start, size_t end) const noexcept
  {
    return {kind, make_range(start, end), src_.substr(start, end - start)};
  }

  FileId file_id_;
  std::string_view src_;
  LexMode mode_;
  uint32_t base_;
  size_t pos_ = 0;
};

}  // namespace cwcheck::syntax
