#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litdiff {

enum class TokenKind : std::uint8_t { Text, Open, Close, Comma, Escape };

// Bracket family of an Open/Close token
enum class Bracket : std::uint8_t { None, Brace, Square, Paren, Bits };

struct Token {
  TokenKind kind;
  Bracket bracket;    // Bracket::None unless kind is Open/Close
  std::size_t offset; // byte offset in the scanned text
  std::string_view text;
};

// Single pass over `text`: plain runs, `{ [ ( <<` openers, `} ] ) >>` closers,
// top-level-agnostic commas and ESC[...m runs (consumed up to and including
// the first 'm', whatever they contain). Tokens view into `text`.
std::vector<Token> scan(std::string_view text);

// Nesting depth per bracket family. Closers never push a counter below zero.
struct Depth {
  int brace = 0;
  int square = 0;
  int paren = 0;
  int bits = 0;

  void apply(const Token& tok);
  bool top_level() const { return brace == 0 && square == 0 && paren == 0 && bits == 0; }
};

// Split on commas that sit outside every bracket family. Each segment is
// trimmed; empty segments are kept so callers decide what to drop.
std::vector<std::string> split_top_level(std::string_view text);

// Closers needed to balance the `()[]{}` openers left open in `text`,
// innermost first. A closer that does not match the innermost opener is
// ignored. Escape runs are skipped.
std::string unmatched_closers(std::string_view text);

// Offset of the closer matching the opener that starts at `open_pos`
// (same family only), or npos when it is never closed.
std::size_t matching_close(std::string_view text, std::size_t open_pos);

bool is_closer(char c);

} // namespace litdiff
