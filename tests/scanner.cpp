#include "litdiff/scanner.hpp"

#include <iostream>
#include <string>
#include <vector>

static bool expect_split(std::string_view text, const std::vector<std::string>& want) {
  const auto got = litdiff::split_top_level(text);
  if (got == want)
    return true;
  std::cerr << "split_top_level(\"" << text << "\") gave " << got.size() << " segments:\n";
  for (const auto& s : got)
    std::cerr << "  [" << s << "]\n";
  return false;
}

int main() {
  using namespace litdiff;

  // commas nested in any bracket family stay inside their segment
  if (!expect_split("a => 1, b => %{c => 2, d => 3}, e => [1, 2], f => <<1, 2>>, g => (x, y)",
                    {"a => 1", "b => %{c => 2, d => 3}", "e => [1, 2]", "f => <<1, 2>>",
                     "g => (x, y)"}))
    return 1;

  // an unmatched closer does not push depth negative
  if (!expect_split("a}, b", {"a}", "b"}))
    return 1;
  if (!expect_split("a]), b, c", {"a])", "b", "c"}))
    return 1;

  // empty segments are kept, blank input gives nothing
  if (!expect_split("a,,b", {"a", "", "b"}))
    return 1;
  if (!expect_split("   ", {}))
    return 1;

  // escape runs are atomic and depth-neutral
  if (!expect_split("a, \x1b[33mb\x1b[0m, c", {"a", "\x1b[33mb\x1b[0m", "c"}))
    return 1;

  {
    const auto toks = scan("%{a, <<1>>}\x1b[1;31m");
    if (toks.size() != 10) { std::cerr << "scan token count " << toks.size() << "\n"; return 1; }
    if (toks[1].kind != TokenKind::Open || toks[1].bracket != Bracket::Brace) {
      std::cerr << "expected brace opener\n"; return 1;
    }
    if (toks[3].kind != TokenKind::Comma || toks[3].offset != 3) { std::cerr << "comma token\n"; return 1; }
    if (toks[5].bracket != Bracket::Bits || toks[5].text != "<<") { std::cerr << "bits opener\n"; return 1; }
    if (toks.back().kind != TokenKind::Escape || toks.back().text != "\x1b[1;31m") {
      std::cerr << "escape token\n"; return 1;
    }
  }

  if (unmatched_closers("%{a => (b, [c") != "])}") {
    std::cerr << "unmatched_closers innermost first\n"; return 1;
  }
  if (unmatched_closers("(a]") != ")") { std::cerr << "mismatched closer should be ignored\n"; return 1; }
  if (!unmatched_closers("f(x) <<1>> %{a => [1]}").empty()) { std::cerr << "balanced text\n"; return 1; }

  if (matching_close("(a (b)) c", 0) != 6) { std::cerr << "matching_close nested\n"; return 1; }
  if (matching_close("(a [b) c]", 0) != 5) { std::cerr << "matching_close family\n"; return 1; }
  if (matching_close("(a", 0) != std::string_view::npos) { std::cerr << "never closed\n"; return 1; }

  std::cout << "scanner OK\n";
  return 0;
}
