#include "litdiff/segments.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

static bool reassembles(const litdiff::DiffSegment& s, std::string_view e, std::string_view a) {
  return s.prefix + s.expected_diff + s.expected_suffix == e &&
         s.prefix + s.actual_diff + s.actual_suffix == a;
}

int main() {
  using namespace litdiff;

  const std::vector<std::pair<std::string, std::string>> pairs{
      {"%{a => [1]}", "%{a => [2]}"},
      {"(atom())", "(binary())"},
      {"(a, b)", "(a, b, c)"},
      {"h\xc3\xa9llo", "h\xc3\xa4llo"},
      {"cafe\xcc\x81", "cafa\xcc\x81"},
      {"", "%{x => 1}"},
      {"same", "same"},
      {"f(1 + x)", "f(2 + x)"},
      {"[a(1)]", "[b]"},
  };
  for (const auto& [e, a] : pairs) {
    if (!reassembles(diff_segments(e, a, false), e, a) || !reassembles(diff_segments(e, a, true), e, a)) {
      std::cerr << "pieces do not rebuild [" << e << "] / [" << a << "]\n";
      return 1;
    }
  }

  // cuts land on code point boundaries
  {
    const auto s = diff_segments("h\xc3\xa9llo", "h\xc3\xa4llo", false);
    if (s.prefix != "h" || s.expected_diff != "\xc3\xa9" || s.actual_suffix != "llo") {
      std::cerr << "multi-byte character split\n";
      return 1;
    }
  }

  // a combining mark is never cut away from its base letter
  {
    const auto s = diff_segments("cafe\xcc\x81", "cafa\xcc\x81", false);
    if (s.prefix != "caf" || s.expected_diff != "e\xcc\x81" || s.actual_diff != "a\xcc\x81" ||
        !s.expected_suffix.empty()) {
      std::cerr << "shared accent should stay with its letter\n";
      return 1;
    }
    const auto t = diff_segments("cafe", "cafe\xcc\x81", false);
    if (t.prefix != "caf" || t.expected_diff != "e" || t.actual_diff != "e\xcc\x81") {
      std::cerr << "prefix must not end before a combining mark\n";
      return 1;
    }
  }

  // closers both sides pull in are handed back to the suffix
  {
    const auto s = diff_segments("%{a => [1]}", "%{a => [2]}", false);
    if (s.expected_diff != "1" || s.actual_diff != "2" || s.expected_suffix != "]}") {
      std::cerr << "shared closers should stay in the suffix\n";
      return 1;
    }
  }

  // rebalancing crosses whitespace only
  {
    const auto s = diff_segments("f(1 + x)", "f(2 + x)", false);
    if (s.expected_diff != "1" || s.expected_suffix != " + x)") {
      std::cerr << "rebalance must stop at non-whitespace\n";
      return 1;
    }
    const auto w = diff_segments("f(1 )", "f(2 )", false);
    if (w.expected_diff != "1 " || w.actual_diff != "2 " || w.expected_suffix != ")") {
      std::cerr << "rebalance should cross leading whitespace\n";
      return 1;
    }
  }

  {
    const auto s = diff_segments("ab", "ac", true);
    if (s.highlighted_expected_diff != "\x1b[33mb\x1b[0m" || s.expected_line() != "a\x1b[33mb\x1b[0m") {
      std::cerr << "highlight only covers the diff\n";
      return 1;
    }
    if (!highlight("", true).empty()) {
      std::cerr << "empty diff stays empty\n";
      return 1;
    }
  }

  // named structure field
  {
    const auto p = inline_pair("%User{name => \"a\", age => 1}", "%User{name => \"a\", age => 2}", false);
    if (p.expected != "(%User{..., age => 1})" || p.actual != "(%User{..., age => 2})") {
      std::cerr << "struct compaction: " << p.expected << " / " << p.actual << "\n";
      return 1;
    }
  }

  // map field two levels down
  {
    const auto p = inline_pair("%{outer => %{a => 1, b => 2}}", "%{outer => %{a => 1, b => 3}}", false);
    if (p.expected != "(%{..., b => 2})" || p.actual != "(%{..., b => 3})") {
      std::cerr << "map compaction: " << p.expected << " / " << p.actual << "\n";
      return 1;
    }
  }

  // a renamed key is not reported as a change to the field before it
  {
    const auto p = inline_pair("%U{a => 1, b => 2}", "%U{a => 1, c => 2}", false);
    if (p.expected != "%U{a => 1, b => 2}" || p.actual != "%U{a => 1, c => 2}") {
      std::cerr << "renamed struct key: " << p.expected << " / " << p.actual << "\n";
      return 1;
    }
    const auto m = inline_pair("%{a => 1, b => 2}", "%{a => 1, c => 2}", false);
    if (m.expected != "%{a => 1, b => 2}" || m.actual != "%{a => 1, c => 2}") {
      std::cerr << "renamed map key: " << m.expected << " / " << m.actual << "\n";
      return 1;
    }
  }

  // a change that spills into the next field is printed in full
  {
    const auto p = inline_pair("%{a => 1, b => 2}", "%{a => 3, b => 4}", false);
    if (p.expected != "%{a => 1, b => 2}" || p.actual != "%{a => 3, b => 4}") {
      std::cerr << "multi-field change must not compact\n";
      return 1;
    }
  }

  // unchanged structures around the change are shortened
  {
    const auto p = inline_pair("[%A{x => 1}, 1]", "[%A{x => 1}, 2]", false);
    if (p.expected != "[%A{...}, 1]" || p.actual != "[%A{...}, 2]") {
      std::cerr << "shrink around change: " << p.expected << "\n";
      return 1;
    }
  }
  if (shrink_structs("%A{x => %B{y => 1}} and %C{") != "%A{...} and %C{") {
    std::cerr << "shrink_structs\n";
    return 1;
  }

  std::cout << "segments OK\n";
  return 0;
}
