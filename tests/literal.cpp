#include "litdiff/literal.hpp"

#include <iostream>

int main() {
  using namespace litdiff;

  {
    const Shape s = classify("  (integer(), atom()) :: {:ok, term()}  ");
    if (s.kind != ShapeKind::CallSignature || s.args != "integer(), atom()" ||
        s.ret != "{:ok, term()}") {
      std::cerr << "call signature not recognized\n";
      return 1;
    }
  }
  if (classify("(a) | (b)").kind != ShapeKind::Plain) {
    std::cerr << "leading group that does not span the text is plain\n";
    return 1;
  }
  {
    const Shape s = classify("(%{a => 1})");
    if (s.kind != ShapeKind::Parenthesized || s.body != "%{a => 1}") {
      std::cerr << "parenthesized\n";
      return 1;
    }
  }
  {
    const Shape s = classify("%{a => 1}");
    if (s.kind != ShapeKind::MapLiteral || s.body != "a => 1") {
      std::cerr << "map literal\n";
      return 1;
    }
  }
  if (classify("%{a => 1} | %{}").kind != ShapeKind::Plain) {
    std::cerr << "map followed by more text is plain\n";
    return 1;
  }
  if (is_map_literal("%User{a => 1}") || is_map_literal("[1, 2]")) {
    std::cerr << "not maps\n";
    return 1;
  }

  {
    auto entries = parse_map_literal("(%{a => 1, ..., b => %{c => 2, d => 3}})");
    if (!entries || entries->size() != 2) {
      std::cerr << "expected two entries through one paren layer\n";
      return 1;
    }
    if ((*entries)[1].key != "b" || (*entries)[1].value != "%{c => 2, d => 3}") {
      std::cerr << "nested value kept whole\n";
      return 1;
    }
  }
  if (parse_map_literal("%{a => 1, b}")) {
    std::cerr << "segment without arrow must fail the parse\n";
    return 1;
  }
  if (parse_map_literal("[a => 1]") || parse_map_literal("((%{a => 1}))")) {
    std::cerr << "only one paren layer is looked through\n";
    return 1;
  }
  {
    auto entries = parse_map_literal("%{}");
    if (!entries || !entries->empty()) {
      std::cerr << "empty map parses to no entries\n";
      return 1;
    }
  }

  // a repeated key keeps its first position but takes the last value
  {
    auto entries = parse_map_literal("%{a => 1, b => 2, a => 3}");
    if (!entries || entries->size() != 2) {
      std::cerr << "duplicate key should collapse\n";
      return 1;
    }
    if ((*entries)[0].key != "a" || (*entries)[0].value != "3" || (*entries)[1].key != "b") {
      std::cerr << "duplicate key order/value\n";
      return 1;
    }
  }

  {
    auto kv = split_key_value(" key =>  a => b ");
    if (!kv || kv->first != "key" || kv->second != "a => b") {
      std::cerr << "split on first arrow\n";
      return 1;
    }
  }
  if (!is_filler_segment("...") || !is_filler_segment("") || is_filler_segment("a")) {
    std::cerr << "filler segments\n";
    return 1;
  }

  std::cout << "literal OK\n";
  return 0;
}
