#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace litdiff {

// String helpers
namespace strutil {
  // Trim ASCII whitespace (space, tab, CR, LF, VT, FF)
  auto trim(std::string_view str) -> std::string_view;
  auto trim_left(std::string_view str) -> std::string_view;
  auto trim_right(std::string_view str) -> std::string_view;

  auto is_space(char c) -> bool;

  auto repeat(std::string_view piece, int times) -> std::string;
}

// UTF-8 helpers used when cutting strings at character boundaries (ICU
// grapheme breaks)
namespace utf8 {
  auto is_continuation(char c) -> bool;

  // Length in bytes of the common prefix, never ending inside a grapheme
  // cluster of either text
  auto common_prefix(std::string_view a, std::string_view b) -> std::size_t;

  // Length in bytes of the common suffix, never starting inside a grapheme
  // cluster of either text
  auto common_suffix(std::string_view a, std::string_view b) -> std::size_t;

  // Well-formed UTF-8 with no control characters other than common escapes
  auto is_printable(std::string_view bytes) -> bool;
}

}
