#pragma once
#include <string>
#include <string_view>

namespace litdiff::binary {

// Rewrite byte-list sub-literals for display. Runs the three passes below
// in order.
std::string normalize(std::string_view text);

// <<116,105,116,108,101>> -> "title" when every entry is an integer in
// 0..255 and the bytes are printable UTF-8. Anything else is copied as is.
std::string stringify_printable(std::string_view text);

// <<_ :: 32>> -> "<<_ :: 32>>" (underscore-led specifiers holding `::`,
// skipped when already quoted)
std::string stringify_bit_specs(std::string_view text);

// <<1,2,3>> -> <<1, 2, 3>>
std::string space_commas(std::string_view text);

// Double-quoted literal with backslash escapes
std::string quote(std::string_view bytes);

} // namespace litdiff::binary
