#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litdiff::ansi {

enum class Color : std::uint8_t { None, Red, Green, Yellow };

// SGR code for a color ("" for Color::None)
auto code(Color color) -> std::string_view;
auto reset() -> std::string_view;

// Wrap text in `color` when enabled. Embedded resets are followed by the
// color again so inner highlights do not end the outer tint.
auto colorize(std::string_view text, Color color, bool enabled) -> std::string;

// Remove every ESC[<digits/;>m run.
auto strip(std::string_view text) -> std::string;

// Leading and trailing escape runs kept apart from the structural content.
struct StyleWrapper {
  std::string leading;
  std::string content;
  std::string trailing;
};

auto extract_wrappers(std::string_view text) -> StyleWrapper;

// Put leading on the first line and trailing on the last one.
void reattach(std::vector<std::string>& lines, const StyleWrapper& wrapper);

} // namespace litdiff::ansi
