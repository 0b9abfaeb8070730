#pragma once
#include "litdiff/ansi.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace litdiff::report {

// "Label:" then each line indented by two spaces. Nothing for no lines.
std::vector<std::string> value_block(std::string_view label, const std::vector<std::string>& lines,
                                     bool color, ansi::Color tint = ansi::Color::None);

// Blank line, "Diff (expected -, actual +):", lines indented by four spaces.
// Nothing for no lines.
std::vector<std::string> diff_section(const std::vector<std::string>& lines, bool color);

// Blank line, "Reason:", the cleaned reason indented by two spaces.
std::vector<std::string> reason_block(std::string_view reason);

// "  -> will never return" -> "will never return"
std::string clean_reason(std::string_view reason);

} // namespace litdiff::report
