#include "litdiff/report.hpp"

#include "litdiff/consts.hpp"
#include "litdiff/util.hpp"

namespace litdiff::report {

namespace {

void indent_into(std::vector<std::string> &out, const std::vector<std::string> &lines,
                 std::string_view indent) {
  for (const auto &line : lines) {
    if (line.empty())
      out.emplace_back();
    else
      out.push_back(std::string(indent) + line);
  }
}

} // namespace

std::vector<std::string> value_block(std::string_view label, const std::vector<std::string> &lines,
                                     bool color, ansi::Color tint) {
  if (lines.empty())
    return {};
  std::vector<std::string> out;
  out.push_back(ansi::colorize(std::string(label) + ":", tint, color));
  indent_into(out, lines, consts::kIndentTwo);
  return out;
}

std::vector<std::string> diff_section(const std::vector<std::string> &lines, bool color) {
  if (lines.empty())
    return {};
  std::vector<std::string> out;
  out.emplace_back();
  out.push_back(ansi::colorize(consts::kDiffHeading, ansi::Color::Yellow, color));
  indent_into(out, lines, consts::kIndentFour);
  return out;
}

std::string clean_reason(std::string_view reason) {
  std::string_view sv = strutil::trim(reason);
  if (sv.starts_with(consts::kArrowPrefix))
    sv.remove_prefix(consts::kArrowPrefix.size());
  return std::string(sv);
}

std::vector<std::string> reason_block(std::string_view reason) {
  return {"", std::string(consts::kReasonHeading),
          std::string(consts::kIndentTwo) + clean_reason(reason)};
}

} // namespace litdiff::report
