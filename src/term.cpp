#include "litdiff/term.hpp"

#include "litdiff/binary.hpp"
#include "litdiff/diff.hpp"
#include "litdiff/util.hpp"

#include <exception>

namespace litdiff {

namespace {

std::string maybe_pretty(std::string_view text, const TermPrettifier *helper) {
  if (helper == nullptr)
    return std::string(text);
  try {
    return helper->pretty_print(text);
  } catch (const std::exception &) {
    // helper output is optional; keep the raw text
    return std::string(text);
  }
}

} // namespace

std::vector<std::string> format_term_lines(std::string_view text, const TermPrettifier *helper) {
  const std::string normalized = binary::normalize(maybe_pretty(text, helper));

  std::vector<std::string> out;
  for (auto &line : diff::split_lines(strutil::trim(normalized))) {
    if (!line.empty())
      out.push_back(std::move(line));
  }
  return out;
}

} // namespace litdiff
