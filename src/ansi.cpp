#include "litdiff/ansi.hpp"

#include "litdiff/consts.hpp"

#include <cctype>

namespace {

// Length of the ESC[<digits/;>m run starting at `pos`, 0 if there is none.
std::size_t sgr_length(std::string_view text, std::size_t pos) {
  if (text.substr(pos, litdiff::consts::kCsi.size()) != litdiff::consts::kCsi)
    return 0;
  std::size_t i = pos + litdiff::consts::kCsi.size();
  while (i < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == ';'))
    ++i;
  if (i < text.size() && text[i] == 'm')
    return i + 1 - pos;
  return 0;
}

} // namespace

namespace litdiff::ansi {

auto code(Color color) -> std::string_view {
  switch (color) {
  case Color::Red:
    return "\x1b[31m";
  case Color::Green:
    return "\x1b[32m";
  case Color::Yellow:
    return "\x1b[33m";
  case Color::None:
    break;
  }
  return "";
}

auto reset() -> std::string_view { return "\x1b[0m"; }

auto colorize(std::string_view text, Color color, bool enabled) -> std::string {
  if (!enabled || color == Color::None)
    return std::string(text);

  const std::string_view tint = code(color);
  const std::string_view rst = reset();

  std::string out;
  out.reserve(text.size() + tint.size() * 2 + rst.size());
  out.append(tint);
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t hit = text.find(rst, pos);
    if (hit == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, hit - pos));
    out.append(rst);
    out.append(tint);
    pos = hit + rst.size();
  }
  out.append(rst);
  return out;
}

auto strip(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (const std::size_t n = sgr_length(text, i); n > 0) {
      i += n;
      continue;
    }
    out.push_back(text[i++]);
  }
  return out;
}

auto extract_wrappers(std::string_view text) -> StyleWrapper {
  StyleWrapper w;

  std::size_t begin = 0;
  while (const std::size_t n = sgr_length(text, begin))
    begin += n;
  w.leading = std::string(text.substr(0, begin));

  // Trailing runs: walk the remaining text and remember where the final
  // uninterrupted sequence of escape runs starts.
  std::size_t tail = text.size();
  std::size_t i = begin;
  while (i < text.size()) {
    if (const std::size_t n = sgr_length(text, i); n > 0) {
      if (tail == text.size())
        tail = i;
      i += n;
      continue;
    }
    tail = text.size();
    ++i;
  }
  w.content = std::string(text.substr(begin, tail - begin));
  w.trailing = std::string(text.substr(tail));
  return w;
}

void reattach(std::vector<std::string> &lines, const StyleWrapper &wrapper) {
  if (lines.empty()) {
    lines.push_back(wrapper.leading + wrapper.trailing);
    return;
  }
  lines.front().insert(0, wrapper.leading);
  lines.back().append(wrapper.trailing);
}

} // namespace litdiff::ansi
