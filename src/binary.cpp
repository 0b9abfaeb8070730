#include "litdiff/binary.hpp"

#include "litdiff/consts.hpp"
#include "litdiff/util.hpp"

#include <cctype>
#include <optional>

namespace litdiff::binary {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool opens_at(std::string_view text, std::size_t pos) {
  return text.substr(pos, consts::kBitsOpen.size()) == consts::kBitsOpen;
}

bool closes_at(std::string_view text, std::size_t pos) {
  return text.substr(pos, consts::kBitsClose.size()) == consts::kBitsClose;
}

// "116, 105,116" -> bytes; empty pieces between commas are skipped.
std::optional<std::string> parse_bytes(std::string_view inner) {
  std::string bytes;
  std::size_t start = 0;
  while (start <= inner.size()) {
    std::size_t comma = inner.find(',', start);
    if (comma == std::string_view::npos)
      comma = inner.size();
    const std::string_view raw = inner.substr(start, comma - start);
    start = comma + 1;
    if (raw.empty())
      continue;

    std::string_view piece = strutil::trim(raw);
    // zero padding is allowed: <<0065>> is "A"
    while (piece.size() > 1 && piece.front() == '0')
      piece.remove_prefix(1);
    if (piece.empty() || piece.size() > 3)
      return std::nullopt;
    int value = 0;
    for (const char c : piece) {
      if (!is_digit(c))
        return std::nullopt;
      value = value * 10 + (c - '0');
    }
    if (value > 255)
      return std::nullopt;
    bytes.push_back(static_cast<char>(value));
  }
  return bytes;
}

} // namespace

std::string quote(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() + 2);
  out.push_back('"');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const char c = bytes[i];
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\v':
      out += "\\v";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\a':
      out += "\\a";
      break;
    case consts::kEsc:
      out += "\\e";
      break;
    case '#':
      // keep interpolation markers literal
      if (i + 1 < bytes.size() && bytes[i + 1] == '{')
        out += "\\#";
      else
        out.push_back(c);
      break;
    default:
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string stringify_printable(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t p = 0;
  while (p < text.size()) {
    if (!opens_at(text, p)) {
      out.push_back(text[p++]);
      continue;
    }
    std::size_t j = p + consts::kBitsOpen.size();
    while (j < text.size() && (is_digit(text[j]) || text[j] == ',' || strutil::is_space(text[j])))
      ++j;
    if (j == p + consts::kBitsOpen.size() || !closes_at(text, j)) {
      out.push_back(text[p++]);
      continue;
    }
    const std::size_t end = j + consts::kBitsClose.size();
    const auto bytes = parse_bytes(text.substr(p + 2, j - p - 2));
    if (bytes && utf8::is_printable(*bytes))
      out += quote(*bytes);
    else
      out.append(text.substr(p, end - p));
    p = end;
  }
  return out;
}

std::string stringify_bit_specs(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t p = 0;
  while (p < text.size()) {
    if (!opens_at(text, p) || (p > 0 && text[p - 1] == '"')) {
      out.push_back(text[p++]);
      continue;
    }
    std::size_t j = p + consts::kBitsOpen.size();
    while (j < text.size() && strutil::is_space(text[j]))
      ++j;
    const std::size_t underscores = j;
    while (j < text.size() && text[j] == '_')
      ++j;
    const std::size_t gt = text.find('>', j);
    const bool shaped = j > underscores && gt != std::string_view::npos && closes_at(text, gt) &&
                        text.substr(j, gt - j).find(consts::kTypeSep) != std::string_view::npos;
    const std::size_t end = shaped ? gt + consts::kBitsClose.size() : 0;
    if (!shaped || (end < text.size() && text[end] == '"')) {
      out.push_back(text[p++]);
      continue;
    }
    out += quote(text.substr(p, end - p));
    p = end;
  }
  return out;
}

std::string space_commas(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  std::size_t p = 0;
  while (p < text.size()) {
    if (!opens_at(text, p)) {
      out.push_back(text[p++]);
      continue;
    }
    std::size_t j = p + consts::kBitsOpen.size();
    while (j < text.size() && text[j] != '<' && text[j] != '>')
      ++j;
    if (j == p + consts::kBitsOpen.size() || !closes_at(text, j)) {
      out.push_back(text[p++]);
      continue;
    }
    const std::size_t end = j + consts::kBitsClose.size();
    for (std::size_t k = p; k < end; ++k) {
      out.push_back(text[k]);
      if (text[k] == ',' && k > p && is_digit(text[k - 1]) && is_digit(text[k + 1]))
        out.push_back(' ');
    }
    p = end;
  }
  return out;
}

std::string normalize(std::string_view text) {
  return space_commas(stringify_bit_specs(stringify_printable(text)));
}

} // namespace litdiff::binary
