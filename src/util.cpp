// String, UTF-8 and grapheme helpers
#include "litdiff/util.hpp"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>

#include <algorithm>
#include <cstdint>
#include <memory>

namespace litdiff {

namespace strutil {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim_left(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front()))
    sv.remove_prefix(1);
  return sv;
}

std::string_view trim_right(std::string_view sv) {
  while (!sv.empty() && is_space(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

std::string_view trim(std::string_view sv) { return trim_right(trim_left(sv)); }

std::string repeat(std::string_view piece, int times) {
  std::string out;
  if (times <= 0)
    return out;
  out.reserve(piece.size() * static_cast<std::size_t>(times));
  for (int i = 0; i < times; ++i)
    out.append(piece);
  return out;
}

} // namespace strutil

namespace utf8 {

bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

namespace {

// Grapheme cluster boundaries of one UTF-8 text, offsets in bytes.
class GraphemeBreaks {
public:
  explicit GraphemeBreaks(std::string_view text) : size_(text.size()) {
    UErrorCode status = U_ZERO_ERROR;
    text_ = utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status);
    iter_.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_SUCCESS(status) && iter_)
      iter_->setText(text_, status);
    ok_ = U_SUCCESS(status) && iter_ != nullptr;
  }
  ~GraphemeBreaks() { utext_close(text_); }
  GraphemeBreaks(const GraphemeBreaks &) = delete;
  GraphemeBreaks &operator=(const GraphemeBreaks &) = delete;

  // Without break data only code point boundaries are checked
  bool is_boundary(std::size_t offset) {
    if (offset == 0 || offset >= size_ || !ok_)
      return true;
    return iter_->isBoundary(static_cast<int32_t>(offset)) != 0;
  }

private:
  std::size_t size_;
  UText *text_ = nullptr;
  std::unique_ptr<icu::BreakIterator> iter_;
  bool ok_ = false;
};

bool code_point_boundary(std::string_view s, std::size_t offset) {
  return offset >= s.size() || !is_continuation(s[offset]);
}

} // namespace

std::size_t common_prefix(std::string_view a, std::string_view b) {
  const std::size_t limit = std::min(a.size(), b.size());
  std::size_t n = 0;
  while (n < limit && a[n] == b[n])
    ++n;
  if (n == 0)
    return 0;

  GraphemeBreaks breaks_a(a);
  GraphemeBreaks breaks_b(b);
  while (n > 0 && !(code_point_boundary(a, n) && code_point_boundary(b, n) &&
                    breaks_a.is_boundary(n) && breaks_b.is_boundary(n)))
    --n;
  return n;
}

std::size_t common_suffix(std::string_view a, std::string_view b) {
  const std::size_t limit = std::min(a.size(), b.size());
  std::size_t n = 0;
  while (n < limit && a[a.size() - 1 - n] == b[b.size() - 1 - n])
    ++n;
  if (n == 0)
    return 0;

  // a shared combining mark stays with the base character it follows
  GraphemeBreaks breaks_a(a);
  GraphemeBreaks breaks_b(b);
  while (n > 0 && !(code_point_boundary(a, a.size() - n) &&
                    breaks_a.is_boundary(a.size() - n) && breaks_b.is_boundary(b.size() - n)))
    --n;
  return n;
}

bool is_printable(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::uint32_t cp = 0;
    std::size_t len = 0;
    if (lead < 0x80) {
      cp = lead;
      len = 1;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      len = 4;
    } else {
      return false;
    }
    if (i + len > bytes.size())
      return false;
    for (std::size_t k = 1; k < len; ++k) {
      if (!is_continuation(bytes[i + k]))
        return false;
      cp = (cp << 6) | (static_cast<unsigned char>(bytes[i + k]) & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
      return false;
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      return false;

    const bool escape_char = (cp >= 0x07 && cp <= 0x0D) || cp == 0x1B;
    if (!escape_char && (cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp < 0xA0)))
      return false;
    i += len;
  }
  return true;
}

} // namespace utf8

} // namespace litdiff
