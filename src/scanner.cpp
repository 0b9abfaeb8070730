#include "litdiff/scanner.hpp"

#include "litdiff/consts.hpp"
#include "litdiff/util.hpp"

namespace litdiff {

namespace {

bool special_at(std::string_view text, std::size_t i) {
  const char c = text[i];
  switch (c) {
  case '{':
  case '}':
  case '[':
  case ']':
  case '(':
  case ')':
  case ',':
    return true;
  case '<':
  case '>':
    return i + 1 < text.size() && text[i + 1] == c;
  case consts::kEsc:
    return i + 1 < text.size() && text[i + 1] == '[';
  default:
    return false;
  }
}

Bracket family_of(char c) {
  switch (c) {
  case '{':
  case '}':
    return Bracket::Brace;
  case '[':
  case ']':
    return Bracket::Square;
  case '(':
  case ')':
    return Bracket::Paren;
  default:
    return Bracket::Bits;
  }
}

void bump(int &counter, TokenKind kind) {
  if (kind == TokenKind::Open)
    ++counter;
  else if (counter > 0)
    --counter;
}

} // namespace

std::vector<Token> scan(std::string_view text) {
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (!special_at(text, i)) {
      const std::size_t start = i;
      while (i < text.size() && !special_at(text, i))
        ++i;
      out.push_back(Token{TokenKind::Text, Bracket::None, start, text.substr(start, i - start)});
      continue;
    }
    if (c == consts::kEsc) {
      const std::size_t start = i;
      const std::size_t m = text.find('m', i + consts::kCsi.size());
      i = (m == std::string_view::npos) ? text.size() : m + 1;
      out.push_back(
          Token{TokenKind::Escape, Bracket::None, start, text.substr(start, i - start)});
      continue;
    }
    if (c == ',') {
      out.push_back(Token{TokenKind::Comma, Bracket::None, i, text.substr(i, 1)});
      ++i;
      continue;
    }
    if (c == '<' || c == '>') {
      const TokenKind kind = (c == '<') ? TokenKind::Open : TokenKind::Close;
      out.push_back(Token{kind, Bracket::Bits, i, text.substr(i, 2)});
      i += 2;
      continue;
    }
    const TokenKind kind = (c == '{' || c == '[' || c == '(') ? TokenKind::Open : TokenKind::Close;
    out.push_back(Token{kind, family_of(c), i, text.substr(i, 1)});
    ++i;
  }
  return out;
}

void Depth::apply(const Token &tok) {
  if (tok.kind != TokenKind::Open && tok.kind != TokenKind::Close)
    return;
  switch (tok.bracket) {
  case Bracket::Brace:
    bump(brace, tok.kind);
    break;
  case Bracket::Square:
    bump(square, tok.kind);
    break;
  case Bracket::Paren:
    bump(paren, tok.kind);
    break;
  case Bracket::Bits:
    bump(bits, tok.kind);
    break;
  case Bracket::None:
    break;
  }
}

std::vector<std::string> split_top_level(std::string_view text) {
  std::vector<std::string> out;
  if (strutil::trim(text).empty())
    return out;

  Depth depth;
  std::size_t seg_start = 0;
  for (const Token &tok : scan(text)) {
    if (tok.kind == TokenKind::Comma && depth.top_level()) {
      out.emplace_back(strutil::trim(text.substr(seg_start, tok.offset - seg_start)));
      seg_start = tok.offset + 1;
      continue;
    }
    depth.apply(tok);
  }
  out.emplace_back(strutil::trim(text.substr(seg_start)));
  return out;
}

std::string unmatched_closers(std::string_view text) {
  std::string stack; // open chars, innermost last
  for (const Token &tok : scan(text)) {
    if (tok.kind == TokenKind::Open && tok.bracket != Bracket::Bits) {
      stack.push_back(tok.text.front());
    } else if (tok.kind == TokenKind::Close && tok.bracket != Bracket::Bits) {
      const char want = tok.text.front() == ')' ? '(' : tok.text.front() == ']' ? '[' : '{';
      if (!stack.empty() && stack.back() == want)
        stack.pop_back();
    }
  }
  std::string closers;
  closers.reserve(stack.size());
  for (auto it = stack.rbegin(); it != stack.rend(); ++it)
    closers.push_back(*it == '(' ? ')' : *it == '[' ? ']' : '}');
  return closers;
}

std::size_t matching_close(std::string_view text, std::size_t open_pos) {
  const auto tokens = scan(text);
  std::size_t idx = 0;
  while (idx < tokens.size() && tokens[idx].offset < open_pos)
    ++idx;
  if (idx == tokens.size() || tokens[idx].offset != open_pos ||
      tokens[idx].kind != TokenKind::Open)
    return std::string_view::npos;

  const Bracket family = tokens[idx].bracket;
  int depth = 0;
  for (; idx < tokens.size(); ++idx) {
    const Token &tok = tokens[idx];
    if (tok.bracket != family)
      continue;
    if (tok.kind == TokenKind::Open) {
      ++depth;
    } else if (depth > 0 && --depth == 0) {
      return tok.offset;
    }
  }
  return std::string_view::npos;
}

bool is_closer(char c) { return c == ')' || c == ']' || c == '}'; }

} // namespace litdiff
