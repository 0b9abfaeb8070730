#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace litdiff {

struct Entry {
  std::string key;   // trimmed
  std::string value; // trimmed
};

enum class ShapeKind : std::uint8_t { MapLiteral, CallSignature, Parenthesized, Plain };

// Result of the one classification pass. Views point into the classified text.
struct Shape {
  ShapeKind kind = ShapeKind::Plain;
  std::string_view body; // MapLiteral: text between %{ and }, Parenthesized: inner text
  std::string_view args; // CallSignature: text inside the outer parentheses
  std::string_view ret;  // CallSignature: text after ::
};

// Classify trimmed `text`. An opener only counts when its own closer ends
// the text, so "(a) | (b)" is Plain.
Shape classify(std::string_view text);

bool is_map_literal(std::string_view text);

// Body of a map literal, looking through at most one layer of parentheses.
std::optional<std::string_view> map_body(std::string_view text);

// Split on the first "=>". nullopt when the segment has no arrow.
std::optional<std::pair<std::string, std::string>> split_key_value(std::string_view segment);

// Entries of a map literal in first-occurrence key order. A repeated key
// keeps its first position but takes the last value. nullopt when the text
// is not a map or a segment is not a `key => value` pair.
std::optional<std::vector<Entry>> parse_map_literal(std::string_view text);

const Entry* find_entry(const std::vector<Entry>& entries, std::string_view key);

// Empty or `...` segments that carry no entry
bool is_filler_segment(std::string_view segment);

} // namespace litdiff
