#pragma once
#include <cstddef>
#include <string_view>

namespace litdiff::consts {

// Literal markers
inline constexpr std::string_view kMapOpen    = "%{";
inline constexpr std::string_view kMapClose   = "}";
inline constexpr std::string_view kBitsOpen   = "<<";
inline constexpr std::string_view kBitsClose  = ">>";
inline constexpr std::string_view kArrow      = "=>";
inline constexpr std::string_view kEntrySep   = " => ";
inline constexpr std::string_view kTypeSep    = "::";
inline constexpr std::string_view kElision    = "...";

// ——— Display ———
inline constexpr std::string_view kDelMarker  = "-  ";
inline constexpr std::string_view kInsMarker  = "+  ";
inline constexpr std::size_t kMarkerWidth     = 3;
inline constexpr std::string_view kIndentTwo  = "  ";
inline constexpr std::string_view kIndentFour = "    ";

// ——— Escape sequences ———
inline constexpr char kEsc = '\x1b';
inline constexpr std::string_view kCsi = "\x1b[";

// ——— Recursion cap for pretty-printing and nested map diffs ———
inline constexpr int kMaxDepth = 64;

// ——— Program ———
inline constexpr std::string_view kVersion = "0.1.0";

// ——— Settings file ———
inline constexpr std::string_view kSettingsFile = ".litdiff";

// ——— Report headings ———
inline constexpr std::string_view kDiffHeading   = "Diff (expected -, actual +):";
inline constexpr std::string_view kReasonHeading = "Reason:";
inline constexpr std::string_view kArrowPrefix   = "-> ";

} // namespace litdiff::consts
