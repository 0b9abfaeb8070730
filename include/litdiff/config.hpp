#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace litdiff {

enum class ColorMode : std::uint8_t { Auto, Always, Never };

struct Settings {
  ColorMode color = ColorMode::Auto;
  bool header = true; // print the Expected/Actual blocks before the diff
};

// Parse "key: value" lines; '#' starts a comment line, unknown keys are
// ignored. Throws std::runtime_error on a bad value.
Settings parse_settings(std::string_view text);

// Read settings from `path` (defaults if the file is missing)
Settings load_settings(const std::filesystem::path& path);

auto format_settings(const Settings& settings) -> std::string;

auto parse_color_mode(std::string_view value) -> ColorMode;
auto color_mode_name(ColorMode mode) -> std::string_view;

// Auto means: only on a terminal, and only when NO_COLOR is not set
bool resolve_color(ColorMode mode, bool is_tty, bool no_color_env);

} // namespace litdiff
