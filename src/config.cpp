#include "litdiff/config.hpp"

#include "litdiff/fs.hpp"
#include "litdiff/util.hpp"

#include <sstream>
#include <stdexcept>

namespace {

bool parse_switch(std::string_view key, std::string_view value) {
  if (value == "on" || value == "true" || value == "yes")
    return true;
  if (value == "off" || value == "false" || value == "no")
    return false;
  throw std::runtime_error("bad value for " + std::string(key) + ": " + std::string(value));
}

} // namespace

namespace litdiff {

auto parse_color_mode(std::string_view value) -> ColorMode {
  if (value == "auto")
    return ColorMode::Auto;
  if (value == "always")
    return ColorMode::Always;
  if (value == "never")
    return ColorMode::Never;
  throw std::runtime_error("bad value for color: " + std::string(value));
}

auto color_mode_name(ColorMode mode) -> std::string_view {
  switch (mode) {
  case ColorMode::Always:
    return "always";
  case ColorMode::Never:
    return "never";
  case ColorMode::Auto:
    break;
  }
  return "auto";
}

Settings parse_settings(std::string_view text) {
  Settings out{};
  std::istringstream iss{std::string(text)};

  constexpr std::string_view k_color = "color:";
  constexpr std::string_view k_header = "header:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_color)) {
      out.color = parse_color_mode(strutil::trim(sv.substr(k_color.size())));
    } else if (sv.starts_with(k_header)) {
      out.header = parse_switch("header", strutil::trim(sv.substr(k_header.size())));
    }
  }
  return out;
}

auto load_settings(const std::filesystem::path &path) -> Settings {
  if (!fs::exists(path))
    return Settings{};
  return parse_settings(fs::read_text(path));
}

auto format_settings(const Settings &settings) -> std::string {
  std::ostringstream os;
  os << "color: " << color_mode_name(settings.color) << '\n'
     << "header: " << (settings.header ? "on" : "off") << '\n';
  return os.str();
}

bool resolve_color(ColorMode mode, bool is_tty, bool no_color_env) {
  switch (mode) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    break;
  }
  return is_tty && !no_color_env;
}

} // namespace litdiff
