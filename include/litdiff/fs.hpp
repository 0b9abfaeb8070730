#pragma once
#include <filesystem>
#include <string>

namespace litdiff::fs {

bool exists(const std::filesystem::path& p);

// Whole file as text; throws std::runtime_error when it cannot be opened
std::string read_text(const std::filesystem::path& p);

// Read `arg` as a file, or take it verbatim when `inline_text` is set
std::string load_input(const std::string& arg, bool inline_text);

} // namespace litdiff::fs
