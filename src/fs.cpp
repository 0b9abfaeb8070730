#include "litdiff/fs.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace litdiff::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::string read_text(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  if (ifs.bad())
    throw std::runtime_error("read failed: " + p.string());
  return buf.str();
}

std::string load_input(const std::string &arg, bool inline_text) {
  if (inline_text)
    return arg;
  return read_text(arg);
}

} // namespace litdiff::fs
