#include "cataphract/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cataphract {

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed while reading file: " + path);
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  namespace fs = std::filesystem;
  const fs::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory for: " + path + " (" + ec.message() + ")");
  }

  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed while writing file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    fs::remove(target, ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }
}

} // namespace cataphract
