#include "parcelday/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace parcelday {

namespace {

std::filesystem::path temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string name = target.filename().string() + ".tmp." + std::to_string(stamp);
    if (attempt > 0) name += "." + std::to_string(attempt);
    std::filesystem::path candidate = dir.empty() ? std::filesystem::path(name) : (dir / name);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }
  throw std::runtime_error("Failed to pick a temporary file name next to: " + target.string());
}

struct TempFileCleanup {
  std::filesystem::path path;
  bool active{true};
  explicit TempFileCleanup(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
  void release() { active = false; }
};

std::filesystem::path resolve_read_path(const std::filesystem::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (std::filesystem::exists(requested, ec) && !ec) return requested;

#ifdef PARCELDAY_SOURCE_DIR
  ec.clear();
  const auto candidate = std::filesystem::path(PARCELDAY_SOURCE_DIR) / requested;
  if (std::filesystem::exists(candidate, ec) && !ec) return candidate;
#endif

  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const std::filesystem::path requested(path);
  const std::filesystem::path resolved = resolve_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path +
                               " (resolved to: " + resolved.string() + ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

void write_text_file(const std::string& path, const std::string& contents) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const std::filesystem::path tmp = temp_sibling_path(p);
  TempFileCleanup cleanup(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(p, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, p, ec);
  }
  if (ec) {
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }

  cleanup.release();
}

} // namespace parcelday
