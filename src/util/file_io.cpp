#include "partplan/util/file_io.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace partplan {

namespace {

std::filesystem::path make_temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const std::string base = target.filename().string();

  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string name = base + ".tmp." + std::to_string(now);
    if (attempt > 0) name += "." + std::to_string(attempt);
    std::filesystem::path candidate = dir.empty() ? std::filesystem::path(name) : (dir / name);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }

  std::string name = base + ".tmp." + std::to_string(now);
  return dir.empty() ? std::filesystem::path(name) : (dir / name);
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

std::filesystem::path resolve_existing_read_path(const std::filesystem::path& requested) {
  if (requested.empty() || requested.is_absolute()) return requested;

  std::error_code ec;
  if (std::filesystem::exists(requested, ec) && !ec) return requested;

  std::vector<std::filesystem::path> roots;
#ifdef PARTPLAN_SOURCE_DIR
  roots.emplace_back(PARTPLAN_SOURCE_DIR);
#endif

  ec.clear();
  std::filesystem::path cur = std::filesystem::current_path(ec);
  if (!ec && !cur.empty()) {
    for (int depth = 0; depth < 8; ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent.empty() || parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const std::filesystem::path requested(path);
  const std::filesystem::path resolved = resolve_existing_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path + " (resolved to: " +
                               resolved.string() + ")");
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

  const std::filesystem::path tmp = make_temp_sibling_path(p);
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
    // Windows refuses to rename over an existing file.
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

std::string archive_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf);
}

std::string archive_copy(const std::string& path, const std::string& archive_dir, const std::string& stamp) {
  const std::filesystem::path src(path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(src, ec) || ec) {
    throw std::runtime_error("Cannot archive missing file: " + path);
  }

  ensure_dir(archive_dir);
  const std::string name = src.stem().string() + "_" + stamp + src.extension().string();
  const std::filesystem::path dst = std::filesystem::path(archive_dir) / name;

  std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("Failed to archive " + path + " to " + dst.string() + " (" + ec.message() + ")");
  }
  return dst.string();
}

} // namespace partplan
