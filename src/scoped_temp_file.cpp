#include "scoped_temp_file.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <random>
#include <system_error>

#include "scan_errors.hpp"

namespace fs = std::filesystem;

namespace scanplot {

// Keep only characters that are safe in a file name on every platform.
static std::string sanitize(const std::string& hint) {
  std::string out;
  for (char c : hint) {
    const unsigned char u = static_cast<unsigned char>(c);
    out.push_back((std::isalnum(u) || c == '-' || c == '_' || c == '.') ? c : '_');
  }
  if (out.size() > 64) out.resize(64);
  return out;
}

static fs::path uniqueTempPath(const std::string& name_hint) {
  static std::mt19937_64 rng(std::random_device{}());
  std::error_code ec;
  const fs::path dir = fs::temp_directory_path(ec);
  if (ec) {
    throw IoError("no temporary directory: " + ec.message());
  }

  const std::string base = sanitize(name_hint);
  for (int attempt = 0; attempt < 16; ++attempt) {
    const fs::path p = dir / ("scanplot-" + std::to_string(rng()) + "-" + base);
    if (!fs::exists(p, ec)) {
      return p;
    }
  }
  throw IoError("could not find a free temporary file name in " + dir.string());
}

ScopedTempFile::ScopedTempFile(const std::string& bytes, const std::string& name_hint)
    : path_(uniqueTempPath(name_hint)) {
  std::ofstream ofs(path_, std::ios::binary);
  if (!ofs.is_open()) {
    throw IoError("cannot create temporary file " + path_.string());
  }
  ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  ofs.close();
  if (!ofs) {
    release();
    throw IoError("cannot write temporary file " + path_.string());
  }
}

ScopedTempFile::~ScopedTempFile() { release(); }

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void ScopedTempFile::release() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    std::cerr << "Warning: could not remove temporary file " << path_.string() << ": "
              << ec.message() << "\n";
  }
  path_.clear();
}

}  // namespace scanplot
