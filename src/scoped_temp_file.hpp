#pragma once

#include <filesystem>
#include <string>

namespace scanplot {

// Writes a byte buffer to a uniquely named file in the system temp
// directory and deletes that file when the object goes out of scope.
class ScopedTempFile {
 public:
  // Throws IoError if the file cannot be created or written.
  ScopedTempFile(const std::string& bytes, const std::string& name_hint);
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  const std::filesystem::path& path() const { return path_; }

 private:
  void release() noexcept;

  std::filesystem::path path_;
};

}  // namespace scanplot
