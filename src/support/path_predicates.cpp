/***
 * Name: shdoc::support path and file-attribute predicates
 * Purpose: Inspect paths on the local filesystem.
 * Theory of Operation: Non-throwing std::filesystem overloads for type and
 *   size queries; access(2) for the effective permission checks.
 */
#include "shdoc/support/predicates.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace shdoc {
namespace support {

namespace fs = std::filesystem;

bool IsAbsolutePath(std::string_view path) { return !path.empty() && path.front() == '/'; }

bool IsRelativePath(std::string_view path) { return !IsAbsolutePath(path); }

bool FileExists(const std::string& path) {
  std::error_code errCode;
  return fs::exists(path, errCode);
}

bool IsFile(const std::string& path) {
  std::error_code errCode;
  return fs::is_regular_file(path, errCode);
}

bool IsDir(const std::string& path) {
  std::error_code errCode;
  return fs::is_directory(path, errCode);
}

bool IsSymlink(const std::string& path) {
  std::error_code errCode;
  return fs::is_symlink(path, errCode);
}

bool IsReadable(const std::string& path) { return ::access(path.c_str(), R_OK) == 0; }

bool IsWritable(const std::string& path) { return ::access(path.c_str(), W_OK) == 0; }

bool IsExecutable(const std::string& path) { return ::access(path.c_str(), X_OK) == 0; }

bool FileNotEmpty(const std::string& path) {
  std::error_code errCode;
  if (!fs::is_regular_file(path, errCode)) { return false; }
  const auto size = fs::file_size(path, errCode);
  return !errCode && size > 0;
}

bool IsReadableFile(const std::string& path) { return IsFile(path) && IsReadable(path); }

bool IsWritableDir(const std::string& path) { return IsDir(path) && IsWritable(path); }

bool FileIsExecutable(const std::string& path) { return IsFile(path) && IsExecutable(path); }

}  // namespace support
}  // namespace shdoc
