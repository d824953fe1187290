#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ch_logger
{

// 当前文件 + 归档文件：
//   <dir>/<base><ext>, <dir>/<base>_1<ext>, ..., <dir>/<base>_<max_files><ext>
// 写操作（Append/Sync/RotateIfNeeded/TruncateAll）只能由写线程调用；
// 路径与大小查询可在任意线程调用。
class RotatingFileSet
{
 public:
  RotatingFileSet(std::string directory, std::string base_name, std::string extension,
                  size_t max_file_size, size_t max_files);
  ~RotatingFileSet();

  RotatingFileSet(const RotatingFileSet&) = delete;
  RotatingFileSet& operator=(const RotatingFileSet&) = delete;

  bool Append(std::string_view data);
  bool Sync();

  // Shifts the archives when the current file is larger than max_file_size.
  // Returns true when a rotation happened.
  bool RotateIfNeeded();

  // Empties every existing generation; the files themselves are kept.
  bool TruncateAll();

  // index 0 is the current file
  std::string GenerationPath(size_t index) const;
  std::string CurrentPath() const { return GenerationPath(0); }

  // Current file first, then the archives that exist, newest to oldest.
  std::vector<std::string> ExistingPaths() const;

  uint64_t CurrentSizeBytes() const;
  uint64_t TotalSizeBytes() const;

  size_t MaxFileSize() const { return max_file_size_; }
  size_t MaxFiles() const { return max_files_; }
  uint64_t IoErrorCount() const { return io_errors_.load(std::memory_order_relaxed); }

  static std::optional<std::string> ReadFile(const std::string& path);

 private:
  std::string directory_;
  std::string base_name_;
  std::string extension_;
  size_t max_file_size_;
  size_t max_files_;
  int fd_;
  bool open_error_reported_;
  std::atomic<uint64_t> io_errors_{0};

  void OpenFile();
  void CloseFile();
  void CountError() { io_errors_.fetch_add(1, std::memory_order_relaxed); }
  static void MkdirRecursive(const std::string& path);
};

}  // namespace ch_logger
