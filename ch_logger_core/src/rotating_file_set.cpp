#include "ch_logger/rotating_file_set.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace ch_logger
{

namespace
{

bool file_exists(const std::string& path)
{
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

uint64_t file_size(const std::string& path)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return 0;
  return static_cast<uint64_t>(st.st_size);
}

}  // namespace

void RotatingFileSet::MkdirRecursive(const std::string& path)
{
  std::string tmp;
  for (size_t i = 0; i < path.size(); ++i)
  {
    tmp += path[i];
    if (path[i] == '/' || i == path.size() - 1)
    {
      ::mkdir(tmp.c_str(), 0755);
    }
  }
}

RotatingFileSet::RotatingFileSet(std::string directory, std::string base_name,
                                 std::string extension, size_t max_file_size,
                                 size_t max_files)
    : directory_(std::move(directory)),
      base_name_(std::move(base_name)),
      extension_(std::move(extension)),
      max_file_size_(max_file_size),
      max_files_(max_files),
      fd_(-1),
      open_error_reported_(false)
{
  if (!directory_.empty())
  {
    MkdirRecursive(directory_);
  }
  OpenFile();
}

RotatingFileSet::~RotatingFileSet()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
  }
  CloseFile();
}

std::string RotatingFileSet::GenerationPath(size_t index) const
{
  std::string result = directory_;
  if (!result.empty() && result.back() != '/')
  {
    result += '/';
  }
  result += base_name_;
  if (index > 0)
  {
    result += '_';
    result += std::to_string(index);
  }
  result += extension_;
  return result;
}

void RotatingFileSet::OpenFile()
{
  std::string path = CurrentPath();
  fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0)
  {
    CountError();
    if (!open_error_reported_)
    {
      std::fprintf(stderr, "RotatingFileSet: failed to open '%s': %s\n", path.c_str(),
                   std::strerror(errno));
      open_error_reported_ = true;
    }
    return;
  }
  open_error_reported_ = false;
}

void RotatingFileSet::CloseFile()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

bool RotatingFileSet::Append(std::string_view data)
{
  if (fd_ < 0)
  {
    OpenFile();
    if (fd_ < 0)
    {
      return false;
    }
  }

  const char* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0)
  {
    ssize_t written = ::write(fd_, ptr, remaining);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      CountError();
      return false;
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
  return true;
}

bool RotatingFileSet::Sync()
{
  if (fd_ < 0) return false;
  if (::fdatasync(fd_) != 0)
  {
    CountError();
    return false;
  }
  return true;
}

uint64_t RotatingFileSet::CurrentSizeBytes() const { return file_size(CurrentPath()); }

bool RotatingFileSet::RotateIfNeeded()
{
  if (CurrentSizeBytes() <= max_file_size_)
  {
    return false;
  }

  CloseFile();

  for (size_t i = max_files_ > 0 ? max_files_ - 1 : 0; i >= 1; --i)
  {
    std::string src = GenerationPath(i);
    if (!file_exists(src)) continue;
    std::string dst = GenerationPath(i + 1);
    if (::unlink(dst.c_str()) != 0 && errno != ENOENT) CountError();
    if (::rename(src.c_str(), dst.c_str()) != 0) CountError();
  }

  if (max_files_ > 0)
  {
    std::string archive = GenerationPath(1);
    if (::unlink(archive.c_str()) != 0 && errno != ENOENT) CountError();
    if (::rename(CurrentPath().c_str(), archive.c_str()) != 0) CountError();
  }
  else if (::truncate(CurrentPath().c_str(), 0) != 0)
  {
    CountError();
  }

  OpenFile();
  return true;
}

bool RotatingFileSet::TruncateAll()
{
  bool ok = true;
  for (const auto& path : ExistingPaths())
  {
    if (::truncate(path.c_str(), 0) != 0 && errno != ENOENT)
    {
      CountError();
      ok = false;
    }
  }
  return ok;
}

std::vector<std::string> RotatingFileSet::ExistingPaths() const
{
  std::vector<std::string> paths;
  paths.push_back(CurrentPath());
  for (size_t i = 1; i <= max_files_; ++i)
  {
    std::string path = GenerationPath(i);
    if (file_exists(path))
    {
      paths.push_back(std::move(path));
    }
  }
  return paths;
}

uint64_t RotatingFileSet::TotalSizeBytes() const
{
  uint64_t total = 0;
  for (const auto& path : ExistingPaths())
  {
    total += file_size(path);
  }
  return total;
}

std::optional<std::string> RotatingFileSet::ReadFile(const std::string& path)
{
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
  {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

}  // namespace ch_logger
