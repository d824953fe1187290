#pragma once
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

// mkdtemp 目录，析构时递归删除
class TempDir
{
 public:
  TempDir()
  {
    char tmpl[] = "/tmp/ch_logger_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (dir != nullptr) path_ = dir;
  }
  ~TempDir()
  {
    if (!path_.empty()) RemoveRecursive(path_);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& Path() const { return path_; }
  bool Valid() const { return !path_.empty(); }

  static std::string ReadFile(const std::string& path)
  {
    std::ifstream ifs(path);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  static bool FileExists(const std::string& path)
  {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
  }

  static size_t FileSize(const std::string& path)
  {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return static_cast<size_t>(st.st_size);
  }

 private:
  std::string path_;

  static void RemoveRecursive(const std::string& path)
  {
    DIR* d = ::opendir(path.c_str());
    if (!d) return;
    struct dirent* ent;
    while ((ent = ::readdir(d)) != nullptr)
    {
      std::string name = ent->d_name;
      if (name == "." || name == "..") continue;
      std::string full = path + "/" + name;
      struct stat st{};
      if (::stat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
      {
        RemoveRecursive(full);
      }
      else
      {
        std::remove(full.c_str());
      }
    }
    ::closedir(d);
    ::rmdir(path.c_str());
  }
};
