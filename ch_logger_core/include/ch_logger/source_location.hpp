#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ch_logger
{

// 调用方标识：模块名 + 可选行号，格式化为 "name" 或 "name:line"
struct CallerId
{
  std::string name;
  std::optional<uint32_t> line;
};

constexpr std::string_view extract_filename(std::string_view path)
{
  size_t pos = path.find_last_of("/\\");
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

// "src/net/Session.cpp" -> "Session"
constexpr std::string_view extract_stem(std::string_view path)
{
  std::string_view name = extract_filename(path);
  size_t dot = name.rfind('.');
  return (dot == std::string_view::npos || dot == 0) ? name : name.substr(0, dot);
}

}  // namespace ch_logger

#define CH_LOG_CURRENT_CALLER()                                           \
  ::ch_logger::CallerId                                                   \
  {                                                                       \
    std::string(::ch_logger::extract_stem(__FILE__)),                     \
        std::optional<uint32_t>(static_cast<uint32_t>(__LINE__))          \
  }
