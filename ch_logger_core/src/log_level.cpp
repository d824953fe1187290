#include "ch_logger/log_level.hpp"

#include <cctype>

namespace ch_logger
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
  {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i])))
    {
      return false;
    }
  }
  return true;
}

constexpr LogLevel kAllLevels[] = {LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                                   LogLevel::Error, LogLevel::Critical};

}  // namespace

std::optional<LogLevel> parse_level(std::string_view token)
{
  if (token.size() == 1 && token[0] >= '0' && token[0] <= '4')
  {
    return static_cast<LogLevel>(token[0] - '0');
  }
  for (LogLevel level : kAllLevels)
  {
    if (iequals(token, to_string(level)))
    {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace ch_logger
