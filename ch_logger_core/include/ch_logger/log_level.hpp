#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "platform.hpp"

namespace ch_logger
{

enum class LogLevel : uint8_t
{
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Critical = 4
};

// 控制台 Sink 的严重级别（对应系统日志的 debug/info/default/error/fault）
enum class SinkSeverity : uint8_t
{
  Debug,
  Info,
  Default,
  Error,
  Fault
};

constexpr uint8_t to_rank(LogLevel level) { return static_cast<uint8_t>(level); }

constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

constexpr std::string_view to_glyph(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug: return "\xF0\x9F\x90\x9B";             // 🐛
    case LogLevel::Info: return "\xF0\x9F\x92\x99";              // 💙
    case LogLevel::Warning: return "\xE2\x9A\xA0\xEF\xB8\x8F";   // ⚠️
    case LogLevel::Error: return "\xE2\x9D\xA4\xEF\xB8\x8F";     // ❤️
    case LogLevel::Critical: return "\xF0\x9F\x92\x80";          // 💀
  }
  return "?";
}

constexpr SinkSeverity to_sink_severity(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug: return SinkSeverity::Debug;
    case LogLevel::Info: return SinkSeverity::Info;
    case LogLevel::Warning: return SinkSeverity::Default;
    case LogLevel::Error: return SinkSeverity::Error;
    case LogLevel::Critical: return SinkSeverity::Fault;
  }
  return SinkSeverity::Default;
}

constexpr bool includes_stack_trace(LogLevel level)
{
  return level == LogLevel::Error || level == LogLevel::Critical;
}

// Accepts a numeric rank ("0".."4") or a level name, case-insensitive.
std::optional<LogLevel> parse_level(std::string_view token);

constexpr LogLevel kDefaultMinimumLevel = static_cast<LogLevel>(CH_LOG_DEFAULT_LEVEL);

}  // namespace ch_logger
