#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log_level.hpp"

namespace ch_logger
{

struct LogRecord
{
  uint64_t wall_clock_ns = 0;  // millisecond precision
  LogLevel level = LogLevel::Info;
  std::string glyph;
  std::string caller;
  std::optional<uint32_t> line;
  std::string message;  // text after the caller block, metadata included
};

// Parses the first line of one persisted entry:
//   [yyyy-MM-dd HH:mm:ss.SSS] LEVEL glyph [caller[:line]] message
// LEVEL is a rank (0-4) or a level name. Returns std::nullopt on any mismatch.
std::optional<LogRecord> ParseLogLine(std::string_view line);

// Parses every line of text, silently dropping the ones that do not parse
// (stack-trace lines, separators, damaged entries). With a limit only the last
// `limit` records are kept.
std::vector<LogRecord> ParseLogText(std::string_view text,
                                    std::optional<size_t> limit = std::nullopt);

}  // namespace ch_logger
