#include "ch_logger/entry_parser.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

#include "ch_logger/timestamp.hpp"

namespace ch_logger
{

namespace
{

bool is_word_token(std::string_view token)
{
  if (token.empty()) return false;
  for (char c : token)
  {
    bool word = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                c == '_';
    if (!word) return false;
  }
  return true;
}

std::optional<uint32_t> parse_line_number(std::string_view digits)
{
  if (digits.empty() || digits.size() > 10) return std::nullopt;
  uint64_t value = 0;
  for (char c : digits)
  {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  if (value > UINT32_MAX) return std::nullopt;
  return static_cast<uint32_t>(value);
}

}  // namespace

std::optional<LogRecord> ParseLogLine(std::string_view line)
{
  if (!line.empty() && line.back() == '\r')
  {
    line.remove_suffix(1);
  }

  // [timestamp] LEVEL glyph [caller] message
  if (line.empty() || line.front() != '[') return std::nullopt;
  size_t ts_end = line.find(']', 1);
  if (ts_end == std::string_view::npos || ts_end + 1 >= line.size() || line[ts_end + 1] != ' ')
  {
    return std::nullopt;
  }
  std::string_view ts_text = line.substr(1, ts_end - 1);

  size_t level_begin = ts_end + 2;
  size_t level_end = line.find(' ', level_begin);
  if (level_end == std::string_view::npos) return std::nullopt;
  std::string_view level_text = line.substr(level_begin, level_end - level_begin);
  if (!is_word_token(level_text)) return std::nullopt;

  size_t glyph_begin = level_end + 1;
  size_t caller_open = line.find(" [", glyph_begin);
  if (caller_open == std::string_view::npos) return std::nullopt;
  size_t caller_begin = caller_open + 2;
  size_t caller_close = line.find("] ", caller_begin);
  if (caller_close == std::string_view::npos) return std::nullopt;

  auto timestamp = parse_timestamp(ts_text);
  if (!timestamp)
  {
    return std::nullopt;
  }
  auto level = parse_level(level_text);
  if (!level)
  {
    return std::nullopt;
  }

  LogRecord record;
  record.wall_clock_ns = *timestamp;
  record.level = *level;
  record.glyph = std::string(line.substr(glyph_begin, caller_open - glyph_begin));
  record.message = std::string(line.substr(caller_close + 2));

  std::string caller(line.substr(caller_begin, caller_close - caller_begin));
  size_t colon = caller.rfind(':');
  if (colon != std::string::npos)
  {
    if (auto number = parse_line_number(std::string_view(caller).substr(colon + 1)))
    {
      record.line = number;
      caller.resize(colon);
    }
  }
  record.caller = std::move(caller);
  return record;
}

std::vector<LogRecord> ParseLogText(std::string_view text, std::optional<size_t> limit)
{
  std::vector<LogRecord> records;
  size_t pos = 0;
  while (pos <= text.size())
  {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    if (line.find_first_not_of(" \t\r") != std::string_view::npos)
    {
      if (auto record = ParseLogLine(line))
      {
        records.push_back(std::move(*record));
      }
    }
    pos = end + 1;
  }

  if (limit && records.size() > *limit)
  {
    records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(*limit));
  }
  return records;
}

}  // namespace ch_logger
