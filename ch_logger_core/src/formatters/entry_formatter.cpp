#include "ch_logger/formatters/entry_formatter.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>
#include <vector>

#include "ch_logger/timestamp.hpp"

namespace ch_logger
{

namespace
{

constexpr std::string_view kFrameIndent = "    ";

// 持久化行内的换行会被解析器当成新条目，写入前转义为字面量 \n / \r
void append_escaped(fmt::memory_buffer& out, std::string_view text)
{
  for (char c : text)
  {
    if (c == '\n')
    {
      fmt::format_to(std::back_inserter(out), "\\n");
    }
    else if (c == '\r')
    {
      fmt::format_to(std::back_inserter(out), "\\r");
    }
    else
    {
      out.push_back(c);
    }
  }
}

void append_metadata(fmt::memory_buffer& out, const Metadata& metadata, bool escape)
{
  if (metadata.empty()) return;
  fmt::format_to(std::back_inserter(out), " | ");
  bool first = true;
  for (const auto& [key, value] : metadata)
  {
    if (!first) fmt::format_to(std::back_inserter(out), ", ");
    if (escape)
    {
      append_escaped(out, key);
      out.push_back('=');
      append_escaped(out, value);
    }
    else
    {
      fmt::format_to(std::back_inserter(out), "{}={}", key, value);
    }
    first = false;
  }
}

void append_frames(fmt::memory_buffer& out, const std::vector<std::string>& frames)
{
  for (const auto& frame : frames)
  {
    fmt::format_to(std::back_inserter(out), "\n{}{}", kFrameIndent, frame);
  }
}

}  // namespace

std::string FormatCaller(const CallerId& caller)
{
  if (caller.line.has_value())
  {
    return fmt::format("{}:{}", caller.name, *caller.line);
  }
  return caller.name;
}

EntryFormatter::EntryFormatter() : EntryFormatter(Redactor()) {}

EntryFormatter::EntryFormatter(Redactor redactor, StackTraceProvider stack_provider,
                               size_t max_frames, size_t skip_frames)
    : redactor_(std::move(redactor)),
      stack_provider_(std::move(stack_provider)),
      max_frames_(max_frames),
      skip_frames_(skip_frames)
{
}

FormattedEntry EntryFormatter::Format(const LogEvent& event) const
{
  const std::string caller = FormatCaller(event.caller);
  const std::string_view glyph = to_glyph(event.level);

  std::vector<std::string> frames;
  if (event.include_stack_trace && includes_stack_trace(event.level) && stack_provider_)
  {
    frames = stack_provider_(skip_frames_, max_frames_);
  }

  fmt::memory_buffer console;
  fmt::format_to(std::back_inserter(console), "{} [{}] {}", glyph, caller,
                 event.message.Resolve(Channel::Console, redactor_));
  append_metadata(console, event.metadata, false);
  append_frames(console, frames);

  char ts[32];
  size_t ts_len = format_timestamp(event.wall_clock_ns, ts, sizeof(ts));

  fmt::memory_buffer persisted;
  fmt::format_to(std::back_inserter(persisted), "[{}] {} {} [", std::string_view(ts, ts_len),
                 static_cast<unsigned>(to_rank(event.level)), glyph);
  append_escaped(persisted, caller);
  fmt::format_to(std::back_inserter(persisted), "] ");
  append_escaped(persisted, event.message.Resolve(Channel::Persisted, redactor_));
  append_metadata(persisted, event.metadata, true);
  append_frames(persisted, frames);
  persisted.push_back('\n');

  return FormattedEntry{fmt::to_string(console), fmt::to_string(persisted)};
}

}  // namespace ch_logger
