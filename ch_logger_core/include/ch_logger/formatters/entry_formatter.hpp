#pragma once
#include <cstddef>
#include <string>

#include "../log_event.hpp"
#include "../platform.hpp"
#include "../redactor.hpp"
#include "../stack_trace.hpp"

namespace ch_logger
{

struct FormattedEntry
{
  std::string console;    // "glyph [caller] text | k=v"
  std::string persisted;  // "[timestamp] rank glyph [caller] text | k=v\n"
};

// "name" or "name:line"
std::string FormatCaller(const CallerId& caller);

class EntryFormatter
{
 public:
  EntryFormatter();
  explicit EntryFormatter(Redactor redactor,
                          StackTraceProvider stack_provider = CaptureStackTrace,
                          size_t max_frames = CH_LOG_STACK_MAX_FRAMES,
                          size_t skip_frames = CH_LOG_STACK_SKIP_FRAMES);

  // 同一事件生成两路文本：控制台为真实值，持久化为脱敏后的文本
  FormattedEntry Format(const LogEvent& event) const;

  const Redactor& GetRedactor() const { return redactor_; }

 private:
  Redactor redactor_;
  StackTraceProvider stack_provider_;
  size_t max_frames_;
  size_t skip_frames_;
};

}  // namespace ch_logger
