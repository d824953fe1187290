#include "ch_logger/sinks/console_sink.hpp"

#include <unistd.h>

#include <cstdio>

namespace ch_logger
{

namespace
{

const char* color_for_severity(SinkSeverity severity)
{
  switch (severity)
  {
    case SinkSeverity::Debug: return "\033[36m";
    case SinkSeverity::Info: return "\033[32m";
    case SinkSeverity::Default: return "\033[33m";
    case SinkSeverity::Error: return "\033[31m";
    case SinkSeverity::Fault: return "\033[1;31m";
  }
  return "";
}

}  // namespace

ConsoleSink::ConsoleSink(std::optional<bool> force_color)
{
  stdout_is_tty_ = ::isatty(STDOUT_FILENO) != 0;
  stderr_is_tty_ = ::isatty(STDERR_FILENO) != 0;

  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    use_color_ = stdout_is_tty_ || stderr_is_tty_;
  }
}

void ConsoleSink::Submit(SinkSeverity severity, std::string_view text)
{
  FILE* target = (severity >= SinkSeverity::Error) ? stderr : stdout;
  if (use_color_)
  {
    std::fprintf(target, "%s%.*s\033[0m\n", color_for_severity(severity),
                 static_cast<int>(text.size()), text.data());
  }
  else
  {
    std::fprintf(target, "%.*s\n", static_cast<int>(text.size()), text.data());
  }
}

void ConsoleSink::Flush()
{
  std::fflush(stdout);
  std::fflush(stderr);
}

}  // namespace ch_logger
