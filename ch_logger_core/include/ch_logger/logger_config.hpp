#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "log_level.hpp"
#include "platform.hpp"
#include "redactor.hpp"
#include "stack_trace.hpp"

namespace ch_logger
{

struct LoggerConfig
{
  // <directory>/<base_name><extension>, archives <base_name>_<n><extension>
  std::string directory = ".";
  std::string base_name = "app_logs";
  std::string extension = ".txt";

  size_t max_file_size = CH_LOG_MAX_FILE_SIZE;
  size_t max_files = CH_LOG_MAX_FILES;

  size_t buffer_threshold = CH_LOG_BUFFER_THRESHOLD;
  uint64_t flush_interval_ms = CH_LOG_FLUSH_INTERVAL_MS;

  LogLevel minimum_level = kDefaultMinimumLevel;

  // true: no writer thread; queued lines (console included) are processed only
  // by Drain, ForceFlush, ClearLogFiles, Start or Stop.
  bool manual_drain = false;

  Redactor redactor;
  StackTraceProvider stack_trace_provider = CaptureStackTrace;
  size_t stack_max_frames = CH_LOG_STACK_MAX_FRAMES;
  size_t stack_skip_frames = CH_LOG_STACK_SKIP_FRAMES;
};

}  // namespace ch_logger
