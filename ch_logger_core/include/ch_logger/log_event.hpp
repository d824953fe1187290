#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "log_level.hpp"
#include "message.hpp"
#include "source_location.hpp"

namespace ch_logger
{

// Insertion-ordered key/value pairs, rendered as "k=v, k=v" and never redacted.
using Metadata = std::vector<std::pair<std::string, std::string>>;

struct LogEvent
{
  uint64_t wall_clock_ns = 0;
  LogLevel level = LogLevel::Info;
  CallerId caller;
  Message message;
  Metadata metadata;
  bool include_stack_trace = false;
};

}  // namespace ch_logger
