#include "ch_logger/stack_trace.hpp"

#include <execinfo.h>

#include <cstdlib>

namespace ch_logger
{

namespace
{

constexpr int kMaxCapture = 64;

}  // namespace

std::vector<std::string> CaptureStackTrace(size_t skip, size_t max_frames)
{
  std::vector<std::string> frames;
  if (max_frames == 0)
  {
    return frames;
  }

  void* addrs[kMaxCapture];
  int depth = ::backtrace(addrs, kMaxCapture);
  // frame 0 is CaptureStackTrace itself
  size_t first = skip + 1;
  if (depth <= 0 || static_cast<size_t>(depth) <= first)
  {
    return frames;
  }

  char** symbols = ::backtrace_symbols(addrs, depth);
  if (symbols == nullptr)
  {
    return frames;
  }
  for (size_t i = first; i < static_cast<size_t>(depth) && frames.size() < max_frames; ++i)
  {
    frames.emplace_back(symbols[i]);
  }
  std::free(symbols);
  return frames;
}

}  // namespace ch_logger
