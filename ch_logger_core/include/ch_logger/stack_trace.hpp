#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ch_logger
{

// (skip, max_frames) -> frame descriptions, innermost first
using StackTraceProvider = std::function<std::vector<std::string>(size_t, size_t)>;

// Symbolized frames of the calling thread. The first `skip` frames after this
// function's own frame are dropped, at most `max_frames` are returned.
std::vector<std::string> CaptureStackTrace(size_t skip, size_t max_frames);

}  // namespace ch_logger
