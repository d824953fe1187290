#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ch_logger
{

// "yyyy-MM-dd HH:mm:ss.SSS"
constexpr size_t kTimestampLength = 23;

uint64_t monotonic_now_ns();
uint64_t wall_clock_now_ns();

// Local time, millisecond precision. Returns the number of characters written.
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);

// Strict inverse of format_timestamp; the result is truncated to milliseconds.
std::optional<uint64_t> parse_timestamp(std::string_view text);

}  // namespace ch_logger
