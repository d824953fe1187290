#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend.hpp"
#include "entry_parser.hpp"
#include "formatters/entry_formatter.hpp"
#include "log_event.hpp"
#include "log_level.hpp"
#include "logger_config.hpp"
#include "message.hpp"
#include "sinks/console_sink.hpp"
#include "sinks/sink_interface.hpp"
#include "source_location.hpp"

namespace ch_logger
{

// 日志管线入口：级别过滤 -> 双通道格式化 -> 写线程（控制台 Sink + 文件）
// Construct once at startup and pass it to the call sites. The writer thread
// starts in the constructor unless LoggerConfig::manual_drain is set; the
// destructor flushes whatever is still buffered.
class Logger
{
 public:
  explicit Logger(LoggerConfig config = {},
                  std::unique_ptr<IConsoleSink> console_sink = std::make_unique<ConsoleSink>());
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void Start();
  void Stop();

  void SetMinimumLevel(LogLevel level);
  LogLevel MinimumLevel() const;
  bool ShouldLog(LogLevel level) const { return level >= MinimumLevel(); }

  // Never waits on file I/O or on the console sink.
  void Log(LogLevel level, Message message, CallerId caller, Metadata metadata = {},
           bool include_stack_trace = false);

  void Debug(Message message, CallerId caller, Metadata metadata = {});
  void Info(Message message, CallerId caller, Metadata metadata = {});
  void Warning(Message message, CallerId caller, Metadata metadata = {});
  void Error(Message message, CallerId caller, Metadata metadata = {},
             bool include_stack_trace = false);
  void Critical(Message message, CallerId caller, Metadata metadata = {},
                bool include_stack_trace = true);

  // ===== 日志文件访问 =====
  std::string LogFilePath() const;
  std::vector<std::string> AllLogFilePaths() const;

  // All generations, newest first. Only what is already on disk is returned;
  // call ForceFlush() first to include buffered lines.
  std::optional<std::string> LogFileContents() const;

  uint64_t LogFileSizeBytes() const;

  // Parsed entries in chronological order, the last `limit` when given.
  std::vector<LogRecord> RecentEntries(std::optional<size_t> limit = std::nullopt) const;

  void ClearLogFiles();
  void ForceFlush();

  // 无线程模式下手动处理写队列
  size_t Drain(size_t max_commands = 64);

  uint64_t DropCount() const;
  void ResetDropCount();
  uint64_t IoErrorCount() const;

 private:
  EntryFormatter formatter_;
  std::unique_ptr<WriterBackend> backend_;
  std::atomic<LogLevel> level_;
  std::atomic<uint64_t> drop_count_{0};
};

}  // namespace ch_logger

// ===== Logging macros =====

#define CH_LOG_CALL(logger, lvl, with_trace, ...)                                   \
  do                                                                               \
  {                                                                                \
    auto& _ch_logger = (logger);                                                   \
    if (_ch_logger.ShouldLog(::ch_logger::LogLevel::lvl))                          \
    {                                                                              \
      _ch_logger.Log(::ch_logger::LogLevel::lvl,                                   \
                     ::ch_logger::Message::Format(__VA_ARGS__),                    \
                     CH_LOG_CURRENT_CALLER(), {}, with_trace);                     \
    }                                                                              \
  } while (0)

#define CH_LOG_DEBUG(logger, ...) CH_LOG_CALL(logger, Debug, false, __VA_ARGS__)
#define CH_LOG_INFO(logger, ...) CH_LOG_CALL(logger, Info, false, __VA_ARGS__)
#define CH_LOG_WARNING(logger, ...) CH_LOG_CALL(logger, Warning, false, __VA_ARGS__)
#define CH_LOG_ERROR(logger, ...) CH_LOG_CALL(logger, Error, false, __VA_ARGS__)
#define CH_LOG_CRITICAL(logger, ...) CH_LOG_CALL(logger, Critical, true, __VA_ARGS__)

// Conditional logging
#define CH_LOG_WARNING_IF(cond, logger, ...) \
  do { if (cond) CH_LOG_WARNING(logger, __VA_ARGS__); } while (0)
#define CH_LOG_ERROR_IF(cond, logger, ...) \
  do { if (cond) CH_LOG_ERROR(logger, __VA_ARGS__); } while (0)
