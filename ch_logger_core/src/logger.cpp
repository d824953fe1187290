#include "ch_logger/logger.hpp"

#include <utility>

#include "ch_logger/timestamp.hpp"

namespace ch_logger
{

namespace
{

constexpr const char* kFileSeparator = "\n--- Previous Log File ---\n";

}  // namespace

Logger::Logger(LoggerConfig config, std::unique_ptr<IConsoleSink> console_sink)
    : formatter_(std::move(config.redactor), std::move(config.stack_trace_provider),
                 config.stack_max_frames, config.stack_skip_frames),
      backend_(std::make_unique<WriterBackend>(
          std::make_unique<RotatingFileSet>(config.directory, config.base_name,
                                            config.extension, config.max_file_size,
                                            config.max_files),
          config.buffer_threshold, config.flush_interval_ms, std::move(console_sink))),
      level_(config.minimum_level)
{
  if (!config.manual_drain)
  {
    backend_->Start();
  }
}

Logger::~Logger() { Stop(); }

void Logger::Start() { backend_->Start(); }

void Logger::Stop() { backend_->Stop(); }

void Logger::SetMinimumLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::MinimumLevel() const { return level_.load(std::memory_order_relaxed); }

void Logger::Log(LogLevel level, Message message, CallerId caller, Metadata metadata,
                 bool include_stack_trace)
{
  if (!ShouldLog(level))
  {
    return;
  }

  LogEvent event;
  event.wall_clock_ns = wall_clock_now_ns();
  event.level = level;
  event.caller = std::move(caller);
  event.message = std::move(message);
  event.metadata = std::move(metadata);
  event.include_stack_trace = include_stack_trace;

  FormattedEntry entry = formatter_.Format(event);

  if (!backend_->TryEnqueue(std::move(entry.persisted), to_sink_severity(level),
                            std::move(entry.console)))
  {
    drop_count_.fetch_add(1, std::memory_order_relaxed);
  }
}

void Logger::Debug(Message message, CallerId caller, Metadata metadata)
{
  Log(LogLevel::Debug, std::move(message), std::move(caller), std::move(metadata));
}

void Logger::Info(Message message, CallerId caller, Metadata metadata)
{
  Log(LogLevel::Info, std::move(message), std::move(caller), std::move(metadata));
}

void Logger::Warning(Message message, CallerId caller, Metadata metadata)
{
  Log(LogLevel::Warning, std::move(message), std::move(caller), std::move(metadata));
}

void Logger::Error(Message message, CallerId caller, Metadata metadata,
                   bool include_stack_trace)
{
  Log(LogLevel::Error, std::move(message), std::move(caller), std::move(metadata),
      include_stack_trace);
}

void Logger::Critical(Message message, CallerId caller, Metadata metadata,
                      bool include_stack_trace)
{
  Log(LogLevel::Critical, std::move(message), std::move(caller), std::move(metadata),
      include_stack_trace);
}

std::string Logger::LogFilePath() const { return backend_->Files().CurrentPath(); }

std::vector<std::string> Logger::AllLogFilePaths() const
{
  return backend_->Files().ExistingPaths();
}

std::optional<std::string> Logger::LogFileContents() const
{
  std::string contents;
  for (const auto& path : AllLogFilePaths())
  {
    auto text = RotatingFileSet::ReadFile(path);
    if (!text || text->empty())
    {
      continue;
    }
    if (!contents.empty())
    {
      contents += kFileSeparator;
    }
    contents += *text;
  }
  if (contents.empty())
  {
    return std::nullopt;
  }
  return contents;
}

uint64_t Logger::LogFileSizeBytes() const { return backend_->Files().TotalSizeBytes(); }

std::vector<LogRecord> Logger::RecentEntries(std::optional<size_t> limit) const
{
  // oldest archive first so the records come out in write order
  std::vector<std::string> paths = AllLogFilePaths();
  std::string text;
  for (auto it = paths.rbegin(); it != paths.rend(); ++it)
  {
    if (auto content = RotatingFileSet::ReadFile(*it))
    {
      text += *content;
      if (!text.empty() && text.back() != '\n')
      {
        text += '\n';
      }
    }
  }
  return ParseLogText(text, limit);
}

void Logger::ClearLogFiles() { backend_->Clear(); }

void Logger::ForceFlush() { backend_->ForceFlush(); }

size_t Logger::Drain(size_t max_commands) { return backend_->Drain(max_commands); }

uint64_t Logger::DropCount() const { return drop_count_.load(std::memory_order_relaxed); }

void Logger::ResetDropCount() { drop_count_.store(0, std::memory_order_relaxed); }

uint64_t Logger::IoErrorCount() const { return backend_->Files().IoErrorCount(); }

}  // namespace ch_logger
