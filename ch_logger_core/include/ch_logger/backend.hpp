#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "platform.hpp"
#include "log_level.hpp"
#include "ring_buffer.hpp"
#include "rotating_file_set.hpp"
#include "sinks/sink_interface.hpp"

namespace ch_logger
{

struct WriterCommand
{
  enum class Kind : uint8_t
  {
    Append,
    Tick,
    Flush,
    Clear
  };

  Kind kind = Kind::Append;
  std::string line;
  // Append only: console text handed to the sink on the writer thread
  bool has_console = false;
  SinkSeverity severity = SinkSeverity::Info;
  std::string console_text;
  std::shared_ptr<std::promise<void>> done;
};

// 单写线程：独占缓冲区、日志文件与控制台 Sink。生产者只通过无锁队列投递命令。
class WriterBackend
{
 public:
  WriterBackend(std::unique_ptr<RotatingFileSet> files,
                size_t buffer_threshold = CH_LOG_BUFFER_THRESHOLD,
                uint64_t flush_interval_ms = CH_LOG_FLUSH_INTERVAL_MS,
                std::unique_ptr<IConsoleSink> console = nullptr);
  ~WriterBackend();

  WriterBackend(const WriterBackend&) = delete;
  WriterBackend& operator=(const WriterBackend&) = delete;

  // 生产者调用（业务线程），队列满时返回 false，由调用方计数
  bool TryEnqueue(std::string line);
  // Same, plus console text delivered to the sink before the line is buffered.
  bool TryEnqueue(std::string line, SinkSeverity severity, std::string console_text);

  // Blocks the calling thread until everything it enqueued before the call has
  // been written and synced.
  void ForceFlush();

  // Blocks until the buffer is dropped and every generation is truncated.
  void Clear();

  // 启动/停止写线程与定时线程；Stop 会写完残留日志
  void Start();
  void Stop();
  bool Running() const { return running_.load(std::memory_order_relaxed); }

  // 无线程模式：在调用方线程上处理队列（写线程运行时或正在启动时返回 0）
  size_t Drain(size_t max_commands = 64);

  const RotatingFileSet& Files() const { return *files_; }

 private:
  MPSCRingBuffer<WriterCommand, CH_LOG_RING_SIZE> ring_;
  std::unique_ptr<RotatingFileSet> files_;
  std::unique_ptr<IConsoleSink> console_;

  // Owned by whichever thread holds consumer_mutex_.
  std::vector<std::string> buffer_;
  uint64_t last_flush_ns_;

  const size_t buffer_threshold_;
  const uint64_t flush_interval_ns_;

  std::atomic<bool> running_{false};
  std::mutex consumer_mutex_;

  std::thread worker_;
  std::thread timer_;
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool timer_stop_ = false;

  void WorkerLoop();
  void TimerLoop();

  size_t DrainLocked(size_t max_commands);
  void Execute(WriterCommand& cmd);
  void MaybeFlush(bool force);
  void FlushBuffer();
  void FlushConsole();

  void RunBlocking(WriterCommand::Kind kind);
};

}  // namespace ch_logger
