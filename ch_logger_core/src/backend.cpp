#include "ch_logger/backend.hpp"

#include <chrono>
#include <utility>

#include "ch_logger/timestamp.hpp"

namespace ch_logger
{

WriterBackend::WriterBackend(std::unique_ptr<RotatingFileSet> files, size_t buffer_threshold,
                             uint64_t flush_interval_ms, std::unique_ptr<IConsoleSink> console)
    : files_(std::move(files)),
      console_(std::move(console)),
      last_flush_ns_(monotonic_now_ns()),
      buffer_threshold_(buffer_threshold > 0 ? buffer_threshold : 1),
      flush_interval_ns_(flush_interval_ms * 1'000'000ULL)
{
  buffer_.reserve(buffer_threshold_);
}

WriterBackend::~WriterBackend() { Stop(); }

bool WriterBackend::TryEnqueue(std::string line)
{
  WriterCommand cmd;
  cmd.kind = WriterCommand::Kind::Append;
  cmd.line = std::move(line);
  return ring_.TryPush(std::move(cmd));
}

bool WriterBackend::TryEnqueue(std::string line, SinkSeverity severity, std::string console_text)
{
  WriterCommand cmd;
  cmd.kind = WriterCommand::Kind::Append;
  cmd.line = std::move(line);
  cmd.has_console = true;
  cmd.severity = severity;
  cmd.console_text = std::move(console_text);
  return ring_.TryPush(std::move(cmd));
}

void WriterBackend::ForceFlush() { RunBlocking(WriterCommand::Kind::Flush); }

void WriterBackend::Clear() { RunBlocking(WriterCommand::Kind::Clear); }

void WriterBackend::Start()
{
  if (running_.exchange(true, std::memory_order_relaxed))
  {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_stop_ = false;
  }
  worker_ = std::thread(&WriterBackend::WorkerLoop, this);
  timer_ = std::thread(&WriterBackend::TimerLoop, this);
}

void WriterBackend::Stop()
{
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_stop_ = true;
  }
  timer_cv_.notify_all();
  if (timer_.joinable())
  {
    timer_.join();
  }

  running_.store(false, std::memory_order_relaxed);
  if (worker_.joinable())
  {
    worker_.join();
  }

  std::lock_guard<std::mutex> lock(consumer_mutex_);
  while (DrainLocked(64) > 0) {}
  MaybeFlush(true);
  files_->Sync();
  FlushConsole();
}

size_t WriterBackend::Drain(size_t max_commands)
{
  // 写线程在整个循环期间持有 consumer_mutex_，拿不到锁说明它已接管
  std::unique_lock<std::mutex> lock(consumer_mutex_, std::try_to_lock);
  if (!lock.owns_lock() || Running())
  {
    return 0;
  }
  return DrainLocked(max_commands);
}

size_t WriterBackend::DrainLocked(size_t max_commands)
{
  return ring_.ConsumeBatch([this](WriterCommand& cmd) { Execute(cmd); }, max_commands);
}

void WriterBackend::Execute(WriterCommand& cmd)
{
  switch (cmd.kind)
  {
    case WriterCommand::Kind::Append:
      if (cmd.has_console && console_)
      {
        console_->Submit(cmd.severity, cmd.console_text);
      }
      buffer_.push_back(std::move(cmd.line));
      MaybeFlush(false);
      break;

    case WriterCommand::Kind::Tick:
      MaybeFlush(false);
      break;

    case WriterCommand::Kind::Flush:
      MaybeFlush(true);
      files_->Sync();
      FlushConsole();
      break;

    case WriterCommand::Kind::Clear:
      buffer_.clear();
      files_->TruncateAll();
      last_flush_ns_ = monotonic_now_ns();
      break;
  }

  if (cmd.done)
  {
    cmd.done->set_value();
    cmd.done.reset();
  }
}

void WriterBackend::MaybeFlush(bool force)
{
  if (buffer_.empty())
  {
    return;
  }
  bool due = force || buffer_.size() >= buffer_threshold_ ||
             monotonic_now_ns() - last_flush_ns_ >= flush_interval_ns_;
  if (due)
  {
    FlushBuffer();
  }
}

void WriterBackend::FlushBuffer()
{
  std::vector<std::string> pending;
  pending.swap(buffer_);
  buffer_.reserve(buffer_threshold_);
  last_flush_ns_ = monotonic_now_ns();

  size_t total = 0;
  for (const auto& line : pending)
  {
    total += line.size();
  }
  std::string data;
  data.reserve(total);
  for (const auto& line : pending)
  {
    data += line;
  }

  if (files_->Append(data))
  {
    files_->RotateIfNeeded();
  }
}

void WriterBackend::FlushConsole()
{
  if (console_)
  {
    console_->Flush();
  }
}

void WriterBackend::RunBlocking(WriterCommand::Kind kind)
{
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> finished = done->get_future();

  WriterCommand cmd;
  cmd.kind = kind;
  cmd.done = done;
  while (!ring_.TryPush(std::move(cmd)))
  {
    // 队列已满：有写线程时等待其腾出空间，否则自己处理
    if (Running() || Drain(64) == 0)
    {
      std::this_thread::yield();
    }
  }

  while (finished.wait_for(std::chrono::milliseconds(1)) != std::future_status::ready)
  {
    // 手动模式下自己处理；与 Start() 竞争时让给写线程
    std::unique_lock<std::mutex> lock(consumer_mutex_, std::try_to_lock);
    if (lock.owns_lock() && !Running())
    {
      while (finished.wait_for(std::chrono::seconds(0)) != std::future_status::ready &&
             DrainLocked(64) > 0)
      {
      }
    }
  }
}

void WriterBackend::WorkerLoop()
{
  std::lock_guard<std::mutex> lock(consumer_mutex_);
  uint32_t idle_count = 0;
  while (running_.load(std::memory_order_relaxed))
  {
    size_t drained = DrainLocked(64);
    if (drained > 0)
    {
      idle_count = 0;
    }
    else
    {
      ++idle_count;
      if (idle_count < 100)
      {
        // busy spin
      }
      else if (idle_count < 1000)
      {
        std::this_thread::yield();
      }
      else
      {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }
  }
  while (DrainLocked(64) > 0) {}
}

void WriterBackend::TimerLoop()
{
  const auto interval =
      std::chrono::nanoseconds(flush_interval_ns_ > 1'000'000ULL ? flush_interval_ns_ : 1'000'000ULL);
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!timer_stop_)
  {
    if (timer_cv_.wait_for(lock, interval, [this] { return timer_stop_; }))
    {
      break;
    }
    WriterCommand tick;
    tick.kind = WriterCommand::Kind::Tick;
    if (!ring_.TryPush(std::move(tick)))
    {
      continue;  // 队列满时跳过本次 tick，下一次再检查
    }
  }
}

}  // namespace ch_logger
