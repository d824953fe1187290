#pragma once
#include <string_view>

#include "../log_level.hpp"

namespace ch_logger
{

// 外部控制台 Sink：接收 (严重级别, 已渲染文本)
class IConsoleSink
{
 public:
  virtual ~IConsoleSink() = default;

  // 在写线程上调用（手动模式下为调用 Drain/ForceFlush 的线程），不会并发调用；
  // 不得抛出异常，失败时直接丢弃。阻塞会拖慢文件写入，但不会阻塞记录日志的线程
  virtual void Submit(SinkSeverity severity, std::string_view text) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;
};

}  // namespace ch_logger
