#include "ch_logger/sinks/callback_sink.hpp"

#include <utility>

namespace ch_logger
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackSink::Submit(SinkSeverity severity, std::string_view text)
{
  if (callback_)
  {
    callback_(severity, text);
  }
}

void CallbackSink::Flush() {}

}  // namespace ch_logger
