#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace ch_logger
{

class CallbackSink : public IConsoleSink
{
 public:
  using Callback = std::function<void(SinkSeverity, std::string_view)>;

  explicit CallbackSink(Callback cb);

  void Submit(SinkSeverity severity, std::string_view text) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace ch_logger
