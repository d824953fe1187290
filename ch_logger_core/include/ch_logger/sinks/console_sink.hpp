#pragma once
#include <optional>

#include "sink_interface.hpp"

namespace ch_logger
{

class ConsoleSink : public IConsoleSink
{
 public:
  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt);

  void Submit(SinkSeverity severity, std::string_view text) override;
  void Flush() override;

 private:
  bool use_color_;
  bool stdout_is_tty_;
  bool stderr_is_tty_;
};

}  // namespace ch_logger
