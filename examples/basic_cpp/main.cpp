#include <ch_logger/logger.hpp>
#include <ch_logger/sinks/callback_sink.hpp>
#include <ch_logger/sinks/console_sink.hpp>
#include <cstdio>
#include <thread>

int main()
{
  // --- Configuration ---

  ch_logger::LoggerConfig config;
  config.directory = "/tmp/ch_logger_example";
  config.base_name = "app_logs";
  config.extension = ".txt";
  config.max_file_size = 64 * 1024;
  config.max_files = 3;
  config.buffer_threshold = 10;
  config.flush_interval_ms = 1000;
  config.minimum_level = ch_logger::LogLevel::Debug;

  // Extra rule on top of the defaults
  if (auto rule = ch_logger::MakeRule("order_id", R"(ORD-\d{6})", "[REDACTED_ORDER]"))
  {
    config.redactor.AddRule(std::move(*rule));
  }

  // 构造时即启动写线程与定时线程
  ch_logger::Logger logger(std::move(config), std::make_unique<ch_logger::ConsoleSink>());

  // --- Basic logging ---

  CH_LOG_DEBUG(logger, "debug value: {}", 42);
  CH_LOG_INFO(logger, "hello {}, version {}", "world", "1.0");
  CH_LOG_WARNING(logger, "disk usage at {}%", 85);
  CH_LOG_ERROR(logger, "connection failed: {}", "timeout");

  // --- Redaction ---

  // 控制台显示原文，文件中自动替换
  CH_LOG_INFO(logger, "user {} logged in from {}", "alice@example.com", "10.0.0.1");

  // 显式标记：控制台为真实值，文件中为占位符
  CH_LOG_INFO(logger, "charging card {} for order ORD-123456",
              ch_logger::Redacted::CreditCard("4532-1234-5678-9012"));

  ch_logger::Message msg;
  msg << "session key " << ch_logger::Redact("s3cr3t-key", "[HIDDEN]") << " issued";
  logger.Info(std::move(msg), ch_logger::CallerId{"Auth", std::nullopt});

  // --- Metadata and stack traces ---

  logger.Info("request finished", CH_LOG_CURRENT_CALLER(),
              {{"method", "GET"}, {"path", "/api/orders"}, {"status", "200"}});
  logger.Error("payment gateway unreachable", CH_LOG_CURRENT_CALLER(), {{"retry", "3"}}, true);

  // --- Conditional logging ---

  int error_code = 404;
  CH_LOG_WARNING_IF(error_code != 200, logger, "HTTP error: {}", error_code);
  CH_LOG_ERROR_IF(error_code >= 500, logger, "server error: {}", error_code);

  // --- Runtime level change ---

  logger.SetMinimumLevel(ch_logger::LogLevel::Warning);
  CH_LOG_INFO(logger, "this line is filtered");
  logger.SetMinimumLevel(ch_logger::LogLevel::Debug);

  // --- Multi-thread demo ---

  auto worker = [&logger](int id)
  {
    for (int i = 0; i < 5; ++i)
    {
      CH_LOG_INFO(logger, "task {} processing step {}", id, i);
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Reading back ---

  logger.ForceFlush();

  auto records = logger.RecentEntries(5);
  std::printf("\nLast %zu persisted entries:\n", records.size());
  for (const auto& record : records)
  {
    std::printf("  %-8s %-12s %s\n", std::string(ch_logger::to_string(record.level)).c_str(),
                record.caller.c_str(), record.message.c_str());
  }

  std::printf("Log files (%llu bytes total):\n",
              static_cast<unsigned long long>(logger.LogFileSizeBytes()));
  for (const auto& path : logger.AllLogFilePaths())
  {
    std::printf("  %s\n", path.c_str());
  }

  // --- Shutdown ---

  CH_LOG_INFO(logger, "shutting down");
  logger.Stop();

  std::printf("Example finished. Check %s for the redacted output.\n",
              logger.LogFilePath().c_str());
  return 0;
}
