#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <functional>
#include <string>

#include "ch_logger/log_level.hpp"
#include "ch_logger/sinks/console_sink.hpp"

using ch_logger::ConsoleSink;
using ch_logger::SinkSeverity;

static std::string capture_fd_output(int fd, const std::function<void()>& action)
{
  int pipefd[2];
  EXPECT_EQ(pipe(pipefd), 0);

  fflush(nullptr);
  int saved_fd = dup(fd);
  EXPECT_NE(saved_fd, -1);

  dup2(pipefd[1], fd);
  close(pipefd[1]);

  action();
  fflush(nullptr);

  dup2(saved_fd, fd);
  close(saved_fd);

  char buf[4096] = {};
  ssize_t n = read(pipefd[0], buf, sizeof(buf) - 1);
  close(pipefd[0]);

  if (n > 0)
  {
    return std::string(buf, static_cast<size_t>(n));
  }
  return "";
}

TEST(ConsoleSink, Construction)
{
  EXPECT_NO_THROW(ConsoleSink sink);
  EXPECT_NO_THROW(ConsoleSink sink(true));
  EXPECT_NO_THROW(ConsoleSink sink(false));
  EXPECT_NO_THROW(ConsoleSink sink(std::nullopt));
}

TEST(ConsoleSink, FlushDoesNotCrash)
{
  ConsoleSink sink(false);
  EXPECT_NO_THROW(sink.Flush());
}

TEST(ConsoleSink, InfoToStdout)
{
  ConsoleSink sink(false);
  std::string out =
      capture_fd_output(STDOUT_FILENO, [&]() { sink.Submit(SinkSeverity::Info, "test message"); });
  EXPECT_EQ(out, "test message\n");
}

TEST(ConsoleSink, DebugAndDefaultToStdout)
{
  ConsoleSink sink(false);
  std::string out = capture_fd_output(STDOUT_FILENO,
                                      [&]()
                                      {
                                        sink.Submit(SinkSeverity::Debug, "dbg");
                                        sink.Submit(SinkSeverity::Default, "warn");
                                      });
  EXPECT_EQ(out, "dbg\nwarn\n");
}

TEST(ConsoleSink, ErrorAndFaultToStderr)
{
  ConsoleSink sink(false);
  std::string err = capture_fd_output(STDERR_FILENO,
                                      [&]()
                                      {
                                        sink.Submit(SinkSeverity::Error, "bad");
                                        sink.Submit(SinkSeverity::Fault, "worse");
                                      });
  EXPECT_EQ(err, "bad\nworse\n");
}

TEST(ConsoleSink, ErrorNotOnStdout)
{
  ConsoleSink sink(false);
  std::string out =
      capture_fd_output(STDOUT_FILENO, [&]() { sink.Submit(SinkSeverity::Error, "bad"); });
  EXPECT_TRUE(out.empty());
}

TEST(ConsoleSink, InfoNotOnStderr)
{
  ConsoleSink sink(false);
  std::string err =
      capture_fd_output(STDERR_FILENO, [&]() { sink.Submit(SinkSeverity::Info, "fine"); });
  EXPECT_TRUE(err.empty());
}

TEST(ConsoleSink, ForcedColorWrapsText)
{
  ConsoleSink sink(true);
  std::string out =
      capture_fd_output(STDOUT_FILENO, [&]() { sink.Submit(SinkSeverity::Info, "colored"); });
  EXPECT_EQ(out.rfind("\033[", 0), 0u);
  EXPECT_NE(out.find("colored\033[0m\n"), std::string::npos);
}

TEST(ConsoleSink, NoColorHasNoEscapes)
{
  ConsoleSink sink(false);
  std::string out =
      capture_fd_output(STDOUT_FILENO, [&]() { sink.Submit(SinkSeverity::Info, "plain"); });
  EXPECT_EQ(out.find("\033["), std::string::npos);
}
