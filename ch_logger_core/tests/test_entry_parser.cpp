#include <gtest/gtest.h>

#include <string>

#include "ch_logger/entry_parser.hpp"
#include "ch_logger/formatters/entry_formatter.hpp"
#include "ch_logger/timestamp.hpp"

using namespace ch_logger;

namespace
{

constexpr uint64_t kSampleNs = 1708099200ULL * 1'000'000'000ULL + 456'000'000ULL;

std::string sample_timestamp()
{
  char ts[32];
  size_t len = format_timestamp(kSampleNs, ts, sizeof(ts));
  return std::string(ts, len);
}

std::string persisted_line(LogLevel level, const std::string& caller, std::optional<uint32_t> line,
                           const std::string& text, bool trace = false)
{
  EntryFormatter formatter(
      Redactor(std::vector<RedactionRule>{}),
      [](size_t, size_t) { return std::vector<std::string>{"0x1 frame_one", "0x2 frame_two"}; },
      10, 0);
  LogEvent event;
  event.wall_clock_ns = kSampleNs;
  event.level = level;
  event.caller = CallerId{caller, line};
  event.message = text;
  event.include_stack_trace = trace;
  return formatter.Format(event).persisted;
}

}  // namespace

TEST(EntryParser, ParsesFormatterOutputForEveryLevel)
{
  const LogLevel levels[] = {LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                             LogLevel::Error, LogLevel::Critical};
  for (LogLevel level : levels)
  {
    std::string line = persisted_line(level, "Session", 42, "something happened");
    auto record = ParseLogLine(line.substr(0, line.size() - 1));
    ASSERT_TRUE(record.has_value()) << line;
    EXPECT_EQ(record->level, level);
    EXPECT_EQ(record->wall_clock_ns, kSampleNs);
    EXPECT_EQ(record->glyph, to_glyph(level));
    EXPECT_EQ(record->caller, "Session");
    EXPECT_EQ(record->line, 42u);
    EXPECT_EQ(record->message, "something happened");
  }
}

TEST(EntryParser, CallerWithoutLineNumber)
{
  auto record = ParseLogLine("[" + sample_timestamp() + "] 1 * [Bootstrap] ready");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->caller, "Bootstrap");
  EXPECT_FALSE(record->line.has_value());
  EXPECT_EQ(record->glyph, "*");
  EXPECT_EQ(record->message, "ready");
}

TEST(EntryParser, NonNumericSuffixStaysInCaller)
{
  auto record = ParseLogLine("[" + sample_timestamp() + "] 1 * [ns:Thing] ready");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->caller, "ns:Thing");
  EXPECT_FALSE(record->line.has_value());
}

TEST(EntryParser, LevelNameAccepted)
{
  auto record = ParseLogLine("[" + sample_timestamp() + "] WARNING ! [Disk:7] low space");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->level, LogLevel::Warning);
  EXPECT_EQ(record->line, 7u);
}

TEST(EntryParser, MessageKeepsMetadataAndBrackets)
{
  auto record =
      ParseLogLine("[" + sample_timestamp() + "] 1 * [Api:3] GET [v2] /users | status=200");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->message, "GET [v2] /users | status=200");
}

TEST(EntryParser, TrailingCarriageReturn)
{
  auto record = ParseLogLine("[" + sample_timestamp() + "] 1 * [Api] done\r");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->message, "done");
}

TEST(EntryParser, RejectsBadTimestamp)
{
  EXPECT_FALSE(ParseLogLine("[2024-02-16] 1 * [Api] done").has_value());
  EXPECT_FALSE(ParseLogLine("[2024-13-16 10:00:00.000] 1 * [Api] done").has_value());
}

TEST(EntryParser, RejectsUnknownLevel)
{
  EXPECT_FALSE(ParseLogLine("[" + sample_timestamp() + "] 9 * [Api] done").has_value());
  EXPECT_FALSE(ParseLogLine("[" + sample_timestamp() + "] TRACE * [Api] done").has_value());
}

TEST(EntryParser, RejectsUnstructuredText)
{
  EXPECT_FALSE(ParseLogLine("").has_value());
  EXPECT_FALSE(ParseLogLine("just some text").has_value());
  EXPECT_FALSE(ParseLogLine("    0x1 frame_one").has_value());
  EXPECT_FALSE(ParseLogLine("--- Previous Log File ---").has_value());
}

TEST(EntryParser, TextSkipsTraceLinesAndBlanks)
{
  std::string text = persisted_line(LogLevel::Info, "A", 1, "first") + "\n" +
                     persisted_line(LogLevel::Error, "B", 2, "second", true) +
                     "garbage line\n" + persisted_line(LogLevel::Debug, "C", std::nullopt, "third");

  auto records = ParseLogText(text);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].message, "first");
  EXPECT_EQ(records[1].message, "second");
  EXPECT_EQ(records[1].level, LogLevel::Error);
  EXPECT_EQ(records[2].message, "third");
  EXPECT_EQ(records[2].caller, "C");
}

TEST(EntryParser, TextLimitKeepsMostRecent)
{
  std::string text;
  for (int i = 0; i < 10; ++i)
  {
    text += persisted_line(LogLevel::Info, "Loop", static_cast<uint32_t>(i), "n" + std::to_string(i));
  }

  auto records = ParseLogText(text, 3);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].message, "n7");
  EXPECT_EQ(records[1].message, "n8");
  EXPECT_EQ(records[2].message, "n9");

  EXPECT_EQ(ParseLogText(text, 0).size(), 0u);
  EXPECT_EQ(ParseLogText(text, 100).size(), 10u);
}

TEST(EntryParser, TextWithoutTrailingNewline)
{
  std::string line = persisted_line(LogLevel::Info, "A", 1, "only");
  line.pop_back();
  auto records = ParseLogText(line);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].message, "only");
}

TEST(EntryParser, MegabyteMessage)
{
  const std::string body(1024 * 1024, 'q');
  auto record = ParseLogLine(persisted_line(LogLevel::Warning, "Bulk", 9, body));
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->level, LogLevel::Warning);
  EXPECT_EQ(record->caller, "Bulk");
  EXPECT_EQ(record->message.size(), body.size());
}

TEST(EntryParser, MessageMayContainHeaderDelimiters)
{
  std::string line = "[" + sample_timestamp() + "] 1 \xE2\x84\xB9\xEF\xB8\x8F [Api:3] got [x] ] and [y]";
  auto record = ParseLogLine(line);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->caller, "Api");
  ASSERT_TRUE(record->line.has_value());
  EXPECT_EQ(*record->line, 3u);
  EXPECT_EQ(record->message, "got [x] ] and [y]");
}

TEST(EntryParser, RejectsTruncatedHeaders)
{
  const std::string ts = "[" + sample_timestamp() + "]";
  EXPECT_FALSE(ParseLogLine(ts).has_value());
  EXPECT_FALSE(ParseLogLine(ts + " 1").has_value());
  EXPECT_FALSE(ParseLogLine(ts + " 1 g [Api").has_value());
  EXPECT_FALSE(ParseLogLine(ts + " 1 g [Api]").has_value());
  EXPECT_FALSE(ParseLogLine(ts + " 1-2 g [Api] m").has_value());
  EXPECT_TRUE(ParseLogLine(ts + " 1 g [Api] ").has_value());
}

TEST(EntryParser, EscapedNewlineKeepsOneRecord)
{
  std::string forged = "user input: hi\n[" + sample_timestamp() + "] 4 X [Auth] admin granted";
  std::string text = persisted_line(LogLevel::Info, "Login", 5, forged);

  auto records = ParseLogText(text);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].caller, "Login");
  EXPECT_EQ(records[0].message,
            "user input: hi\\n[" + sample_timestamp() + "] 4 X [Auth] admin granted");
}
