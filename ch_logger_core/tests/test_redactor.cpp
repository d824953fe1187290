#include <gtest/gtest.h>

#include <string>

#include "ch_logger/redactor.hpp"

using ch_logger::MakeRule;
using ch_logger::Redactor;

namespace
{

bool contains(const std::string& haystack, const std::string& needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(Redactor, Email)
{
  Redactor redactor;
  std::string out = redactor.Scrub("Email: user@example.com");
  EXPECT_TRUE(contains(out, "[REDACTED_EMAIL]")) << out;
  EXPECT_FALSE(contains(out, "user@example.com")) << out;
  EXPECT_EQ(out, "Email: [REDACTED_EMAIL]");
}

TEST(Redactor, CreditCard)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("card 4532-1234-5678-9012 charged"), "card [REDACTED_CARD] charged");
  EXPECT_EQ(redactor.Scrub("4532123456789012"), "[REDACTED_CARD]");
  EXPECT_EQ(redactor.Scrub("4532 1234 5678 9012"), "[REDACTED_CARD]");
}

TEST(Redactor, Phone)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("call 555-123-4567"), "call [REDACTED_PHONE]");
  EXPECT_EQ(redactor.Scrub("call 555.123.4567"), "call [REDACTED_PHONE]");
}

TEST(Redactor, Ssn)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("ssn 123-45-6789"), "ssn [REDACTED_SSN]");
}

TEST(Redactor, Password)
{
  Redactor redactor;
  std::string out = redactor.Scrub("password: secret123");
  EXPECT_TRUE(contains(out, "[REDACTED_PASSWORD]")) << out;
  EXPECT_FALSE(contains(out, "secret123")) << out;

  out = redactor.Scrub("login PASSWORD=hunter2 ok");
  EXPECT_EQ(out, "login PASSWORD: [REDACTED_PASSWORD] ok");
}

TEST(Redactor, ApiKeyAndToken)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("api_key=abcdef123"), "api_key: [REDACTED_API_KEY]");
  EXPECT_EQ(redactor.Scrub("API Key: XYZ-789"), "API Key: [REDACTED_API_KEY]");
  EXPECT_EQ(redactor.Scrub("Token abc.def.ghi"), "Token: [REDACTED_API_KEY]");
}

TEST(Redactor, Ipv4)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("connect to 10.0.0.1 now"), "connect to [REDACTED_IP] now");
  EXPECT_EQ(redactor.Scrub("192.168.100.254"), "[REDACTED_IP]");
}

TEST(Redactor, PlainTextUntouched)
{
  Redactor redactor;
  EXPECT_EQ(redactor.Scrub("User logged in after 3 attempts"),
            "User logged in after 3 attempts");
  EXPECT_EQ(redactor.Scrub(""), "");
}

TEST(Redactor, MultipleRulesInOneLine)
{
  Redactor redactor;
  std::string out = redactor.Scrub("user@example.com from 10.0.0.1 phone 555-123-4567");
  EXPECT_EQ(out, "[REDACTED_EMAIL] from [REDACTED_IP] phone [REDACTED_PHONE]");
}

TEST(Redactor, CardRunsBeforePhone)
{
  // 16 位卡号不能被电话规则拆开
  Redactor redactor;
  std::string out = redactor.Scrub("4532-1234-5678-9012");
  EXPECT_EQ(out, "[REDACTED_CARD]");
  EXPECT_FALSE(contains(out, "[REDACTED_PHONE]"));
}

TEST(Redactor, DefaultRuleOrder)
{
  const auto& rules = Redactor::DefaultRules();
  ASSERT_EQ(rules.size(), 7u);
  EXPECT_EQ(rules[0].name, "card");
  EXPECT_EQ(rules[1].name, "email");
  EXPECT_EQ(rules[2].name, "phone");
  EXPECT_EQ(rules[3].name, "ssn");
  EXPECT_EQ(rules[4].name, "password");
  EXPECT_EQ(rules[5].name, "api_key");
  EXPECT_EQ(rules[6].name, "ipv4");
}

TEST(Redactor, CustomRules)
{
  auto rule = MakeRule("order", R"(ORD-\d+)", "[ORDER]");
  ASSERT_TRUE(rule.has_value());

  Redactor redactor(std::vector<ch_logger::RedactionRule>{*rule});
  EXPECT_EQ(redactor.Scrub("shipped ORD-1234 to user@example.com"),
            "shipped [ORDER] to user@example.com");
}

TEST(Redactor, AddRuleAppendsAfterDefaults)
{
  Redactor redactor;
  auto rule = MakeRule("session", R"(sid=\w+)", "sid=[SESSION]", false);
  ASSERT_TRUE(rule.has_value());
  redactor.AddRule(std::move(*rule));

  EXPECT_EQ(redactor.Rules().size(), Redactor::DefaultRules().size() + 1);
  EXPECT_EQ(redactor.Scrub("sid=abc123 ip 10.1.2.3"), "sid=[SESSION] ip [REDACTED_IP]");
}

TEST(Redactor, CaseInsensitiveRule)
{
  auto rule = MakeRule("secret", "secret", "[S]", true);
  ASSERT_TRUE(rule.has_value());
  Redactor redactor(std::vector<ch_logger::RedactionRule>{*rule});
  EXPECT_EQ(redactor.Scrub("Secret SECRET secret"), "[S] [S] [S]");
}

TEST(Redactor, InvalidPatternRejected)
{
  EXPECT_FALSE(MakeRule("broken", "(unclosed", "x").has_value());
}

TEST(Redactor, MegabyteWithoutWhitespace)
{
  Redactor redactor;
  const std::string blob(1024 * 1024, 'a');
  std::string out = redactor.Scrub(blob);
  EXPECT_EQ(out, blob);
}

TEST(Redactor, LargeTextStillRedacted)
{
  Redactor redactor;
  std::string text;
  for (int i = 0; i < 20000; ++i)
  {
    text += "row " + std::to_string(i) + " ok\n";
  }
  text += "reach me at user@example.com or 10.0.0.1\n";

  std::string out = redactor.Scrub(text);
  EXPECT_FALSE(contains(out, "user@example.com"));
  EXPECT_FALSE(contains(out, "10.0.0.1"));
  EXPECT_TRUE(contains(out, "reach me at [REDACTED_EMAIL] or [REDACTED_IP]\n"));
  EXPECT_TRUE(contains(out, "row 19999 ok\n"));
}

TEST(Redactor, ChunkCutsPreferWhitespaceAndUtf8Boundaries)
{
  const size_t chunk = Redactor::kScrubChunkBytes;

  std::string spaced(chunk - 10, 'x');
  spaced += " tail";
  spaced += std::string(chunk, 'y');
  EXPECT_EQ(Redactor::NextChunkEnd(spaced, 0), chunk - 9);

  // "€" 为三字节，切分点不得落在其中间
  std::string wide;
  while (wide.size() < chunk * 2)
  {
    wide += "\xE2\x82\xAC";
  }
  size_t end = Redactor::NextChunkEnd(wide, 0);
  EXPECT_LE(end, chunk);
  EXPECT_EQ(end % 3, 0u);

  EXPECT_EQ(Redactor::NextChunkEnd("short", 0), 5u);
}
