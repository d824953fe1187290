#include "ch_logger/redactor.hpp"

#include <cstdio>
#include <utility>

namespace ch_logger
{

std::optional<RedactionRule> MakeRule(std::string name, std::string_view pattern,
                                      std::string replacement, bool ignore_case)
{
  auto flags = std::regex::ECMAScript | std::regex::optimize;
  if (ignore_case)
  {
    flags |= std::regex::icase;
  }
  try
  {
    std::regex compiled(pattern.begin(), pattern.end(), flags);
    return RedactionRule{std::move(name), std::move(compiled), std::move(replacement)};
  }
  catch (const std::regex_error& e)
  {
    std::fprintf(stderr, "Redactor: rule '%s' rejected: %s\n", name.c_str(), e.what());
    return std::nullopt;
  }
}

namespace
{

std::vector<RedactionRule> BuildDefaultRules()
{
  struct RuleDef
  {
    const char* name;
    const char* pattern;
    const char* replacement;
    bool ignore_case;
  };

  // SSN must run after phone: a phone match consumes the longer digit group first.
  static const RuleDef kDefaults[] = {
      {"card", R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)", "[REDACTED_CARD]", false},
      {"email", R"(\b[-A-Za-z0-9._%+]+@[-A-Za-z0-9.]+\.[A-Za-z]{2,}\b)", "[REDACTED_EMAIL]",
       false},
      {"phone", R"(\b\d{3}[-.\s]?\d{3}[-.\s]?\d{4}\b)", "[REDACTED_PHONE]", false},
      {"ssn", R"(\b\d{3}[-.\s]?\d{2}[-.\s]?\d{4}\b)", "[REDACTED_SSN]", false},
      {"password", R"((password)[\s:=]+\S+)", "$1: [REDACTED_PASSWORD]", true},
      {"api_key", R"((api[-_\s]?key|token)[\s:=]+\S+)", "$1: [REDACTED_API_KEY]", true},
      {"ipv4", R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", "[REDACTED_IP]", false},
  };

  std::vector<RedactionRule> rules;
  rules.reserve(sizeof(kDefaults) / sizeof(kDefaults[0]));
  for (const auto& def : kDefaults)
  {
    if (auto rule = MakeRule(def.name, def.pattern, def.replacement, def.ignore_case))
    {
      rules.push_back(std::move(*rule));
    }
  }
  return rules;
}

}  // namespace

const std::vector<RedactionRule>& Redactor::DefaultRules()
{
  static const std::vector<RedactionRule> rules = BuildDefaultRules();
  return rules;
}

Redactor::Redactor() : rules_(DefaultRules()) {}

Redactor::Redactor(std::vector<RedactionRule> rules) : rules_(std::move(rules)) {}

void Redactor::AddRule(RedactionRule rule) { rules_.push_back(std::move(rule)); }

size_t Redactor::NextChunkEnd(std::string_view text, size_t begin)
{
  if (text.size() - begin <= kScrubChunkBytes)
  {
    return text.size();
  }
  const size_t limit = begin + kScrubChunkBytes;
  const size_t floor = begin + kScrubChunkBytes / 2;

  // 优先在换行处切分，其次空白，都没有时按 UTF-8 字符边界硬切
  for (const char* separators : {"\n", " \t"})
  {
    size_t cut = text.find_last_of(separators, limit - 1);
    if (cut != std::string_view::npos && cut >= floor)
    {
      return cut + 1;
    }
  }
  size_t cut = limit;
  while (cut > floor && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
  {
    --cut;
  }
  return cut;
}

std::string Redactor::ScrubChunk(std::string_view chunk) const
{
  std::string result(chunk);
  for (const auto& rule : rules_)
  {
    result = std::regex_replace(result, rule.pattern, rule.replacement);
  }
  return result;
}

std::string Redactor::Scrub(std::string_view text) const
{
  if (text.empty())
  {
    return std::string();
  }
  if (text.size() <= kScrubChunkBytes)
  {
    return ScrubChunk(text);
  }

  std::string result;
  result.reserve(text.size());
  size_t begin = 0;
  while (begin < text.size())
  {
    size_t end = NextChunkEnd(text, begin);
    result += ScrubChunk(text.substr(begin, end - begin));
    begin = end;
  }
  return result;
}

}  // namespace ch_logger
