#pragma once
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ch_logger
{

struct RedactionRule
{
  std::string name;
  std::regex pattern;
  std::string replacement;  // ECMAScript format string, "$1" refers to a capture group
};

// Returns std::nullopt when the pattern does not compile.
std::optional<RedactionRule> MakeRule(std::string name, std::string_view pattern,
                                      std::string replacement, bool ignore_case = false);

// Ordered pattern -> placeholder scrubbing. Rules run in sequence and each one
// sees the output of the previous one, so the order of the list matters.
class Redactor
{
 public:
  // std::regex recursion depth grows with the match length, so text is
  // scrubbed in chunks of at most this many bytes, cut at line breaks or
  // whitespace where possible. A match that straddles a cut is not found.
  static constexpr size_t kScrubChunkBytes = 4096;

  // card, email, phone, ssn, password, api key/token, ipv4
  Redactor();
  explicit Redactor(std::vector<RedactionRule> rules);

  std::string Scrub(std::string_view text) const;

  void AddRule(RedactionRule rule);
  const std::vector<RedactionRule>& Rules() const { return rules_; }

  static const std::vector<RedactionRule>& DefaultRules();

  // End offset of the chunk that starts at begin.
  static size_t NextChunkEnd(std::string_view text, size_t begin);

 private:
  std::vector<RedactionRule> rules_;

  std::string ScrubChunk(std::string_view chunk) const;
};

}  // namespace ch_logger
