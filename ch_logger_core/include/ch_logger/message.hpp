#pragma once
#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "redactor.hpp"

namespace ch_logger
{

enum class Channel : uint8_t
{
  Console,    // real values
  Persisted,  // placeholders + automatic scrubbing
};

constexpr const char* kDefaultPlaceholder = "[REDACTED]";

// A value that is shown in full on the console and replaced by placeholder in
// the persisted file.
struct Redacted
{
  std::string value;
  std::string placeholder = kDefaultPlaceholder;

  static Redacted Email(std::string v) { return {std::move(v), "[REDACTED_EMAIL]"}; }
  static Redacted Password(std::string v) { return {std::move(v), "[REDACTED_PASSWORD]"}; }
  static Redacted CreditCard(std::string v) { return {std::move(v), "[REDACTED_CARD]"}; }
  static Redacted ApiKey(std::string v) { return {std::move(v), "[REDACTED_API_KEY]"}; }
  static Redacted Phone(std::string v) { return {std::move(v), "[REDACTED_PHONE]"}; }
};

inline Redacted Redact(std::string value, std::string placeholder = kDefaultPlaceholder)
{
  return Redacted{std::move(value), std::move(placeholder)};
}

template <typename T,
          std::enable_if_t<!std::is_convertible_v<const T&, std::string_view>, int> = 0>
Redacted Redact(const T& value, std::string placeholder = kDefaultPlaceholder)
{
  return Redacted{fmt::to_string(value), std::move(placeholder)};
}

// Message text plus the spans that came from Redacted values. The text always
// holds the real values; Resolve() decides per channel what each span becomes.
class Message
{
 public:
  struct Annotation
  {
    size_t offset;
    size_t length;
    std::string placeholder;
  };

  Message() = default;
  Message(const char* text) : text_(text ? text : "") {}
  Message(std::string text) : text_(std::move(text)) {}
  Message(std::string_view text) : text_(text) {}
  Message(const Redacted& value) { Append(value); }

  Message& Append(std::string_view text);
  Message& Append(const Redacted& value);

  template <typename T>
  Message& operator<<(const T& value);

  const std::string& Text() const { return text_; }
  const std::vector<Annotation>& Annotations() const { return annotations_; }
  bool Empty() const { return text_.empty(); }

  std::string Resolve(Channel channel, const Redactor& redactor) const;

  // fmt-style format string; each replacement field consumes the next argument.
  // Redacted arguments become annotations, everything else goes through fmt.
  // A field fmt rejects is kept as literal text.
  template <typename... Args>
  static Message Format(std::string_view format_str, const Args&... args);

 private:
  using FieldWriter = std::function<void(Message&, std::string_view)>;

  template <typename T>
  static FieldWriter MakeFieldWriter(const T& arg);

  void ApplyFormat(std::string_view format_str, const FieldWriter* writers, size_t count);

  std::string text_;
  std::vector<Annotation> annotations_;
};

// ===== template implementation =====

template <typename T>
Message& Message::operator<<(const T& value)
{
  if constexpr (std::is_same_v<T, Redacted>)
  {
    return Append(value);
  }
  else if constexpr (std::is_convertible_v<const T&, std::string_view>)
  {
    return Append(std::string_view(value));
  }
  else
  {
    return Append(fmt::to_string(value));
  }
}

template <typename T>
Message::FieldWriter Message::MakeFieldWriter(const T& arg)
{
  if constexpr (std::is_same_v<T, Redacted>)
  {
    return [&arg](Message& msg, std::string_view) { msg.Append(arg); };
  }
  else
  {
    return [&arg](Message& msg, std::string_view field)
    {
      try
      {
        msg.Append(fmt::format(fmt::runtime(field), arg));
      }
      catch (const fmt::format_error&)
      {
        msg.Append(field);
      }
    };
  }
}

template <typename... Args>
Message Message::Format(std::string_view format_str, const Args&... args)
{
  Message msg;
  std::array<FieldWriter, sizeof...(Args)> writers{MakeFieldWriter(args)...};
  msg.ApplyFormat(format_str, writers.data(), writers.size());
  return msg;
}

}  // namespace ch_logger
