#include "ch_logger/message.hpp"

namespace ch_logger
{

Message& Message::Append(std::string_view text)
{
  text_.append(text.data(), text.size());
  return *this;
}

Message& Message::Append(const Redacted& value)
{
  annotations_.push_back(Annotation{text_.size(), value.value.size(), value.placeholder});
  text_ += value.value;
  return *this;
}

std::string Message::Resolve(Channel channel, const Redactor& redactor) const
{
  if (channel == Channel::Console)
  {
    return text_;
  }

  std::string out;
  out.reserve(text_.size());
  size_t cursor = 0;
  for (const auto& annotation : annotations_)
  {
    // A span outside the text or behind the cursor is not honoured; its bytes
    // stay in the plain text and go through the scrubber.
    if (annotation.offset < cursor || annotation.offset > text_.size() ||
        annotation.length > text_.size() - annotation.offset)
    {
      continue;
    }
    out += redactor.Scrub(std::string_view(text_).substr(cursor, annotation.offset - cursor));
    out += annotation.placeholder;
    cursor = annotation.offset + annotation.length;
  }
  out += redactor.Scrub(std::string_view(text_).substr(cursor));
  return out;
}

void Message::ApplyFormat(std::string_view format_str, const FieldWriter* writers,
                          size_t count)
{
  size_t next_arg = 0;
  size_t literal_start = 0;
  size_t i = 0;

  auto flush_literal = [&](size_t end)
  {
    if (end > literal_start)
    {
      Append(format_str.substr(literal_start, end - literal_start));
    }
  };

  while (i < format_str.size())
  {
    char c = format_str[i];
    if (c == '{' && i + 1 < format_str.size() && format_str[i + 1] == '{')
    {
      flush_literal(i);
      Append("{");
      i += 2;
      literal_start = i;
    }
    else if (c == '}' && i + 1 < format_str.size() && format_str[i + 1] == '}')
    {
      flush_literal(i);
      Append("}");
      i += 2;
      literal_start = i;
    }
    else if (c == '{')
    {
      size_t close = format_str.find('}', i + 1);
      if (close == std::string_view::npos)
      {
        break;  // unterminated field: the rest is literal
      }
      flush_literal(i);
      std::string_view field = format_str.substr(i, close - i + 1);
      if (next_arg < count)
      {
        writers[next_arg++](*this, field);
      }
      else
      {
        Append(field);
      }
      i = close + 1;
      literal_start = i;
    }
    else
    {
      ++i;
    }
  }
  flush_literal(format_str.size());
}

}  // namespace ch_logger
