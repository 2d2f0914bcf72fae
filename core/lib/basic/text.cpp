// argconv/basic/text.cpp - Text helper implementation
//
#include "argconv/basic/text.hpp"

#include <cctype>

namespace argconv
{

namespace
{

bool is_ascii_space(unsigned char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_cased(unsigned char c) { return std::isalpha(c) != 0 || c >= 0x80; }

}  // namespace

std::string seq2str(
  const std::vector<std::string> & items, std::string_view quote, std::string_view sep,
  std::string_view lastsep)
{
  std::vector<std::string> quoted;
  quoted.reserve(items.size());
  for (const auto & item : items) {
    std::string q(quote);
    q += item;
    q += quote;
    quoted.push_back(std::move(q));
  }
  if (quoted.empty()) return "";
  if (quoted.size() == 1) return quoted.front();

  std::string result;
  for (size_t i = 0; i + 2 < quoted.size(); ++i) {
    result += quoted[i];
    result += sep;
  }
  result += quoted[quoted.size() - 2];
  result += lastsep;
  result += quoted.back();
  return result;
}

std::string to_lower_ascii(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper_ascii(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_title(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  bool previous_cased = false;
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      out.push_back(ch);
      // UTF-8 continuation bytes never start a new word.
      previous_cased = true;
      continue;
    }
    if (std::isalpha(c) != 0) {
      out.push_back(
        static_cast<char>(previous_cased ? std::tolower(c) : std::toupper(c)));
    } else {
      out.push_back(ch);
    }
    previous_cased = is_cased(c);
  }
  return out;
}

std::string_view strip(std::string_view s) noexcept
{
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && is_ascii_space(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && is_ascii_space(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

std::string remove_chars(std::string_view s, std::string_view chars)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    if (chars.find(c) == std::string_view::npos) out.push_back(c);
  }
  return out;
}

bool is_lower(std::string_view s) noexcept
{
  bool any_cased = false;
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isupper(c) != 0) return false;
    if (std::islower(c) != 0) any_cased = true;
  }
  return any_cased;
}

std::string capitalize(std::string_view s)
{
  std::string out = to_lower_ascii(s);
  if (!out.empty()) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

std::string normalize(std::string_view s, std::string_view ignore)
{
  std::string out;
  out.reserve(s.size());
  const std::string lowered_ignore = to_lower_ascii(ignore);
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_ascii_space(c)) continue;
    const char lowered = static_cast<char>(std::tolower(c));
    if (lowered_ignore.find(lowered) != std::string::npos) continue;
    out.push_back(lowered);
  }
  return out;
}

bool eq_normalized(std::string_view a, std::string_view b, std::string_view ignore)
{
  return normalize(a, ignore) == normalize(b, ignore);
}

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::vector<uint32_t> decode_utf8(std::string_view s)
{
  std::vector<uint32_t> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      len = 1;
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    }

    bool valid = len != 0 && i + len <= s.size();
    for (size_t k = 1; valid && k < len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = (cp << 6) | (cc & 0x3F);
      }
    }

    if (!valid) {
      out.push_back(c);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += len;
  }
  return out;
}

}  // namespace argconv
