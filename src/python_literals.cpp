#include <codemem/python_literals.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace codemem {

namespace {
bool IsHexDigit(char character) {
  return std::isxdigit(static_cast<unsigned char>(character)) != 0;
}

void AppendUtf8(std::string &target, std::uint32_t code_point) {
  if (code_point < 0x80) {
    target.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    target.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    target.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    target.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    target.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

void AppendCodeUnit(std::string &target, std::uint32_t value, bool is_bytes) {
  if (is_bytes) {
    target.push_back(static_cast<char>(value & 0xFF));
    return;
  }
  AppendUtf8(target, value);
}

// Reads up to `max_digits` digits of `base` starting at `index`.
std::size_t ReadDigits(std::string_view body, std::size_t index,
                       std::size_t max_digits, int base,
                       std::uint32_t &value) {
  std::size_t consumed = 0;
  value = 0;
  while (consumed < max_digits && index + consumed < body.size()) {
    const auto character = body[index + consumed];
    const bool valid = base == 16 ? IsHexDigit(character)
                                  : (character >= '0' && character <= '7');
    if (!valid) {
      break;
    }
    const auto digit = std::isdigit(static_cast<unsigned char>(character))
                           ? character - '0'
                           : std::tolower(character) - 'a' + 10;
    value = value * static_cast<std::uint32_t>(base) +
            static_cast<std::uint32_t>(digit);
    ++consumed;
  }
  return consumed;
}

std::string DecodeEscapes(std::string_view body, bool is_bytes) {
  std::string decoded;
  decoded.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    const auto character = body[i];
    if (character != '\\' || i + 1 >= body.size()) {
      decoded.push_back(character);
      continue;
    }

    const auto next = body[++i];
    switch (next) {
    case '\n':
      break;
    case '\r':
      if (i + 1 < body.size() && body[i + 1] == '\n') {
        ++i;
      }
      break;
    case '\\':
    case '\'':
    case '"':
      decoded.push_back(next);
      break;
    case 'a':
      decoded.push_back('\a');
      break;
    case 'b':
      decoded.push_back('\b');
      break;
    case 'f':
      decoded.push_back('\f');
      break;
    case 'n':
      decoded.push_back('\n');
      break;
    case 'r':
      decoded.push_back('\r');
      break;
    case 't':
      decoded.push_back('\t');
      break;
    case 'v':
      decoded.push_back('\v');
      break;
    case 'x': {
      std::uint32_t value = 0;
      const auto consumed = ReadDigits(body, i + 1, 2, 16, value);
      if (consumed != 2) {
        decoded.push_back('\\');
        decoded.push_back(next);
        break;
      }
      AppendCodeUnit(decoded, value, is_bytes);
      i += consumed;
      break;
    }
    case 'u':
    case 'U': {
      const std::size_t width = next == 'u' ? 4 : 8;
      std::uint32_t value = 0;
      const auto consumed =
          is_bytes ? 0 : ReadDigits(body, i + 1, width, 16, value);
      if (consumed != width) {
        decoded.push_back('\\');
        decoded.push_back(next);
        break;
      }
      AppendUtf8(decoded, value);
      i += consumed;
      break;
    }
    default:
      if (next >= '0' && next <= '7') {
        std::uint32_t value = 0;
        const auto consumed = ReadDigits(body, i, 3, 8, value);
        AppendCodeUnit(decoded, value, is_bytes);
        i += consumed - 1;
        break;
      }
      decoded.push_back('\\');
      decoded.push_back(next);
      break;
    }
  }
  return decoded;
}

std::string ExpandTabs(const std::string &text) {
  constexpr std::size_t kTabSize = 8;
  std::string expanded;
  std::size_t column = 0;
  for (const auto character : text) {
    if (character == '\t') {
      const auto spaces = kTabSize - (column % kTabSize);
      expanded.append(spaces, ' ');
      column += spaces;
      continue;
    }
    expanded.push_back(character);
    column = (character == '\n' || character == '\r') ? 0 : column + 1;
  }
  return expanded;
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (const auto character : text) {
    if (character == '\n') {
      lines.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  lines.push_back(current);
  return lines;
}

std::size_t LeadingWhitespace(const std::string &line) {
  std::size_t count = 0;
  while (count < line.size() &&
         std::isspace(static_cast<unsigned char>(line[count])) != 0) {
    ++count;
  }
  return count;
}
} // namespace

std::optional<StringLiteral> EvaluateStringLiteral(std::string_view token) {
  std::size_t prefix_length = 0;
  while (prefix_length < token.size() && token[prefix_length] != '\'' &&
         token[prefix_length] != '"') {
    ++prefix_length;
  }
  if (prefix_length == token.size()) {
    return std::nullopt;
  }

  std::string prefix;
  for (std::size_t i = 0; i < prefix_length; ++i) {
    prefix.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(token[i]))));
  }
  if (prefix.find_first_not_of("rbuf") != std::string::npos) {
    return std::nullopt;
  }

  const auto quote = token[prefix_length];
  const std::string triple(3, quote);
  const auto remainder = token.substr(prefix_length);
  std::size_t quote_width = 1;
  if (remainder.size() >= 6 && remainder.substr(0, 3) == triple &&
      remainder.substr(remainder.size() - 3) == triple) {
    quote_width = 3;
  }
  if (remainder.size() < 2 * quote_width ||
      remainder[remainder.size() - 1] != quote) {
    return std::nullopt;
  }

  const auto body =
      remainder.substr(quote_width, remainder.size() - 2 * quote_width);
  StringLiteral literal;
  literal.is_bytes = prefix.find('b') != std::string::npos;
  literal.is_formatted = prefix.find('f') != std::string::npos;
  const bool is_raw = prefix.find('r') != std::string::npos;
  literal.value = (is_raw || literal.is_formatted)
                      ? std::string(body)
                      : DecodeEscapes(body, literal.is_bytes);
  return literal;
}

std::string CleanDocstring(const std::string &raw) {
  auto lines = SplitLines(ExpandTabs(raw));

  auto margin = std::string::npos;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto indent = LeadingWhitespace(lines[i]);
    if (indent < lines[i].size()) {
      margin = std::min(margin, indent);
    }
  }

  if (!lines.empty()) {
    lines[0].erase(0, LeadingWhitespace(lines[0]));
  }
  if (margin != std::string::npos) {
    for (std::size_t i = 1; i < lines.size(); ++i) {
      lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : "";
    }
  }

  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  std::size_t first = 0;
  while (first < lines.size() && lines[first].empty()) {
    ++first;
  }

  std::string cleaned;
  for (std::size_t i = first; i < lines.size(); ++i) {
    if (i > first) {
      cleaned.push_back('\n');
    }
    cleaned.append(lines[i]);
  }
  return cleaned;
}

std::string PythonStringRepr(const std::string &value) {
  const bool has_single = value.find('\'') != std::string::npos;
  const bool has_double = value.find('"') != std::string::npos;
  const char quote = (has_single && !has_double) ? '"' : '\'';

  std::ostringstream stream;
  stream << quote;
  for (const auto character : value) {
    const auto byte = static_cast<unsigned char>(character);
    if (character == '\\') {
      stream << "\\\\";
    } else if (character == quote) {
      stream << '\\' << quote;
    } else if (character == '\n') {
      stream << "\\n";
    } else if (character == '\r') {
      stream << "\\r";
    } else if (character == '\t') {
      stream << "\\t";
    } else if (byte < 0x20 || byte == 0x7F) {
      static constexpr char kHex[] = "0123456789abcdef";
      stream << "\\x" << kHex[byte >> 4] << kHex[byte & 0x0F];
    } else {
      stream << character;
    }
  }
  stream << quote;
  return stream.str();
}

std::string NormalizeIntegerLiteral(const std::string &token) {
  std::string digits;
  for (const auto character : token) {
    if (character != '_') {
      digits.push_back(static_cast<char>(
          std::tolower(static_cast<unsigned char>(character))));
    }
  }
  if (digits.empty() || digits.back() == 'j' || digits.back() == 'l') {
    return token;
  }

  int base = 10;
  std::string magnitude = digits;
  if (digits.size() > 2 && digits[0] == '0') {
    if (digits[1] == 'x') {
      base = 16;
    } else if (digits[1] == 'o') {
      base = 8;
    } else if (digits[1] == 'b') {
      base = 2;
    }
    if (base != 10) {
      magnitude = digits.substr(2);
    }
  }

  try {
    return std::to_string(std::stoull(magnitude, nullptr, base));
  } catch (const std::out_of_range &) {
    return base == 10 ? digits : token;
  } catch (const std::invalid_argument &) {
    return token;
  }
}

std::string CollapseWhitespace(const std::string &text) {
  std::string collapsed;
  bool pending_space = false;
  for (const auto character : text) {
    if (std::isspace(static_cast<unsigned char>(character)) != 0) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(character);
  }
  return collapsed;
}

} // namespace codemem
