#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace codemem {

struct StringLiteral {
  std::string value;
  bool is_bytes = false;
  bool is_formatted = false;
};

// Decodes one Python string token (prefix, quotes and escapes). Formatted
// strings keep their raw body since they cannot be evaluated statically.
std::optional<StringLiteral> EvaluateStringLiteral(std::string_view token);

// Indentation clean-up applied to docstrings, equivalent to inspect.cleandoc.
std::string CleanDocstring(const std::string &raw);

// repr() of a str value: single quotes unless only double quotes avoid
// escaping.
std::string PythonStringRepr(const std::string &value);

std::string NormalizeIntegerLiteral(const std::string &token);
std::string CollapseWhitespace(const std::string &text);

} // namespace codemem
