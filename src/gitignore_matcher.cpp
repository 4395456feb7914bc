#include <codemem/gitignore_matcher.h>

#include <fstream>
#include <string_view>

namespace codemem {

namespace {
std::string TrimTrailingSpaces(std::string line) {
  while (!line.empty() && (line.back() == ' ' || line.back() == '\t' ||
                           line.back() == '\r')) {
    if (line.size() >= 2 && line[line.size() - 2] == '\\') {
      line.erase(line.size() - 2, 1);
      break;
    }
    line.pop_back();
  }
  return line;
}

std::string GlobToRegex(std::string_view glob) {
  std::string regex;
  for (std::size_t i = 0; i < glob.size(); ++i) {
    const auto character = glob[i];
    if (character == '*') {
      const bool double_star = i + 1 < glob.size() && glob[i + 1] == '*';
      if (!double_star) {
        regex += "[^/]*";
        continue;
      }
      ++i;
      if (i + 1 < glob.size() && glob[i + 1] == '/') {
        ++i;
        regex += "(.*/)?";
      } else {
        regex += ".*";
      }
      continue;
    }
    if (character == '?') {
      regex += "[^/]";
      continue;
    }
    if (character == '[') {
      const auto close = glob.find(']', i + 1);
      if (close != std::string_view::npos) {
        auto klass = std::string(glob.substr(i + 1, close - i - 1));
        if (!klass.empty() && klass.front() == '!') {
          klass.front() = '^';
        }
        regex += "[" + klass + "]";
        i = close;
        continue;
      }
    }
    if (character == '\\' && i + 1 < glob.size()) {
      ++i;
    }
    if (std::string_view(".^$|()[]{}+\\").find(glob[i]) !=
        std::string_view::npos) {
      regex.push_back('\\');
    }
    regex.push_back(glob[i]);
  }
  return regex;
}
} // namespace

GitignoreMatcher::GitignoreMatcher(const std::vector<std::string> &lines) {
  for (const auto &raw : lines) {
    auto line = TrimTrailingSpaces(raw);
    if (line.empty() || line.front() == '#') {
      continue;
    }

    Rule rule;
    if (line.front() == '!') {
      rule.negated = true;
      line.erase(0, 1);
    } else if (line.rfind("\\!", 0) == 0 || line.rfind("\\#", 0) == 0) {
      line.erase(0, 1);
    }
    if (!line.empty() && line.back() == '/') {
      rule.directory_only = true;
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    const bool anchored = line.find('/') != std::string::npos;
    if (line.front() == '/') {
      line.erase(0, 1);
    }
    const auto body = GlobToRegex(line);
    rule.pattern = std::regex(anchored ? "^" + body + "$"
                                       : "^(.*/)?" + body + "$");
    rules_.push_back(std::move(rule));
  }
}

GitignoreMatcher GitignoreMatcher::FromFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    return {};
  }
  std::vector<std::string> lines;
  for (std::string line; std::getline(stream, line);) {
    lines.push_back(line);
  }
  return GitignoreMatcher(lines);
}

bool GitignoreMatcher::IsIgnored(const std::string &relative_path,
                                 bool is_directory) const {
  bool ignored = false;
  for (const auto &rule : rules_) {
    if (rule.directory_only && !is_directory) {
      continue;
    }
    if (std::regex_match(relative_path, rule.pattern)) {
      ignored = !rule.negated;
    }
  }
  return ignored;
}

} // namespace codemem
