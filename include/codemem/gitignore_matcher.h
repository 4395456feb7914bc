#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace codemem {

// Subset of .gitignore semantics: globs with `*`, `?`, `**` and character
// classes, anchoring via `/`, directory-only patterns and `!` negation.
// Later patterns override earlier ones.
class GitignoreMatcher {
public:
  GitignoreMatcher() = default;
  explicit GitignoreMatcher(const std::vector<std::string> &lines);

  static GitignoreMatcher FromFile(const std::filesystem::path &path);

  bool IsIgnored(const std::string &relative_path, bool is_directory) const;
  bool empty() const { return rules_.empty(); }

private:
  struct Rule {
    std::regex pattern;
    bool negated = false;
    bool directory_only = false;
  };

  std::vector<Rule> rules_;
};

} // namespace codemem
