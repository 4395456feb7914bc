#pragma once

#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace codemem {

struct SourceEnumeratorOptions {
  // Paths relative to the project root (or absolute) that are never walked.
  std::vector<std::string> ignored_paths;
  bool respect_gitignore = true;
};

const std::vector<std::string> &SkippedDirectoryNames();

class PythonSourceEnumerator : public SourceEnumerator {
public:
  explicit PythonSourceEnumerator(SourceEnumeratorOptions options = {},
                                  std::shared_ptr<Logger> logger = nullptr);

  SourceEnumerationResult Enumerate(const std::filesystem::path &root) override;

private:
  SourceEnumeratorOptions options_;
  std::shared_ptr<Logger> logger_;
};

bool IsPythonSource(const std::filesystem::path &path);

// Maps explicitly named files onto the project root. Files that no longer
// exist are kept so callers can drop them from the index.
std::vector<SourceFile>
ResolveNamedSources(const std::filesystem::path &root,
                    const std::vector<std::string> &files);

} // namespace codemem
