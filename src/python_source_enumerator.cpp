#include <codemem/python_source_enumerator.h>

#include <codemem/errors.h>
#include <codemem/gitignore_matcher.h>
#include <codemem/key_scheme.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace codemem {

namespace {
bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }

  const auto parent = std::filesystem::weakly_canonical(potential_parent);
  const auto normalized_candidate =
      std::filesystem::weakly_canonical(candidate);

  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

bool IsSkippedDirectoryName(const std::filesystem::path &path) {
  const auto &names = SkippedDirectoryNames();
  return std::find(names.begin(), names.end(), path.filename().string()) !=
         names.end();
}

std::filesystem::path ResolveRootPath(const std::filesystem::path &root) {
  if (root.empty()) {
    throw ConfigurationError("Project root must not be empty");
  }
  const auto normalized_root = std::filesystem::weakly_canonical(root);
  if (!std::filesystem::is_directory(normalized_root)) {
    throw ConfigurationError("Project root is not a directory: " +
                             normalized_root.string());
  }
  return normalized_root;
}

std::vector<std::filesystem::path>
ResolveIgnoredPaths(const std::filesystem::path &root,
                    const std::vector<std::string> &ignored) {
  std::vector<std::filesystem::path> resolved;
  resolved.reserve(ignored.size());
  for (const auto &entry : ignored) {
    std::filesystem::path path(entry);
    if (!path.is_absolute()) {
      path = root / path;
    }
    resolved.push_back(std::filesystem::weakly_canonical(path));
  }
  return resolved;
}
} // namespace

const std::vector<std::string> &SkippedDirectoryNames() {
  static const std::vector<std::string> names = {
      ".logs", ".venv", ".git", "__pycache__", "node_modules", "build", "dist"};
  return names;
}

bool IsPythonSource(const std::filesystem::path &path) {
  return path.extension() == ".py";
}

PythonSourceEnumerator::PythonSourceEnumerator(SourceEnumeratorOptions options,
                                               std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {}

SourceEnumerationResult
PythonSourceEnumerator::Enumerate(const std::filesystem::path &root) {
  const auto project_root = ResolveRootPath(root);
  const auto ignored_paths =
      ResolveIgnoredPaths(project_root, options_.ignored_paths);
  const auto gitignore = options_.respect_gitignore
                             ? GitignoreMatcher::FromFile(project_root /
                                                          ".gitignore")
                             : GitignoreMatcher{};

  std::vector<SourceFile> files;
  const auto iterator_options =
      std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::recursive_directory_iterator it(project_root,
                                                         iterator_options),
       end;
       it != end; ++it) {
    const auto &entry = *it;
    const bool is_directory = entry.is_directory();
    const auto relative = NormalizeRelativePath(
        entry.path().lexically_relative(project_root));

    const bool skipped =
        (is_directory && IsSkippedDirectoryName(entry.path())) ||
        IsIgnoredPath(entry.path(), ignored_paths) ||
        gitignore.IsIgnored(relative, is_directory);
    if (skipped) {
      if (is_directory) {
        it.disable_recursion_pending();
      }
      logger_->Log(LogLevel::kDebug, "enumerate.skipped",
                   {{"path", relative}});
      continue;
    }

    if (!entry.is_regular_file() || !IsPythonSource(entry.path())) {
      continue;
    }
    files.push_back(SourceFile{entry.path().string(), relative});
  }

  std::sort(files.begin(), files.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.relative_path < rhs.relative_path;
  });

  logger_->Log(LogLevel::kInfo, "Collected source files",
               {{"count", std::to_string(files.size())},
                {"root", project_root.string()}});

  SourceEnumerationResult result;
  result.project_root = project_root.string();
  result.files = std::move(files);
  return result;
}

std::vector<SourceFile>
ResolveNamedSources(const std::filesystem::path &root,
                    const std::vector<std::string> &files) {
  const auto project_root = std::filesystem::weakly_canonical(root);
  std::vector<SourceFile> resolved;
  for (const auto &file : files) {
    std::filesystem::path path(file);
    if (!path.is_absolute()) {
      path = project_root / path;
    }
    path = std::filesystem::weakly_canonical(path);
    if (!IsWithin(path, project_root)) {
      throw ConfigurationError("File is outside the project root: " + file);
    }
    if (!IsPythonSource(path)) {
      continue;
    }
    const auto relative =
        NormalizeRelativePath(path.lexically_relative(project_root));
    const auto duplicate =
        std::find_if(resolved.begin(), resolved.end(), [&](const auto &known) {
          return known.relative_path == relative;
        });
    if (duplicate == resolved.end()) {
      resolved.push_back(SourceFile{path.string(), relative});
    }
  }
  return resolved;
}

} // namespace codemem
