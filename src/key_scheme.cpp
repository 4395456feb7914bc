#include <codemem/key_scheme.h>

#include <codemem/errors.h>

#include <utility>

namespace codemem {

namespace {
constexpr const char kPrefixRoot[] = "code";
constexpr const char kProcessedFilesSegment[] = "file_index";
constexpr const char kFileMetadataSegment[] = "files";
constexpr const char kProjectMetadataSegment[] = "metadata";
// '#' never appears in a Python identifier, so it cannot collide with an
// entity name.
constexpr const char kEmbeddingSuffix[] = "#embedding";

// Project names form one key segment; a ':' would let one project's scan
// prefix cover another project's keys.
const std::string &ValidateProjectName(const std::string &project_name,
                                       const std::string &hint) {
  if (project_name.empty()) {
    throw ConfigurationError("Project name must not be empty");
  }
  if (project_name.find(':') != std::string::npos) {
    throw ConfigurationError("Project name must not contain ':': '" +
                             project_name + "'" + hint);
  }
  return project_name;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}
} // namespace

ProjectPrefix::ProjectPrefix(std::string project_name)
    : project_name_(std::move(project_name)),
      value_(std::string(kPrefixRoot) + ":" + project_name_) {}

ProjectPrefix ProjectPrefix::FromProjectName(const std::string &project_name) {
  return ProjectPrefix(ValidateProjectName(project_name, ""));
}

ProjectPrefix ProjectPrefix::FromProjectRoot(const std::filesystem::path &root) {
  auto normalized = std::filesystem::weakly_canonical(root).lexically_normal();
  if (!normalized.has_filename() && normalized.has_parent_path()) {
    normalized = normalized.parent_path();
  }
  const auto name = normalized.filename().string();
  if (name.empty()) {
    throw ConfigurationError("Cannot derive a project name from " +
                             root.string() + "; pass --project");
  }
  return ProjectPrefix(ValidateProjectName(name, "; pass --project"));
}

std::string EntityId(const EntityRecord &entity) {
  if (entity.entity_type == EntityType::kMethod) {
    return "method:" + entity.file_path + ":" +
           entity.parent_class.value_or("") + "." + entity.name;
  }
  return EntityTypeName(entity.entity_type) + ":" + entity.file_path + ":" +
         entity.name;
}

std::string ComputeKey(const ProjectPrefix &prefix,
                       const EntityRecord &entity) {
  return prefix.value() + ":" + EntityId(entity);
}

std::string ProcessedFilesKey(const ProjectPrefix &prefix) {
  return prefix.value() + ":" + kProcessedFilesSegment;
}

std::string FileMetadataKey(const ProjectPrefix &prefix,
                            const std::string &file_path) {
  return prefix.value() + ":" + kFileMetadataSegment + ":" + file_path;
}

std::string ProjectMetadataKey(const ProjectPrefix &prefix) {
  return prefix.value() + ":" + kProjectMetadataSegment;
}

std::string EmbeddingKey(const std::string &entity_key) {
  return entity_key + kEmbeddingSuffix;
}

bool IsEmbeddingKey(const std::string &key) {
  return EndsWith(key, kEmbeddingSuffix);
}

std::string EntityKeyForEmbedding(const std::string &embedding_key) {
  if (!IsEmbeddingKey(embedding_key)) {
    return embedding_key;
  }
  return embedding_key.substr(0, embedding_key.size() -
                                     std::string(kEmbeddingSuffix).size());
}

std::string ProjectScanPrefix(const ProjectPrefix &prefix) {
  return prefix.value() + ":";
}

std::string EntityTypeScanPrefix(const ProjectPrefix &prefix,
                                 EntityType type) {
  return prefix.value() + ":" + EntityTypeName(type) + ":";
}

std::string FileEntityScanPrefix(const ProjectPrefix &prefix, EntityType type,
                                 const std::string &file_path) {
  return EntityTypeScanPrefix(prefix, type) + file_path + ":";
}

std::string NormalizeRelativePath(const std::filesystem::path &path) {
  auto normalized = path.lexically_normal().generic_string();
  while (normalized.rfind("./", 0) == 0) {
    normalized.erase(0, 2);
  }
  return normalized;
}

} // namespace codemem
