#pragma once

#include <codemem/models.h>

#include <filesystem>
#include <string>

namespace codemem {

// Namespace under which one project's keys live. Fixed for a session and
// passed to every component that builds keys.
class ProjectPrefix {
public:
  static ProjectPrefix FromProjectName(const std::string &project_name);
  static ProjectPrefix FromProjectRoot(const std::filesystem::path &root);

  const std::string &value() const { return value_; }
  const std::string &project_name() const { return project_name_; }

  bool operator==(const ProjectPrefix &) const = default;

private:
  explicit ProjectPrefix(std::string project_name);

  std::string project_name_;
  std::string value_;
};

// Identity of an entity inside its project: `method:{file}:{Class}.{name}`
// for methods, `{type}:{file}:{name}` otherwise.
std::string EntityId(const EntityRecord &entity);
std::string ComputeKey(const ProjectPrefix &prefix, const EntityRecord &entity);

std::string ProcessedFilesKey(const ProjectPrefix &prefix);
std::string FileMetadataKey(const ProjectPrefix &prefix,
                            const std::string &file_path);
std::string ProjectMetadataKey(const ProjectPrefix &prefix);

// Embeddings sit beside their entity so that prefix scans find both.
std::string EmbeddingKey(const std::string &entity_key);
bool IsEmbeddingKey(const std::string &key);
std::string EntityKeyForEmbedding(const std::string &embedding_key);

std::string ProjectScanPrefix(const ProjectPrefix &prefix);
std::string EntityTypeScanPrefix(const ProjectPrefix &prefix, EntityType type);
std::string FileEntityScanPrefix(const ProjectPrefix &prefix, EntityType type,
                                 const std::string &file_path);

std::string NormalizeRelativePath(const std::filesystem::path &path);

} // namespace codemem
