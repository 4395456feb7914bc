#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

enum class EntityType { kFunction, kClass, kMethod, kVariable };

std::string EntityTypeName(EntityType type);
std::optional<EntityType> ParseEntityType(const std::string &name);
const std::vector<EntityType> &AllEntityTypes();

struct EntityRecord {
  EntityType entity_type = EntityType::kFunction;
  std::string file_path;
  std::string name;
  std::optional<std::string> signature;
  std::optional<std::string> docstring;
  int line_start = 0;
  int line_end = 0;
  std::optional<std::string> parent_class;
  std::optional<std::vector<std::string>> bases;
  std::optional<std::string> value_repr;

  bool operator==(const EntityRecord &) const = default;
};

struct ExtractionResult {
  std::vector<EntityRecord> entities;
  std::size_t skipped_nodes = 0;
};

struct SourceFile {
  std::string absolute_path;
  // Forward-slash path relative to the project root.
  std::string relative_path;
};

struct SourceEnumerationResult {
  std::string project_root;
  std::vector<SourceFile> files;
};

struct FileMetadata {
  std::string path;
  std::uintmax_t size = 0;
  std::int64_t last_modified = 0;
  std::size_t entity_count = 0;
};

struct ProjectMetadata {
  std::string name;
  std::string path;
  std::int64_t last_indexed_at = 0;
  std::size_t total_files = 0;
  std::size_t total_entities = 0;
  std::string version;
};

struct WriteSummary {
  std::size_t entities_written = 0;
  std::size_t entities_failed = 0;
  std::size_t files_written = 0;
  std::size_t files_failed = 0;
  std::size_t files_skipped = 0;
  std::size_t files_removed = 0;
  std::vector<std::string> failed_keys;
  std::vector<std::string> failed_files;

  std::size_t FailureCount() const {
    return entities_failed + files_failed + files_skipped;
  }
};

struct ForgetSummary {
  std::size_t keys_deleted = 0;
  std::size_t keys_failed = 0;
};

struct StatusSummary {
  std::size_t file_count = 0;
  std::size_t entity_count = 0;
  std::size_t function_count = 0;
  std::size_t class_count = 0;
  std::size_t method_count = 0;
  std::size_t variable_count = 0;
  std::size_t embedding_count = 0;
  std::vector<std::string> files;
};

struct EmbeddingMetadata {
  EntityType entity_type = EntityType::kFunction;
  std::string file_path;
  std::string name;
  std::optional<std::string> parent_class;
  int line_start = 0;
  int line_end = 0;
  std::optional<std::string> signature;
};

struct EmbeddingRecord {
  std::string key;
  std::vector<float> vector;
  std::string provider_id;
  std::string model_id;
  EmbeddingMetadata metadata;
};

struct SearchHit {
  std::string key;
  double score = 0.0;
  EmbeddingMetadata metadata;
};

struct SearchOptions {
  std::size_t top_k = 10;
  std::optional<double> min_score;
  std::vector<EntityType> entity_types;
  std::optional<std::string> file_path;
};

struct VectorizeSummary {
  std::size_t entities = 0;
  std::size_t indexed = 0;
  std::size_t failed = 0;
  std::size_t failed_batches = 0;
  std::size_t batches = 0;
  bool dry_run = false;
};

struct RecallResult {
  EntityRecord entity;
  double score = 0.0;
};

} // namespace codemem
