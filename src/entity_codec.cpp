#include <codemem/entity_codec.h>

#include <codemem/errors.h>

#include <stdexcept>
#include <utility>

namespace codemem {

namespace {
template <typename Value>
void PutOptional(nlohmann::json &document, const char *name,
                 const std::optional<Value> &value) {
  if (value) {
    document[name] = *value;
  }
}

template <typename Value>
std::optional<Value> GetOptional(const nlohmann::json &document,
                                 const char *name) {
  const auto found = document.find(name);
  if (found == document.end() || found->is_null()) {
    return std::nullopt;
  }
  return found->get<Value>();
}

EntityType RequireEntityType(const nlohmann::json &document) {
  const auto name = document.at("entity_type").get<std::string>();
  const auto type = ParseEntityType(name);
  if (!type) {
    throw std::invalid_argument("unknown entity_type '" + name + "'");
  }
  return *type;
}

nlohmann::json ParseDocument(const std::string &key,
                             const std::string &payload) {
  auto document = nlohmann::json::parse(payload, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw StoreOperationError(key, "stored value is not a JSON object");
  }
  return document;
}
} // namespace

nlohmann::json EntityToJson(const EntityRecord &entity) {
  nlohmann::json document = {{"entity_type", EntityTypeName(entity.entity_type)},
                             {"file_path", entity.file_path},
                             {"name", entity.name},
                             {"line_start", entity.line_start},
                             {"line_end", entity.line_end}};
  PutOptional(document, "signature", entity.signature);
  PutOptional(document, "docstring", entity.docstring);
  PutOptional(document, "parent_class", entity.parent_class);
  PutOptional(document, "bases", entity.bases);
  PutOptional(document, "value_repr", entity.value_repr);
  return document;
}

EntityRecord EntityFromJson(const nlohmann::json &document) {
  EntityRecord entity;
  entity.entity_type = RequireEntityType(document);
  entity.file_path = document.at("file_path").get<std::string>();
  entity.name = document.at("name").get<std::string>();
  entity.line_start = document.value("line_start", 0);
  entity.line_end = document.value("line_end", entity.line_start);
  entity.signature = GetOptional<std::string>(document, "signature");
  entity.docstring = GetOptional<std::string>(document, "docstring");
  entity.parent_class = GetOptional<std::string>(document, "parent_class");
  entity.bases = GetOptional<std::vector<std::string>>(document, "bases");
  entity.value_repr = GetOptional<std::string>(document, "value_repr");
  return entity;
}

std::string DumpJson(const nlohmann::json &document, int indent) {
  return document.dump(indent, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

std::string SerializeEntity(const EntityRecord &entity) {
  return DumpJson(EntityToJson(entity));
}

EntityRecord DeserializeEntity(const std::string &key,
                               const std::string &payload) {
  const auto document = ParseDocument(key, payload);
  try {
    return EntityFromJson(document);
  } catch (const nlohmann::json::exception &ex) {
    throw StoreOperationError(key, ex.what());
  } catch (const std::invalid_argument &ex) {
    throw StoreOperationError(key, ex.what());
  }
}

nlohmann::json EmbeddingMetadataToJson(const EmbeddingMetadata &metadata) {
  nlohmann::json document = {
      {"entity_type", EntityTypeName(metadata.entity_type)},
      {"file_path", metadata.file_path},
      {"name", metadata.name},
      {"line_start", metadata.line_start},
      {"line_end", metadata.line_end}};
  PutOptional(document, "parent_class", metadata.parent_class);
  PutOptional(document, "signature", metadata.signature);
  return document;
}

EmbeddingMetadata EmbeddingMetadataFromJson(const nlohmann::json &document) {
  EmbeddingMetadata metadata;
  metadata.entity_type = RequireEntityType(document);
  metadata.file_path = document.at("file_path").get<std::string>();
  metadata.name = document.at("name").get<std::string>();
  metadata.line_start = document.value("line_start", 0);
  metadata.line_end = document.value("line_end", metadata.line_start);
  metadata.parent_class = GetOptional<std::string>(document, "parent_class");
  metadata.signature = GetOptional<std::string>(document, "signature");
  return metadata;
}

EmbeddingMetadata MetadataForEntity(const EntityRecord &entity) {
  EmbeddingMetadata metadata;
  metadata.entity_type = entity.entity_type;
  metadata.file_path = entity.file_path;
  metadata.name = entity.name;
  metadata.parent_class = entity.parent_class;
  metadata.line_start = entity.line_start;
  metadata.line_end = entity.line_end;
  metadata.signature = entity.signature;
  return metadata;
}

std::string SerializeEmbedding(const EmbeddingRecord &record) {
  const nlohmann::json document = {
      {"key", record.key},
      {"vector", record.vector},
      {"provider", record.provider_id},
      {"model", record.model_id},
      {"metadata", EmbeddingMetadataToJson(record.metadata)}};
  return DumpJson(document);
}

EmbeddingRecord DeserializeEmbedding(const std::string &key,
                                     const std::string &payload) {
  const auto document = ParseDocument(key, payload);
  try {
    EmbeddingRecord record;
    record.key = document.value("key", std::string{});
    record.vector = document.at("vector").get<std::vector<float>>();
    record.provider_id = document.value("provider", std::string{});
    record.model_id = document.value("model", std::string{});
    record.metadata = EmbeddingMetadataFromJson(document.at("metadata"));
    return record;
  } catch (const nlohmann::json::exception &ex) {
    throw StoreOperationError(key, ex.what());
  } catch (const std::invalid_argument &ex) {
    throw StoreOperationError(key, ex.what());
  }
}

std::string SerializeFileMetadata(const FileMetadata &metadata) {
  const nlohmann::json document = {{"path", metadata.path},
                                   {"size", metadata.size},
                                   {"last_modified", metadata.last_modified},
                                   {"entity_count", metadata.entity_count}};
  return DumpJson(document);
}

std::string SerializeProjectMetadata(const ProjectMetadata &metadata) {
  const nlohmann::json document = {
      {"name", metadata.name},
      {"path", metadata.path},
      {"last_indexed_at", metadata.last_indexed_at},
      {"total_files", metadata.total_files},
      {"total_entities", metadata.total_entities},
      {"version", metadata.version}};
  return DumpJson(document);
}

ProjectMetadata DeserializeProjectMetadata(const std::string &key,
                                           const std::string &payload) {
  const auto document = ParseDocument(key, payload);
  try {
    ProjectMetadata metadata;
    metadata.name = document.at("name").get<std::string>();
    metadata.path = document.value("path", std::string{});
    metadata.last_indexed_at =
        document.value("last_indexed_at", std::int64_t{0});
    metadata.total_files = document.value("total_files", std::size_t{0});
    metadata.total_entities = document.value("total_entities", std::size_t{0});
    metadata.version = document.value("version", std::string{});
    return metadata;
  } catch (const nlohmann::json::exception &ex) {
    throw StoreOperationError(key, ex.what());
  }
}

} // namespace codemem
