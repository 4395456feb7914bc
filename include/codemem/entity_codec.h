#pragma once

#include <codemem/models.h>

#include <nlohmann/json.hpp>

#include <string>

namespace codemem {

// Source text is not guaranteed to be UTF-8; invalid sequences are written
// as U+FFFD instead of failing the whole document.
std::string DumpJson(const nlohmann::json &document, int indent = -1);

nlohmann::json EntityToJson(const EntityRecord &entity);
EntityRecord EntityFromJson(const nlohmann::json &document);

std::string SerializeEntity(const EntityRecord &entity);
// Throws StoreOperationError naming `key` when the stored value is not an
// entity document.
EntityRecord DeserializeEntity(const std::string &key,
                               const std::string &payload);

nlohmann::json EmbeddingMetadataToJson(const EmbeddingMetadata &metadata);
EmbeddingMetadata EmbeddingMetadataFromJson(const nlohmann::json &document);
EmbeddingMetadata MetadataForEntity(const EntityRecord &entity);

std::string SerializeEmbedding(const EmbeddingRecord &record);
EmbeddingRecord DeserializeEmbedding(const std::string &key,
                                     const std::string &payload);

std::string SerializeFileMetadata(const FileMetadata &metadata);
std::string SerializeProjectMetadata(const ProjectMetadata &metadata);
ProjectMetadata DeserializeProjectMetadata(const std::string &key,
                                           const std::string &payload);

} // namespace codemem
