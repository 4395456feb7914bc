#pragma once

#include <codemem/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

enum class StoreValueType { kNone, kString, kSet, kOther };

// Key-value capability the index is persisted through. Implementations are
// shared between worker threads and must serialise their own access.
class StoreClient {
public:
  virtual ~StoreClient() = default;
  virtual std::optional<std::string> Get(const std::string &key) = 0;
  virtual void Set(const std::string &key, const std::string &value) = 0;
  virtual void SetAdd(const std::string &key, const std::string &member) = 0;
  virtual void SetRemove(const std::string &key,
                         const std::string &member) = 0;
  virtual std::vector<std::string> SetMembers(const std::string &key) = 0;
  virtual StoreValueType TypeOf(const std::string &key) = 0;
  virtual bool Delete(const std::string &key) = 0;
  virtual std::vector<std::string> ScanPrefix(const std::string &prefix) = 0;
};

class EntityExtractor {
public:
  virtual ~EntityExtractor() = default;
  virtual ExtractionResult Extract(const std::string &content,
                                   const std::string &file_path) = 0;
};

class SourceEnumerator {
public:
  virtual ~SourceEnumerator() = default;
  virtual SourceEnumerationResult
  Enumerate(const std::filesystem::path &root) = 0;
};

class Embedder {
public:
  virtual ~Embedder() = default;
  // One vector per input, in input order.
  virtual std::vector<std::vector<float>>
  Embed(const std::vector<std::string> &batch) = 0;
  virtual std::string ProviderId() const = 0;
  virtual std::string ModelId() const = 0;
};

class VectorIndex {
public:
  virtual ~VectorIndex() = default;
  virtual void Upsert(const EmbeddingRecord &record) = 0;
  virtual std::vector<SearchHit> Search(const std::vector<float> &query,
                                        const SearchOptions &options) = 0;
  virtual std::size_t Count() = 0;
};

class CredentialSource {
public:
  virtual ~CredentialSource() = default;
  virtual std::optional<std::string> Lookup(const std::string &name) const = 0;
};

class EnvironmentCredentialSource : public CredentialSource {
public:
  std::optional<std::string> Lookup(const std::string &name) const override;
};

} // namespace codemem
