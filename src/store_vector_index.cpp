#include <codemem/store_vector_index.h>

#include <codemem/entity_codec.h>
#include <codemem/errors.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace codemem {

namespace {
bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool MatchesFilters(const EmbeddingMetadata &metadata,
                    const SearchOptions &options) {
  if (options.file_path && metadata.file_path != *options.file_path) {
    return false;
  }
  if (!options.entity_types.empty() &&
      std::find(options.entity_types.begin(), options.entity_types.end(),
                metadata.entity_type) == options.entity_types.end()) {
    return false;
  }
  return true;
}
} // namespace

double CosineSimilarity(const std::vector<float> &lhs,
                        const std::vector<float> &rhs) {
  if (lhs.size() != rhs.size() || lhs.empty()) {
    return 0.0;
  }
  double dot = 0.0;
  double lhs_norm = 0.0;
  double rhs_norm = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += static_cast<double>(lhs[i]) * rhs[i];
    lhs_norm += static_cast<double>(lhs[i]) * lhs[i];
    rhs_norm += static_cast<double>(rhs[i]) * rhs[i];
  }
  if (lhs_norm == 0.0 || rhs_norm == 0.0) {
    return 0.0;
  }
  const auto similarity = dot / (std::sqrt(lhs_norm) * std::sqrt(rhs_norm));
  // Overflowed or NaN components would break the ranking order.
  return std::isfinite(similarity) ? similarity : 0.0;
}

StoreVectorIndex::StoreVectorIndex(std::shared_ptr<StoreClient> store,
                                   ProjectPrefix prefix,
                                   std::shared_ptr<Logger> logger)
    : store_(std::move(store)), prefix_(std::move(prefix)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!store_) {
    throw std::invalid_argument("StoreVectorIndex requires a store client");
  }
}

void StoreVectorIndex::Upsert(const EmbeddingRecord &record) {
  if (!StartsWith(record.key, ProjectScanPrefix(prefix_)) ||
      IsEmbeddingKey(record.key)) {
    throw StoreOperationError(record.key,
                              "Embedding key is not an entity key under " +
                                  prefix_.value());
  }
  store_->Set(EmbeddingKey(record.key), SerializeEmbedding(record));
}

std::vector<std::string>
StoreVectorIndex::CandidateKeys(const SearchOptions &options) {
  if (options.entity_types.empty()) {
    return store_->ScanPrefix(ProjectScanPrefix(prefix_));
  }
  std::vector<std::string> keys;
  for (const auto type : options.entity_types) {
    auto scanned = options.file_path
                       ? store_->ScanPrefix(FileEntityScanPrefix(
                             prefix_, type, *options.file_path))
                       : store_->ScanPrefix(EntityTypeScanPrefix(prefix_, type));
    keys.insert(keys.end(), std::make_move_iterator(scanned.begin()),
                std::make_move_iterator(scanned.end()));
  }
  return keys;
}

std::vector<SearchHit> StoreVectorIndex::Search(const std::vector<float> &query,
                                                const SearchOptions &options) {
  if (options.top_k == 0) {
    return {};
  }

  std::vector<SearchHit> hits;
  for (const auto &key : CandidateKeys(options)) {
    if (!IsEmbeddingKey(key)) {
      continue;
    }
    const auto payload = store_->Get(key);
    if (!payload) {
      continue;
    }
    EmbeddingRecord record;
    try {
      record = DeserializeEmbedding(key, *payload);
    } catch (const StoreOperationError &ex) {
      logger_->Log(LogLevel::kWarn, "search.record_unreadable",
                   {{"key", key}, {"error", ex.what()}});
      continue;
    }
    if (!MatchesFilters(record.metadata, options)) {
      continue;
    }
    const auto score = CosineSimilarity(query, record.vector);
    if (options.min_score && score < *options.min_score) {
      continue;
    }
    hits.push_back(
        SearchHit{EntityKeyForEmbedding(key), score, std::move(record.metadata)});
  }

  std::sort(hits.begin(), hits.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.key < rhs.key;
  });
  if (hits.size() > options.top_k) {
    hits.resize(options.top_k);
  }

  logger_->Log(LogLevel::kDebug, "search.complete",
               {{"prefix", prefix_.value()},
                {"results", std::to_string(hits.size())}});
  return hits;
}

std::size_t StoreVectorIndex::Count() {
  const auto keys = store_->ScanPrefix(ProjectScanPrefix(prefix_));
  return static_cast<std::size_t>(
      std::count_if(keys.begin(), keys.end(),
                    [](const auto &key) { return IsEmbeddingKey(key); }));
}

} // namespace codemem
