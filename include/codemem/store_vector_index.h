#pragma once

#include <codemem/interfaces.h>
#include <codemem/key_scheme.h>
#include <codemem/logging.h>

#include <memory>
#include <vector>

namespace codemem {

// Cosine similarity in [-1, 1]; 0 when the dimensions differ or either vector
// has zero norm.
double CosineSimilarity(const std::vector<float> &lhs,
                        const std::vector<float> &rhs);

// Vector collection kept in the same store as the entities, one record per
// `{entity key}#embedding` slot. Search is an exhaustive scan of the
// project's slots.
class StoreVectorIndex : public VectorIndex {
public:
  StoreVectorIndex(std::shared_ptr<StoreClient> store, ProjectPrefix prefix,
                   std::shared_ptr<Logger> logger = nullptr);

  // Throws StoreOperationError when the record key is outside the prefix.
  void Upsert(const EmbeddingRecord &record) override;
  std::vector<SearchHit> Search(const std::vector<float> &query,
                                const SearchOptions &options) override;
  std::size_t Count() override;

private:
  std::vector<std::string> CandidateKeys(const SearchOptions &options);

  std::shared_ptr<StoreClient> store_;
  ProjectPrefix prefix_;
  std::shared_ptr<Logger> logger_;
};

} // namespace codemem
