#pragma once

#include <codemem/interfaces.h>
#include <codemem/key_scheme.h>
#include <codemem/logging.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace codemem {

struct VectorizeOptions {
  std::size_t batch_size = 10;
  bool dry_run = false;
  // Attempts per batch while the provider reports rate limiting.
  std::size_t max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// Text handed to the embedder for one entity.
std::string EmbeddingText(const EntityRecord &entity);

// Embeds entities batch by batch and upserts one vector per entity. A failed
// batch is counted and the run moves on to the next one.
class VectorizationPipeline {
public:
  VectorizationPipeline(std::shared_ptr<Embedder> embedder,
                        std::shared_ptr<VectorIndex> index,
                        ProjectPrefix prefix, VectorizeOptions options = {},
                        std::shared_ptr<Logger> logger = nullptr,
                        SleepFunction sleep = nullptr);

  VectorizeSummary Run(const std::vector<EntityRecord> &entities);

private:
  std::vector<std::vector<float>>
  EmbedWithRetry(const std::vector<std::string> &texts);
  void ProcessBatch(const std::vector<EntityRecord> &batch,
                    VectorizeSummary &summary);
  void ProcessItemByItem(const std::vector<EntityRecord> &batch,
                         VectorizeSummary &summary);
  bool UpsertOne(const EntityRecord &entity, std::vector<float> vector);

  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorIndex> index_;
  ProjectPrefix prefix_;
  VectorizeOptions options_;
  std::shared_ptr<Logger> logger_;
  SleepFunction sleep_;
};

} // namespace codemem
