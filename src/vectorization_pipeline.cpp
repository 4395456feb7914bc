#include <codemem/vectorization_pipeline.h>

#include <codemem/entity_codec.h>
#include <codemem/errors.h>

#include <algorithm>
#include <thread>
#include <utility>

namespace codemem {

namespace {
std::vector<std::string> TextsFor(const std::vector<EntityRecord> &batch) {
  std::vector<std::string> texts;
  texts.reserve(batch.size());
  for (const auto &entity : batch) {
    texts.push_back(EmbeddingText(entity));
  }
  return texts;
}

std::size_t BatchCount(std::size_t entities, std::size_t batch_size) {
  return (entities + batch_size - 1) / batch_size;
}
} // namespace

std::string EmbeddingText(const EntityRecord &entity) {
  std::string text = EntityTypeName(entity.entity_type) + " ";
  if (entity.parent_class) {
    text += *entity.parent_class + ".";
  }
  text += entity.name;
  if (entity.signature) {
    text += "\n" + *entity.signature;
  }
  if (entity.bases && !entity.bases->empty()) {
    text += "\nbases:";
    for (const auto &base : *entity.bases) {
      text += " " + base;
    }
  }
  if (entity.value_repr) {
    text += "\n= " + *entity.value_repr;
  }
  if (entity.docstring) {
    text += "\n" + *entity.docstring;
  }
  text += "\nfile: " + entity.file_path;
  return text;
}

VectorizationPipeline::VectorizationPipeline(
    std::shared_ptr<Embedder> embedder, std::shared_ptr<VectorIndex> index,
    ProjectPrefix prefix, VectorizeOptions options,
    std::shared_ptr<Logger> logger, SleepFunction sleep)
    : embedder_(std::move(embedder)), index_(std::move(index)),
      prefix_(std::move(prefix)), options_(options),
      logger_(EnsureLogger(std::move(logger))), sleep_(std::move(sleep)) {
  if (options_.batch_size == 0) {
    throw ConfigurationError("Batch size must be positive");
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

VectorizeSummary
VectorizationPipeline::Run(const std::vector<EntityRecord> &entities) {
  VectorizeSummary summary;
  summary.dry_run = options_.dry_run;
  summary.entities = entities.size();
  const auto batches = BatchCount(entities.size(), options_.batch_size);

  if (options_.dry_run) {
    summary.batches = batches;
    logger_->Log(LogLevel::kInfo, "vectorize.dry_run",
                 {{"entities", std::to_string(entities.size())},
                  {"batches", std::to_string(batches)}});
    return summary;
  }
  if (!embedder_ || !index_) {
    throw std::invalid_argument(
        "VectorizationPipeline requires an embedder and a vector index");
  }

  logger_->Log(LogLevel::kInfo, "vectorize.start",
               {{"prefix", prefix_.value()},
                {"provider", embedder_->ProviderId()},
                {"model", embedder_->ModelId()},
                {"entities", std::to_string(entities.size())},
                {"batches", std::to_string(batches)}});

  for (std::size_t start = 0; start < entities.size();
       start += options_.batch_size) {
    const auto end = std::min(entities.size(), start + options_.batch_size);
    const std::vector<EntityRecord> batch(
        entities.begin() + static_cast<std::ptrdiff_t>(start),
        entities.begin() + static_cast<std::ptrdiff_t>(end));
    ++summary.batches;
    ProcessBatch(batch, summary);
  }

  logger_->Log(LogLevel::kInfo, "vectorize.complete",
               {{"indexed", std::to_string(summary.indexed)},
                {"failed", std::to_string(summary.failed)},
                {"failed_batches", std::to_string(summary.failed_batches)}});
  return summary;
}

std::vector<std::vector<float>>
VectorizationPipeline::EmbedWithRetry(const std::vector<std::string> &texts) {
  auto backoff = options_.initial_backoff;
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto vectors = embedder_->Embed(texts);
      if (vectors.size() != texts.size()) {
        throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                         "Embedder returned " + std::to_string(vectors.size()) +
                             " vectors for " + std::to_string(texts.size()) +
                             " inputs");
      }
      return vectors;
    } catch (const EmbedError &ex) {
      if (ex.kind() != EmbedErrorKind::kRateLimited ||
          attempt >= options_.max_attempts) {
        throw;
      }
      logger_->Log(LogLevel::kWarn, "vectorize.rate_limited",
                   {{"attempt", std::to_string(attempt)},
                    {"backoff_ms", std::to_string(backoff.count())}});
      sleep_(backoff);
      backoff *= 2;
    }
  }
}

bool VectorizationPipeline::UpsertOne(const EntityRecord &entity,
                                      std::vector<float> vector) {
  EmbeddingRecord record;
  record.key = ComputeKey(prefix_, entity);
  record.vector = std::move(vector);
  record.provider_id = embedder_->ProviderId();
  record.model_id = embedder_->ModelId();
  record.metadata = MetadataForEntity(entity);
  try {
    index_->Upsert(record);
    return true;
  } catch (const StoreOperationError &ex) {
    logger_->Log(LogLevel::kWarn, "vectorize.upsert_failed",
                 {{"key", record.key}, {"error", ex.what()}});
    return false;
  }
}

void VectorizationPipeline::ProcessBatch(const std::vector<EntityRecord> &batch,
                                         VectorizeSummary &summary) {
  std::vector<std::vector<float>> vectors;
  try {
    vectors = EmbedWithRetry(TextsFor(batch));
  } catch (const EmbedError &ex) {
    if (ex.kind() == EmbedErrorKind::kInvalidInput) {
      logger_->Log(LogLevel::kWarn, "vectorize.batch_fallback",
                   {{"batch", std::to_string(summary.batches)},
                    {"error", ex.what()}});
      ProcessItemByItem(batch, summary);
      return;
    }
    ++summary.failed_batches;
    summary.failed += batch.size();
    logger_->Log(LogLevel::kError, "vectorize.batch_failed",
                 {{"batch", std::to_string(summary.batches)},
                  {"kind", EmbedErrorKindName(ex.kind())},
                  {"error", ex.what()}});
    return;
  }

  for (std::size_t i = 0; i < batch.size(); ++i) {
    if (UpsertOne(batch[i], std::move(vectors[i]))) {
      ++summary.indexed;
    } else {
      ++summary.failed;
    }
  }
}

void VectorizationPipeline::ProcessItemByItem(
    const std::vector<EntityRecord> &batch, VectorizeSummary &summary) {
  std::size_t indexed = 0;
  for (const auto &entity : batch) {
    try {
      auto vectors = EmbedWithRetry({EmbeddingText(entity)});
      if (UpsertOne(entity, std::move(vectors.front()))) {
        ++indexed;
        continue;
      }
    } catch (const EmbedError &ex) {
      logger_->Log(LogLevel::kWarn, "vectorize.item_failed",
                   {{"key", ComputeKey(prefix_, entity)},
                    {"kind", EmbedErrorKindName(ex.kind())},
                    {"error", ex.what()}});
    }
    ++summary.failed;
  }
  summary.indexed += indexed;
  if (indexed == 0 && !batch.empty()) {
    ++summary.failed_batches;
  }
}

} // namespace codemem
