#include <codemem/memory_session.h>

#include <codemem/descriptive_store_client.h>
#include <codemem/entity_codec.h>
#include <codemem/errors.h>
#include <codemem/python_entity_extractor.h>
#include <codemem/python_source_enumerator.h>
#include <codemem/store_vector_index.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace codemem {

namespace {
std::int64_t NowUnixSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

long long ElapsedMilliseconds(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

std::filesystem::path ResolveProjectRoot(const std::filesystem::path &root) {
  return std::filesystem::weakly_canonical(
      root.empty() ? std::filesystem::current_path() : root);
}
} // namespace

MemorySession::MemorySession(SessionComponents components)
    : store_(std::move(components.store)),
      enumerator_(std::move(components.enumerator)),
      vector_index_(std::move(components.vector_index)),
      embedder_(std::move(components.embedder)),
      embedder_factory_(std::move(components.embedder_factory)),
      logger_(EnsureLogger(std::move(components.logger))),
      project_root_(ResolveProjectRoot(components.project_root)),
      prefix_(components.prefix
                  ? *components.prefix
                  : ProjectPrefix::FromProjectRoot(project_root_)),
      vectorize_options_(components.vectorize_options),
      sleep_(std::move(components.sleep)) {
  if (!store_) {
    throw std::invalid_argument("MemorySession requires a store client");
  }
  if (!enumerator_) {
    enumerator_ = std::make_shared<PythonSourceEnumerator>(
        SourceEnumeratorOptions{}, logger_);
  }
  if (!vector_index_) {
    vector_index_ = std::make_shared<StoreVectorIndex>(store_, prefix_, logger_);
  }
  auto extractor = components.extractor
                       ? std::move(components.extractor)
                       : std::make_shared<PythonEntityExtractor>(logger_);
  writer_ = std::make_unique<IndexWriter>(store_, std::move(extractor), prefix_,
                                          components.writer_options, logger_);
}

WriteSummary
MemorySession::Remember(const std::optional<std::filesystem::path> &root) {
  const auto started = std::chrono::steady_clock::now();
  const auto target = root ? std::filesystem::weakly_canonical(*root)
                           : project_root_;
  logger_->Log(LogLevel::kInfo, "remember.start",
               {{"root", target.string()}, {"prefix", prefix_.value()}});

  const auto sources = enumerator_->Enumerate(target);
  const auto cleared = writer_->Forget();
  logger_->Log(LogLevel::kDebug, "remember.stage.complete",
               {{"stage", "forget"},
                {"keys", std::to_string(cleared.keys_deleted)}});

  auto summary = writer_->IndexFiles(sources.files);
  logger_->Log(LogLevel::kDebug, "remember.stage.complete",
               {{"stage", "index"},
                {"files", std::to_string(summary.files_written)}});

  ProjectMetadata metadata;
  metadata.name = prefix_.project_name();
  metadata.path = sources.project_root;
  metadata.last_indexed_at = NowUnixSeconds();
  metadata.total_files = summary.files_written;
  metadata.total_entities = summary.entities_written;
  metadata.version = kCodememVersion;
  writer_->WriteProjectMetadata(metadata);

  logger_->Log(LogLevel::kInfo, "remember.complete",
               {{"duration_ms", std::to_string(ElapsedMilliseconds(started))},
                {"failures", std::to_string(summary.FailureCount())}});
  return summary;
}

WriteSummary
MemorySession::Refresh(const std::vector<std::string> &changed_files) {
  const auto started = std::chrono::steady_clock::now();
  const auto sources = ResolveNamedSources(project_root_, changed_files);
  logger_->Log(LogLevel::kInfo, "refresh.start",
               {{"requested", std::to_string(changed_files.size())},
                {"files", std::to_string(sources.size())}});

  auto summary = writer_->Refresh(sources);
  UpdateProjectMetadata();

  logger_->Log(LogLevel::kInfo, "refresh.complete",
               {{"duration_ms", std::to_string(ElapsedMilliseconds(started))},
                {"failures", std::to_string(summary.FailureCount())}});
  return summary;
}

ForgetSummary MemorySession::Forget() { return writer_->Forget(); }

StatusSummary MemorySession::Status() {
  StatusSummary status;
  status.files = store_->SetMembers(ProcessedFilesKey(prefix_));
  std::sort(status.files.begin(), status.files.end());
  status.file_count = status.files.size();

  for (const auto type : AllEntityTypes()) {
    std::size_t count = 0;
    for (const auto &key : store_->ScanPrefix(EntityTypeScanPrefix(prefix_, type))) {
      if (IsEmbeddingKey(key)) {
        ++status.embedding_count;
      } else {
        ++count;
      }
    }
    switch (type) {
    case EntityType::kFunction:
      status.function_count = count;
      break;
    case EntityType::kClass:
      status.class_count = count;
      break;
    case EntityType::kMethod:
      status.method_count = count;
      break;
    case EntityType::kVariable:
      status.variable_count = count;
      break;
    }
    status.entity_count += count;
  }
  return status;
}

std::vector<EntityRecord> MemorySession::LoadEntities(EntityType type) {
  std::vector<EntityRecord> entities;
  for (const auto &key : store_->ScanPrefix(EntityTypeScanPrefix(prefix_, type))) {
    if (IsEmbeddingKey(key)) {
      continue;
    }
    const auto payload = store_->Get(key);
    if (!payload) {
      continue;
    }
    try {
      entities.push_back(DeserializeEntity(key, *payload));
    } catch (const StoreOperationError &ex) {
      logger_->Log(LogLevel::kWarn, "recall.record_unreadable",
                   {{"key", key}, {"error", ex.what()}});
    }
  }
  return entities;
}

std::vector<EntityRecord> MemorySession::LoadAllEntities() {
  std::vector<EntityRecord> entities;
  for (const auto type : AllEntityTypes()) {
    auto loaded = LoadEntities(type);
    entities.insert(entities.end(), std::make_move_iterator(loaded.begin()),
                    std::make_move_iterator(loaded.end()));
  }
  return entities;
}

std::vector<EntityRecord>
MemorySession::Recall(EntityType type, const std::optional<std::string> &name) {
  auto entities = LoadEntities(type);
  if (name) {
    entities.erase(std::remove_if(entities.begin(), entities.end(),
                                  [&](const auto &entity) {
                                    return entity.name != *name;
                                  }),
                   entities.end());
  }
  std::sort(entities.begin(), entities.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.file_path != rhs.file_path) {
                return lhs.file_path < rhs.file_path;
              }
              if (lhs.line_start != rhs.line_start) {
                return lhs.line_start < rhs.line_start;
              }
              return lhs.name < rhs.name;
            });
  logger_->Log(LogLevel::kDebug, "recall.complete",
               {{"type", EntityTypeName(type)},
                {"results", std::to_string(entities.size())}});
  return entities;
}

std::shared_ptr<Embedder> MemorySession::RequireEmbedder() {
  if (!embedder_ && embedder_factory_) {
    embedder_ = embedder_factory_();
  }
  if (!embedder_) {
    throw ConfigurationError("No embedding provider configured");
  }
  return embedder_;
}

VectorizeSummary MemorySession::Vectorize(std::optional<std::size_t> batch_size,
                                          std::optional<bool> dry_run) {
  auto options = vectorize_options_;
  if (batch_size) {
    options.batch_size = *batch_size;
  }
  if (dry_run) {
    options.dry_run = *dry_run;
  }

  auto entities = LoadAllEntities();
  std::sort(entities.begin(), entities.end(),
            [this](const auto &lhs, const auto &rhs) {
              return ComputeKey(prefix_, lhs) < ComputeKey(prefix_, rhs);
            });

  auto embedder = options.dry_run ? embedder_ : RequireEmbedder();
  VectorizationPipeline pipeline(std::move(embedder), vector_index_, prefix_,
                                 options, logger_, sleep_);
  return pipeline.Run(entities);
}

std::vector<RecallResult> MemorySession::VectorRecall(const std::string &query,
                                                      SearchOptions options) {
  if (query.empty()) {
    throw ConfigurationError("Vector recall requires a non-empty query");
  }
  const auto embedder = RequireEmbedder();
  const auto vectors = embedder->Embed({query});
  if (vectors.size() != 1) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     "Embedder returned no vector for the query");
  }

  std::vector<RecallResult> results;
  for (auto &hit : vector_index_->Search(vectors.front(), options)) {
    const auto payload = store_->Get(hit.key);
    if (!payload) {
      logger_->Log(LogLevel::kWarn, "vector_recall.entity_missing",
                   {{"key", hit.key}});
      continue;
    }
    try {
      results.push_back(RecallResult{DeserializeEntity(hit.key, *payload),
                                     hit.score});
    } catch (const StoreOperationError &ex) {
      logger_->Log(LogLevel::kWarn, "vector_recall.record_unreadable",
                   {{"key", hit.key}, {"error", ex.what()}});
    }
  }
  logger_->Log(LogLevel::kInfo, "vector_recall.complete",
               {{"provider", embedder->ProviderId()},
                {"results", std::to_string(results.size())}});
  return results;
}

void MemorySession::UpdateProjectMetadata() {
  ProjectMetadata metadata;
  const auto key = ProjectMetadataKey(prefix_);
  if (const auto payload = store_->Get(key)) {
    try {
      metadata = DeserializeProjectMetadata(key, *payload);
    } catch (const StoreOperationError &ex) {
      logger_->Log(LogLevel::kWarn, "metadata.unreadable",
                   {{"key", key}, {"error", ex.what()}});
    }
  }
  const auto status = Status();
  metadata.name = prefix_.project_name();
  metadata.path = project_root_.string();
  metadata.last_indexed_at = NowUnixSeconds();
  metadata.total_files = status.file_count;
  metadata.total_entities = status.entity_count;
  metadata.version = kCodememVersion;
  writer_->WriteProjectMetadata(metadata);
}

MemorySessionBuilder::MemorySessionBuilder(const BackendRegistry &registry)
    : registry_(&registry) {
  selections_.store = registry_->DefaultStoreName();
  selections_.embedder = registry_->DefaultEmbedderName();
}

MemorySessionBuilder &
MemorySessionBuilder::WithStore(std::shared_ptr<StoreClient> store) {
  components_.store = std::move(store);
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithStoreName(std::string name) {
  selections_.store = std::move(name);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithEmbedder(std::shared_ptr<Embedder> embedder) {
  components_.embedder = std::move(embedder);
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithEmbedderName(std::string name) {
  selections_.embedder = std::move(name);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithBackendSettings(BackendSettings settings) {
  settings_ = std::move(settings);
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithExtractor(
    std::shared_ptr<EntityExtractor> extractor) {
  components_.extractor = std::move(extractor);
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithEnumerator(
    std::shared_ptr<SourceEnumerator> enumerator) {
  components_.enumerator = std::move(enumerator);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithProjectRoot(std::filesystem::path root) {
  components_.project_root = std::move(root);
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithProjectName(std::string name) {
  project_name_ = std::move(name);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithIgnoredPaths(std::vector<std::string> paths) {
  ignored_paths_ = std::move(paths);
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithIndexWriterOptions(IndexWriterOptions options) {
  components_.writer_options = options;
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithVectorizeOptions(VectorizeOptions options) {
  components_.vectorize_options = options;
  return *this;
}

MemorySessionBuilder &
MemorySessionBuilder::WithDescriptiveOutput(std::ostream &output) {
  descriptive_output_ = &output;
  return *this;
}

MemorySessionBuilder &MemorySessionBuilder::WithSleep(SleepFunction sleep) {
  components_.sleep = std::move(sleep);
  return *this;
}

MemorySession MemorySessionBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!settings_.logger) {
    settings_.logger = components_.logger;
  }
  if (project_name_) {
    components_.prefix = ProjectPrefix::FromProjectName(*project_name_);
  }

  components_.store = components_.store
                          ? std::move(components_.store)
                          : registry_->CreateStore(selections_.store, settings_);
  if (descriptive_output_ != nullptr) {
    components_.store = std::make_shared<DescriptiveStoreClient>(
        std::move(components_.store), *descriptive_output_,
        components_.logger);
  }

  if (!components_.enumerator) {
    SourceEnumeratorOptions options;
    options.ignored_paths = ignored_paths_;
    components_.enumerator = std::make_shared<PythonSourceEnumerator>(
        std::move(options), components_.logger);
  }

  if (!components_.embedder) {
    components_.embedder_factory = [registry = registry_,
                                    name = selections_.embedder,
                                    settings = settings_]() {
      return registry->CreateEmbedder(name, settings);
    };
  }
  return MemorySession(std::move(components_));
}

} // namespace codemem
