#pragma once

#include <codemem/backend_registry.h>
#include <codemem/index_writer.h>
#include <codemem/interfaces.h>
#include <codemem/key_scheme.h>
#include <codemem/logging.h>
#include <codemem/vectorization_pipeline.h>

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

inline constexpr const char kCodememVersion[] = "0.1.0";

struct SessionComponents {
  std::shared_ptr<StoreClient> store;
  std::shared_ptr<EntityExtractor> extractor;
  std::shared_ptr<SourceEnumerator> enumerator;
  std::shared_ptr<VectorIndex> vector_index;
  std::shared_ptr<Embedder> embedder;
  // Consulted on first use so that index-only commands never need provider
  // credentials.
  std::function<std::shared_ptr<Embedder>()> embedder_factory;
  std::shared_ptr<Logger> logger;
  std::filesystem::path project_root;
  std::optional<ProjectPrefix> prefix;
  IndexWriterOptions writer_options;
  VectorizeOptions vectorize_options;
  SleepFunction sleep;
};

// Operation surface over one project. The project prefix is fixed when the
// session is built.
class MemorySession {
public:
  explicit MemorySession(SessionComponents components);

  // Clears the project's keys, then indexes every Python file under the
  // project root (or `root`, when given).
  WriteSummary
  Remember(const std::optional<std::filesystem::path> &root = std::nullopt);
  WriteSummary Refresh(const std::vector<std::string> &changed_files);
  ForgetSummary Forget();
  StatusSummary Status();
  // Sorted by file path, then line.
  std::vector<EntityRecord>
  Recall(EntityType type, const std::optional<std::string> &name = std::nullopt);
  VectorizeSummary Vectorize(std::optional<std::size_t> batch_size = std::nullopt,
                             std::optional<bool> dry_run = std::nullopt);
  std::vector<RecallResult> VectorRecall(const std::string &query,
                                         SearchOptions options = {});

  const ProjectPrefix &prefix() const { return prefix_; }
  const std::filesystem::path &project_root() const { return project_root_; }

private:
  std::vector<EntityRecord> LoadEntities(EntityType type);
  std::vector<EntityRecord> LoadAllEntities();
  std::shared_ptr<Embedder> RequireEmbedder();
  void UpdateProjectMetadata();

  std::shared_ptr<StoreClient> store_;
  std::shared_ptr<SourceEnumerator> enumerator_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<Embedder> embedder_;
  std::function<std::shared_ptr<Embedder>()> embedder_factory_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path project_root_;
  ProjectPrefix prefix_;
  VectorizeOptions vectorize_options_;
  SleepFunction sleep_;
  std::unique_ptr<IndexWriter> writer_;
};

class MemorySessionBuilder {
public:
  explicit MemorySessionBuilder(
      const BackendRegistry &registry = GlobalBackendRegistry());

  MemorySessionBuilder &WithStore(std::shared_ptr<StoreClient> store);
  MemorySessionBuilder &WithStoreName(std::string name);
  MemorySessionBuilder &WithEmbedder(std::shared_ptr<Embedder> embedder);
  MemorySessionBuilder &WithEmbedderName(std::string name);
  MemorySessionBuilder &WithBackendSettings(BackendSettings settings);
  MemorySessionBuilder &
  WithExtractor(std::shared_ptr<EntityExtractor> extractor);
  MemorySessionBuilder &
  WithEnumerator(std::shared_ptr<SourceEnumerator> enumerator);
  MemorySessionBuilder &WithLogger(std::shared_ptr<Logger> logger);
  MemorySessionBuilder &WithProjectRoot(std::filesystem::path root);
  MemorySessionBuilder &WithProjectName(std::string name);
  MemorySessionBuilder &WithIgnoredPaths(std::vector<std::string> paths);
  MemorySessionBuilder &WithIndexWriterOptions(IndexWriterOptions options);
  MemorySessionBuilder &WithVectorizeOptions(VectorizeOptions options);
  // Mutations are described on `output` instead of being performed.
  MemorySessionBuilder &WithDescriptiveOutput(std::ostream &output);
  MemorySessionBuilder &WithSleep(SleepFunction sleep);

  MemorySession Build();

private:
  const BackendRegistry *registry_;
  struct BackendSelections {
    std::string store;
    std::string embedder;
  } selections_;
  BackendSettings settings_;
  std::optional<std::string> project_name_;
  std::vector<std::string> ignored_paths_;
  std::ostream *descriptive_output_ = nullptr;
  SessionComponents components_;
};

} // namespace codemem
