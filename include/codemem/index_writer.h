#pragma once

#include <codemem/interfaces.h>
#include <codemem/key_scheme.h>
#include <codemem/logging.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

struct IndexWriterOptions {
  std::size_t max_parallel_files = 4;
};

struct IndexProgress {
  std::atomic<std::size_t> files_started{0};
  std::atomic<std::size_t> files_completed{0};
  std::atomic<std::size_t> entities_written{0};
  std::atomic<std::size_t> entities_failed{0};
};

// Persists extracted entities under the session prefix. A file joins the
// processed-file set only after all of its entities were written.
class IndexWriter {
public:
  IndexWriter(std::shared_ptr<StoreClient> store,
              std::shared_ptr<EntityExtractor> extractor, ProjectPrefix prefix,
              IndexWriterOptions options = {},
              std::shared_ptr<Logger> logger = nullptr);

  // Upserts already extracted entities, grouped by file.
  WriteSummary Write(const std::vector<EntityRecord> &entities);

  // Reads, extracts and writes every file with bounded parallelism.
  WriteSummary IndexFiles(const std::vector<SourceFile> &files);

  // Re-indexes only the listed files; listed files that no longer exist are
  // dropped from the index.
  WriteSummary Refresh(const std::vector<SourceFile> &changed_files);

  ForgetSummary Forget();

  void WriteProjectMetadata(const ProjectMetadata &metadata);

  const ProjectPrefix &prefix() const { return prefix_; }
  const IndexProgress &progress() const { return progress_; }

private:
  WriteSummary WriteFile(const std::string &file_path,
                         const std::vector<EntityRecord> &entities,
                         const std::optional<FileMetadata> &metadata);
  WriteSummary IndexFile(const SourceFile &file);
  WriteSummary RemoveFile(const std::string &file_path);
  std::size_t RemoveStaleKeys(const std::string &file_path,
                              const std::vector<std::string> &kept_keys);

  std::shared_ptr<StoreClient> store_;
  std::shared_ptr<EntityExtractor> extractor_;
  ProjectPrefix prefix_;
  IndexWriterOptions options_;
  std::shared_ptr<Logger> logger_;
  IndexProgress progress_;
};

void MergeSummary(WriteSummary &target, const WriteSummary &source);

} // namespace codemem
