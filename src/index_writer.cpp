#include <codemem/index_writer.h>

#include <codemem/entity_codec.h>
#include <codemem/errors.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <utility>

namespace codemem {

namespace {
std::optional<std::string> ReadSource(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << stream.rdbuf();
  return content.str();
}

std::int64_t ToUnixSeconds(std::filesystem::file_time_type time) {
  const auto system_time = std::chrono::time_point_cast<
      std::chrono::system_clock::duration>(
      time - std::filesystem::file_time_type::clock::now() +
      std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::seconds>(
             system_time.time_since_epoch())
      .count();
}

std::optional<FileMetadata> DescribeFile(const SourceFile &file,
                                         std::size_t entity_count) {
  std::error_code error;
  const auto size = std::filesystem::file_size(file.absolute_path, error);
  if (error) {
    return std::nullopt;
  }
  const auto modified =
      std::filesystem::last_write_time(file.absolute_path, error);
  if (error) {
    return std::nullopt;
  }
  FileMetadata metadata;
  metadata.path = file.relative_path;
  metadata.size = size;
  metadata.last_modified = ToUnixSeconds(modified);
  metadata.entity_count = entity_count;
  return metadata;
}
} // namespace

void MergeSummary(WriteSummary &target, const WriteSummary &source) {
  target.entities_written += source.entities_written;
  target.entities_failed += source.entities_failed;
  target.files_written += source.files_written;
  target.files_failed += source.files_failed;
  target.files_skipped += source.files_skipped;
  target.files_removed += source.files_removed;
  target.failed_keys.insert(target.failed_keys.end(),
                            source.failed_keys.begin(),
                            source.failed_keys.end());
  target.failed_files.insert(target.failed_files.end(),
                             source.failed_files.begin(),
                             source.failed_files.end());
}

IndexWriter::IndexWriter(std::shared_ptr<StoreClient> store,
                         std::shared_ptr<EntityExtractor> extractor,
                         ProjectPrefix prefix, IndexWriterOptions options,
                         std::shared_ptr<Logger> logger)
    : store_(std::move(store)), extractor_(std::move(extractor)),
      prefix_(std::move(prefix)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {
  if (!store_) {
    throw std::invalid_argument("IndexWriter requires a store client");
  }
  if (options_.max_parallel_files == 0) {
    options_.max_parallel_files = 1;
  }
}

WriteSummary IndexWriter::Write(const std::vector<EntityRecord> &entities) {
  std::map<std::string, std::vector<EntityRecord>> by_file;
  for (const auto &entity : entities) {
    by_file[entity.file_path].push_back(entity);
  }

  WriteSummary summary;
  for (const auto &[file_path, file_entities] : by_file) {
    MergeSummary(summary, WriteFile(file_path, file_entities, std::nullopt));
  }
  return summary;
}

WriteSummary IndexWriter::WriteFile(const std::string &file_path,
                                    const std::vector<EntityRecord> &entities,
                                    const std::optional<FileMetadata> &metadata) {
  WriteSummary summary;
  std::vector<std::string> kept_keys;
  kept_keys.reserve(entities.size());

  for (const auto &entity : entities) {
    const auto key = ComputeKey(prefix_, entity);
    kept_keys.push_back(key);
    std::string error;
    try {
      store_->Set(key, SerializeEntity(entity));
      ++summary.entities_written;
      progress_.entities_written.fetch_add(1, std::memory_order_relaxed);
      continue;
    } catch (const StoreOperationError &ex) {
      error = ex.what();
    } catch (const nlohmann::json::exception &ex) {
      error = ex.what();
    }
    ++summary.entities_failed;
    summary.failed_keys.push_back(key);
    progress_.entities_failed.fetch_add(1, std::memory_order_relaxed);
    logger_->Log(LogLevel::kWarn, "index.entity_failed",
                 {{"key", key}, {"error", error}});
  }

  bool file_ok = summary.entities_failed == 0;
  try {
    if (file_ok) {
      const auto removed = RemoveStaleKeys(file_path, kept_keys);
      if (removed > 0) {
        logger_->Log(LogLevel::kDebug, "index.stale_removed",
                     {{"file", file_path}, {"keys", std::to_string(removed)}});
      }
      if (metadata) {
        store_->Set(FileMetadataKey(prefix_, file_path),
                    SerializeFileMetadata(*metadata));
      }
      store_->SetAdd(ProcessedFilesKey(prefix_), file_path);
    } else {
      // A partially rewritten file must not stay listed as indexed.
      store_->SetRemove(ProcessedFilesKey(prefix_), file_path);
    }
  } catch (const StoreOperationError &ex) {
    logger_->Log(LogLevel::kWarn, "index.file_bookkeeping_failed",
                 {{"file", file_path}, {"error", ex.what()}});
    if (file_ok) {
      file_ok = false;
      try {
        store_->SetRemove(ProcessedFilesKey(prefix_), file_path);
      } catch (const StoreOperationError &unlist) {
        logger_->Log(LogLevel::kError, "index.file_unlist_failed",
                     {{"file", file_path}, {"error", unlist.what()}});
      }
    }
  }

  if (file_ok) {
    ++summary.files_written;
  } else {
    ++summary.files_failed;
    summary.failed_files.push_back(file_path);
  }
  return summary;
}

std::size_t
IndexWriter::RemoveStaleKeys(const std::string &file_path,
                             const std::vector<std::string> &kept_keys) {
  std::set<std::string> kept;
  for (const auto &key : kept_keys) {
    kept.insert(key);
    kept.insert(EmbeddingKey(key));
  }

  std::size_t removed = 0;
  for (const auto type : AllEntityTypes()) {
    for (const auto &key :
         store_->ScanPrefix(FileEntityScanPrefix(prefix_, type, file_path))) {
      if (kept.count(key) != 0) {
        continue;
      }
      if (store_->Delete(key)) {
        ++removed;
      }
    }
  }
  return removed;
}

WriteSummary IndexWriter::IndexFile(const SourceFile &file) {
  WriteSummary summary;
  const auto content = ReadSource(file.absolute_path);
  if (!content) {
    ++summary.files_skipped;
    summary.failed_files.push_back(file.relative_path);
    logger_->Log(LogLevel::kWarn, "index.file_unreadable",
                 {{"file", file.relative_path}});
    return summary;
  }

  ExtractionResult extraction;
  try {
    extraction = extractor_->Extract(*content, file.relative_path);
  } catch (const ParseFailure &ex) {
    ++summary.files_skipped;
    summary.failed_files.push_back(file.relative_path);
    logger_->Log(LogLevel::kWarn, "index.parse_failed",
                 {{"file", ex.file_path()}, {"reason", ex.reason()}});
    return summary;
  }

  return WriteFile(file.relative_path, extraction.entities,
                   DescribeFile(file, extraction.entities.size()));
}

WriteSummary IndexWriter::IndexFiles(const std::vector<SourceFile> &files) {
  if (!extractor_) {
    throw std::invalid_argument("IndexWriter has no entity extractor");
  }

  const auto workers = std::min(options_.max_parallel_files,
                                std::max<std::size_t>(files.size(), 1));
  logger_->Log(LogLevel::kInfo, "index.start",
               {{"prefix", prefix_.value()},
                {"files", std::to_string(files.size())},
                {"workers", std::to_string(workers)}});

  std::atomic<std::size_t> next{0};
  std::atomic<bool> stop{false};
  std::mutex summary_mutex;
  WriteSummary summary;

  auto worker = [&]() {
    while (!stop.load(std::memory_order_relaxed)) {
      const auto index = next.fetch_add(1);
      if (index >= files.size()) {
        break;
      }
      progress_.files_started.fetch_add(1, std::memory_order_relaxed);
      try {
        const auto outcome = IndexFile(files[index]);
        std::lock_guard<std::mutex> lock(summary_mutex);
        MergeSummary(summary, outcome);
      } catch (const StoreConnectionError &) {
        stop.store(true, std::memory_order_relaxed);
        throw;
      }
      progress_.files_completed.fetch_add(1, std::memory_order_relaxed);
    }
  };

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }

  std::exception_ptr failure;
  for (auto &future : futures) {
    try {
      future.get();
    } catch (const StoreConnectionError &) {
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }
  if (failure) {
    logger_->Log(LogLevel::kError, "index.aborted",
                 {{"files_completed",
                   std::to_string(progress_.files_completed.load())}});
    std::rethrow_exception(failure);
  }

  logger_->Log(LogLevel::kInfo, "index.complete",
               {{"files_written", std::to_string(summary.files_written)},
                {"files_failed", std::to_string(summary.files_failed)},
                {"files_skipped", std::to_string(summary.files_skipped)},
                {"entities_written", std::to_string(summary.entities_written)},
                {"entities_failed", std::to_string(summary.entities_failed)}});
  return summary;
}

WriteSummary IndexWriter::RemoveFile(const std::string &file_path) {
  WriteSummary summary;
  try {
    RemoveStaleKeys(file_path, {});
    store_->Delete(FileMetadataKey(prefix_, file_path));
    store_->SetRemove(ProcessedFilesKey(prefix_), file_path);
    ++summary.files_removed;
    logger_->Log(LogLevel::kInfo, "index.file_removed", {{"file", file_path}});
  } catch (const StoreOperationError &ex) {
    ++summary.files_failed;
    summary.failed_files.push_back(file_path);
    logger_->Log(LogLevel::kWarn, "index.file_remove_failed",
                 {{"file", file_path}, {"error", ex.what()}});
  }
  return summary;
}

WriteSummary
IndexWriter::Refresh(const std::vector<SourceFile> &changed_files) {
  std::vector<SourceFile> present;
  WriteSummary removed;
  for (const auto &file : changed_files) {
    if (std::filesystem::is_regular_file(file.absolute_path)) {
      present.push_back(file);
    } else {
      MergeSummary(removed, RemoveFile(file.relative_path));
    }
  }

  auto summary = IndexFiles(present);
  MergeSummary(summary, removed);
  return summary;
}

ForgetSummary IndexWriter::Forget() {
  ForgetSummary summary;
  for (const auto &key : store_->ScanPrefix(ProjectScanPrefix(prefix_))) {
    try {
      if (store_->Delete(key)) {
        ++summary.keys_deleted;
      }
    } catch (const StoreOperationError &ex) {
      ++summary.keys_failed;
      logger_->Log(LogLevel::kWarn, "forget.key_failed",
                   {{"key", key}, {"error", ex.what()}});
    }
  }
  logger_->Log(LogLevel::kInfo, "forget.complete",
               {{"prefix", prefix_.value()},
                {"deleted", std::to_string(summary.keys_deleted)},
                {"failed", std::to_string(summary.keys_failed)}});
  return summary;
}

void IndexWriter::WriteProjectMetadata(const ProjectMetadata &metadata) {
  store_->Set(ProjectMetadataKey(prefix_), SerializeProjectMetadata(metadata));
}

} // namespace codemem
