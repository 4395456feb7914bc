#pragma once

#include <codemem/logging.h>
#include <codemem/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

enum class OutputMode { kDirect, kDescriptive };

OutputMode ParseOutputMode(const std::string &value);

// Settings shared by every command. Unset fields fall back to config file
// values, then to built-in defaults.
struct MemoryOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> project;
  std::optional<std::string> store;
  std::optional<std::string> redis_url;
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<std::size_t> batch_size;
  std::optional<std::size_t> top_k;
  std::optional<std::size_t> max_parallel_files;
  std::optional<std::size_t> dimensions;
  std::vector<std::string> ignored_paths;
  std::optional<OutputMode> output_mode;
  std::optional<LogLevel> log_level;
  std::optional<bool> dry_run;
  std::optional<double> min_score;
  std::vector<EntityType> entity_types;
  std::optional<std::string> file_filter;
  bool json = false;
  bool show_help = false;
};

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

// `$HOME/.indexer/config.yaml`, or nothing when HOME is unset.
std::optional<std::filesystem::path> DefaultConfigPath();

MemoryOptions ParseConfigFile(const std::filesystem::path &path);
MemoryOptions MergeOptions(const MemoryOptions &config_options,
                           const MemoryOptions &cli_options);
// Loads the explicit config file (which must exist) or the default one (when
// present) and lays the command-line options over it.
MemoryOptions ResolveOptions(const MemoryOptions &cli_options);

std::size_t ParsePositiveCount(const std::string &value,
                               const std::string &name);
std::vector<std::string> SplitList(const std::string &raw_values);

} // namespace codemem
