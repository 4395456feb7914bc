#include <codemem/config.h>

#include <codemem/errors.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace codemem {

namespace {
std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

using ConfigValue =
    std::variant<std::string, std::size_t, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw ConfigurationError(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw ConfigurationError("Config key '" + key_name +
                             "' must be a string value");
  }
  return Trim(node.as<std::string>());
}

std::size_t ExtractCount(const YAML::Node &node, const std::string &key_name) {
  return ParsePositiveCount(ExtractStringScalar(node, key_name), key_name);
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  const auto append = [&](const std::string &raw) {
    for (auto value : SplitList(raw)) {
      const auto normalized =
          std::filesystem::path(value).generic_string();
      if (std::find(values.begin(), values.end(), normalized) ==
          values.end()) {
        values.push_back(normalized);
      }
    }
  };

  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw ConfigurationError("Config key '" + key_name +
                                 "' must be a list of strings");
      }
      append(child.as<std::string>());
    }
    return values;
  }
  if (node.IsScalar()) {
    append(node.as<std::string>());
    return values;
  }
  throw ConfigurationError("Config key '" + key_name +
                           "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "ignored_paths") {
    return ExtractList(node, key);
  }
  if (key == "batch_size" || key == "top_k" || key == "max_parallel_files" ||
      key == "dimensions") {
    return ConfigValue{ExtractCount(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError("Failed to parse config file " + path.string() +
                             ": " + ex.what());
  }
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw ConfigurationError("Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, MemoryOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "redis_url") {
      options.redis_url = std::get<std::string>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "project") {
      options.project = std::get<std::string>(value);
      continue;
    }
    if (key == "root") {
      options.root = std::get<std::string>(value);
      continue;
    }
    if (key == "store") {
      options.store = ToLower(std::get<std::string>(value));
      continue;
    }
    if (key == "provider") {
      options.provider = ToLower(std::get<std::string>(value));
      continue;
    }
    if (key == "model") {
      options.model = std::get<std::string>(value);
      continue;
    }
    if (key == "batch_size") {
      options.batch_size = std::get<std::size_t>(value);
      continue;
    }
    if (key == "top_k") {
      options.top_k = std::get<std::size_t>(value);
      continue;
    }
    if (key == "max_parallel_files") {
      options.max_parallel_files = std::get<std::size_t>(value);
      continue;
    }
    if (key == "dimensions") {
      options.dimensions = std::get<std::size_t>(value);
      continue;
    }
    if (key == "ignored_paths") {
      options.ignored_paths = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "output_mode") {
      options.output_mode = ParseOutputMode(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}
} // namespace

OutputMode ParseOutputMode(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "direct") {
    return OutputMode::kDirect;
  }
  if (normalized == "descriptive") {
    return OutputMode::kDescriptive;
  }
  throw ConfigurationError("Unknown output mode: " + value);
}

std::size_t ParsePositiveCount(const std::string &value,
                               const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw ConfigurationError(name + " must be a positive integer, got '" +
                             value + "'");
  }
  try {
    const auto parsed = std::stoull(trimmed);
    if (parsed == 0) {
      throw ConfigurationError(name + " must be greater than zero");
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::out_of_range &) {
    throw ConfigurationError(name + " is out of range: " + value);
  }
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  const auto flush = [&]() {
    auto value = Trim(current);
    if (!value.empty()) {
      values.push_back(std::move(value));
    }
    current.clear();
  };
  for (const auto character : raw_values) {
    if (character == ',') {
      flush();
    } else {
      current.push_back(character);
    }
  }
  flush();
  return values;
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "redis_url", "log_level",  "project",       "root",
      "store",     "provider",   "model",         "batch_size",
      "top_k",     "max_parallel_files", "dimensions", "ignored_paths",
      "output_mode"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"redis", "redis_url"},
      {"project_name", "project"},
      {"project_root", "root"},
      {"backend", "store"},
      {"embedding_provider", "provider"},
      {"embedding_model", "model"},
      {"jobs", "max_parallel_files"},
      {"parallelism", "max_parallel_files"},
      {"dimension", "dimensions"},
      {"ignore", "ignored_paths"},
      {"mode", "output_mode"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

std::optional<std::filesystem::path> DefaultConfigPath() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::nullopt;
  }
  return std::filesystem::path(home) / ".indexer" / "config.yaml";
}

MemoryOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigurationError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw ConfigurationError("Unsupported config format: " + extension);
  }

  MemoryOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

MemoryOptions MergeOptions(const MemoryOptions &config_options,
                           const MemoryOptions &cli_options) {
  MemoryOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.project, cli_options.project);
  override_value(merged.store, cli_options.store);
  override_value(merged.redis_url, cli_options.redis_url);
  override_value(merged.provider, cli_options.provider);
  override_value(merged.model, cli_options.model);
  override_value(merged.batch_size, cli_options.batch_size);
  override_value(merged.top_k, cli_options.top_k);
  override_value(merged.max_parallel_files, cli_options.max_parallel_files);
  override_value(merged.dimensions, cli_options.dimensions);
  override_value(merged.output_mode, cli_options.output_mode);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.dry_run, cli_options.dry_run);
  override_value(merged.min_score, cli_options.min_score);
  override_value(merged.file_filter, cli_options.file_filter);

  if (!cli_options.ignored_paths.empty()) {
    merged.ignored_paths = cli_options.ignored_paths;
  }
  if (!cli_options.entity_types.empty()) {
    merged.entity_types = cli_options.entity_types;
  }
  merged.json = cli_options.json;
  merged.show_help = cli_options.show_help;
  return merged;
}

MemoryOptions ResolveOptions(const MemoryOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  MemoryOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  } else if (const auto default_path = DefaultConfigPath();
             default_path && std::filesystem::exists(*default_path)) {
    config_options = ParseConfigFile(*default_path);
  }
  return MergeOptions(config_options, cli_options);
}

} // namespace codemem
