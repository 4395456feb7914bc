#include <codemem/codemem_cli.h>

#include <codemem/cli_exit_codes.h>
#include <codemem/errors.h>
#include <codemem/output_format.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace codemem {

namespace {
const std::vector<std::string> &KnownCommands() {
  static const std::vector<std::string> commands = {
      "remember", "refresh", "recall",        "status",
      "forget",   "vectorize", "vector-recall"};
  return commands;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

double ParseScore(const std::string &value) {
  try {
    std::size_t consumed = 0;
    const auto score = std::stod(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return score;
  } catch (const std::logic_error &) {
    throw ConfigurationError("--min-score must be a number, got '" + value +
                             "'");
  }
}

void AppendEntityTypes(const std::string &raw_types,
                       std::vector<EntityType> &target) {
  for (const auto &name : SplitList(raw_types)) {
    const auto type = ParseEntityType(name);
    if (!type) {
      throw ConfigurationError("Unknown entity type: " + name);
    }
    if (std::find(target.begin(), target.end(), *type) == target.end()) {
      target.push_back(*type);
    }
  }
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, MemoryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleBackendOption(const std::vector<std::string> &arguments,
                         std::size_t &index, MemoryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--store") {
    options.store = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--redis-url") {
    options.redis_url = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--provider") {
    options.provider = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--model") {
    options.model = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--dimensions") {
    options.dimensions =
        ParsePositiveCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleSizingOption(const std::vector<std::string> &arguments,
                        std::size_t &index, MemoryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--batch-size") {
    options.batch_size =
        ParsePositiveCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--top-k") {
    options.top_k =
        ParsePositiveCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--jobs" || argument == "-j") {
    options.max_parallel_files =
        ParsePositiveCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleSearchFilterOption(const std::vector<std::string> &arguments,
                              std::size_t &index, MemoryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--min-score") {
    options.min_score = ParseScore(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--type") {
    AppendEntityTypes(RequireValue(arguments, index, argument),
                      options.entity_types);
    return true;
  }
  if (argument == "--file") {
    options.file_filter = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, CommandLine &command_line) {
  auto &options = command_line.options;
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--project") {
    options.project = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--query" || argument == "-q") {
    command_line.query = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--ignored-paths") {
    for (const auto &path :
         SplitList(RequireValue(arguments, index, argument))) {
      options.ignored_paths.push_back(
          std::filesystem::path(path).generic_string());
    }
    return true;
  }
  if (argument == "--descriptive") {
    options.output_mode = OutputMode::kDescriptive;
    return true;
  }
  if (argument == "--dry-run") {
    options.dry_run = true;
    return true;
  }
  if (argument == "--json") {
    options.json = true;
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleBackendOption(arguments, index, options) ||
         HandleSizingOption(arguments, index, options) ||
         HandleSearchFilterOption(arguments, index, options);
}

OutputFormat FormatFor(const MemoryOptions &options) {
  return options.json ? OutputFormat::kJson : OutputFormat::kText;
}

std::filesystem::path ProjectRootFor(const CommandLine &command_line) {
  if (command_line.command == "remember" &&
      !command_line.positionals.empty()) {
    return command_line.positionals.front();
  }
  return command_line.options.root.value_or(std::filesystem::current_path());
}

void RequirePositionals(const CommandLine &command_line, std::size_t minimum,
                        std::size_t maximum) {
  const auto count = command_line.positionals.size();
  if (count < minimum) {
    throw std::invalid_argument("'" + command_line.command +
                                "' is missing a required argument");
  }
  if (count > maximum) {
    throw std::invalid_argument("Unexpected argument for '" +
                                command_line.command +
                                "': " + command_line.positionals[maximum]);
  }
}

std::vector<std::string> RefreshFiles(const CommandLine &command_line) {
  std::vector<std::string> files;
  for (const auto &positional : command_line.positionals) {
    auto split = SplitList(positional);
    files.insert(files.end(), split.begin(), split.end());
  }
  if (files.empty()) {
    throw std::invalid_argument("'refresh' requires at least one file");
  }
  return files;
}

std::string QueryFor(const CommandLine &command_line) {
  if (command_line.query) {
    return *command_line.query;
  }
  if (!command_line.positionals.empty()) {
    std::string query;
    for (const auto &word : command_line.positionals) {
      query += (query.empty() ? "" : " ") + word;
    }
    return query;
  }
  throw std::invalid_argument("'vector-recall' requires --query <text>");
}

int Execute(const CommandLine &command_line, MemorySession &session,
            std::ostream &out) {
  const auto &options = command_line.options;
  const auto format = FormatFor(options);
  const auto &command = command_line.command;

  if (command == "remember") {
    RequirePositionals(command_line, 0, 1);
    const auto summary = session.Remember();
    out << RenderWriteSummary(summary, format);
    return WriteExitCode(summary);
  }
  if (command == "refresh") {
    const auto summary = session.Refresh(RefreshFiles(command_line));
    out << RenderWriteSummary(summary, format);
    return WriteExitCode(summary);
  }
  if (command == "recall") {
    RequirePositionals(command_line, 1, 2);
    const auto type = ParseEntityType(command_line.positionals.front());
    if (!type) {
      throw ConfigurationError("Unknown entity type: " +
                               command_line.positionals.front());
    }
    std::optional<std::string> name;
    if (command_line.positionals.size() > 1) {
      name = command_line.positionals[1];
    }
    out << RenderEntities(session.Recall(*type, name), format);
    return kExitSuccess;
  }
  if (command == "status") {
    RequirePositionals(command_line, 0, 0);
    out << RenderStatus(session.Status(), format);
    return kExitSuccess;
  }
  if (command == "forget") {
    RequirePositionals(command_line, 0, 0);
    const auto summary = session.Forget();
    out << RenderForgetSummary(summary, format);
    return ForgetExitCode(summary);
  }
  if (command == "vectorize") {
    RequirePositionals(command_line, 0, 0);
    const auto summary = session.Vectorize(options.batch_size, options.dry_run);
    out << RenderVectorizeSummary(summary, format);
    return VectorizeExitCode(summary);
  }
  if (command == "vector-recall") {
    SearchOptions search;
    search.top_k = options.top_k.value_or(search.top_k);
    search.min_score = options.min_score;
    search.entity_types = options.entity_types;
    search.file_path = options.file_filter;
    out << RenderRecallResults(
        session.VectorRecall(QueryFor(command_line), search), format);
    return kExitSuccess;
  }
  throw std::invalid_argument("Unknown command: " + command);
}
} // namespace

CommandLine ParseCommandLine(const std::vector<std::string> &arguments) {
  CommandLine command_line;
  std::size_t start = 0;
  if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
    command_line.command = arguments.front();
    start = 1;
    const auto &known = KnownCommands();
    if (std::find(known.begin(), known.end(), command_line.command) ==
        known.end()) {
      throw std::invalid_argument("Unknown command: " + command_line.command);
    }
  }

  for (std::size_t i = start; i < arguments.size(); ++i) {
    if (DispatchOption(arguments, i, command_line)) {
      if (command_line.options.show_help) {
        break;
      }
      continue;
    }
    if (arguments[i].size() > 1 && arguments[i].front() == '-') {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    command_line.positionals.push_back(arguments[i]);
  }

  if (command_line.command.empty() && !command_line.options.show_help) {
    throw std::invalid_argument("A command is required");
  }
  return command_line;
}

LoggingConfig BuildLoggingConfig(const MemoryOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

MemorySessionBuilder ConfigureSession(const MemoryOptions &options,
                                      const std::filesystem::path &project_root,
                                      std::shared_ptr<Logger> logger,
                                      std::ostream &descriptive_output,
                                      const BackendRegistry &registry) {
  BackendSettings settings;
  settings.redis_url = options.redis_url.value_or("");
  settings.model = options.model.value_or("");
  settings.dimensions = options.dimensions.value_or(0);
  settings.logger = logger;

  IndexWriterOptions writer_options;
  writer_options.max_parallel_files =
      options.max_parallel_files.value_or(writer_options.max_parallel_files);

  VectorizeOptions vectorize_options;
  vectorize_options.batch_size =
      options.batch_size.value_or(vectorize_options.batch_size);
  vectorize_options.dry_run = options.dry_run.value_or(false);

  MemorySessionBuilder builder(registry);
  builder.WithLogger(logger)
      .WithBackendSettings(std::move(settings))
      .WithProjectRoot(project_root)
      .WithIgnoredPaths(options.ignored_paths)
      .WithIndexWriterOptions(writer_options)
      .WithVectorizeOptions(vectorize_options);
  if (options.store) {
    builder.WithStoreName(*options.store);
  }
  if (options.provider) {
    builder.WithEmbedderName(*options.provider);
  }
  if (options.project) {
    builder.WithProjectName(*options.project);
  }
  if (options.output_mode.value_or(OutputMode::kDirect) ==
      OutputMode::kDescriptive) {
    builder.WithDescriptiveOutput(descriptive_output);
  }
  return builder;
}

void PrintUsage(std::ostream &out) {
  out << "Usage: codemem <command> [options]\n\n"
      << "Commands:\n"
      << "  remember [path]            Index every Python file under path\n"
      << "                             (default: --root or the current "
         "directory)\n"
      << "  refresh <files>            Re-index the comma-separated files\n"
      << "  recall <type> [name]       List indexed entities of a type\n"
      << "                             (function,class,method,variable)\n"
      << "  status                     Show index counts\n"
      << "  forget                     Delete every key of the project\n"
      << "  vectorize                  Embed indexed entities\n"
      << "  vector-recall --query <q>  Semantic search over embeddings\n\n"
      << "Options:\n"
      << "  --root <path>         Project root (default: current directory)\n"
      << "  --project <name>      Project name used in keys\n"
      << "                        (default: root directory name)\n"
      << "  --config <file>       YAML config file\n"
      << "                        (default: ~/.indexer/config.yaml)\n"
      << "  --store <id>          Store backend (redis,memory)\n"
      << "  --redis-url <url>     Redis connection URL\n"
      << "  --provider <id>       Embedding provider "
         "(openai,huggingface,hashing)\n"
      << "  --model <id>          Embedding model\n"
      << "  --dimensions <n>      Vector size for the hashing provider\n"
      << "  --batch-size <n>      Entities per embedding batch (default: 10)\n"
      << "  --top-k <n>           Results for vector-recall (default: 10)\n"
      << "  --min-score <x>       Minimum similarity for vector-recall\n"
      << "  --type <list>         Entity types for vector-recall\n"
      << "  --file <path>         Restrict vector-recall to one file\n"
      << "  --jobs <n>            Files processed in parallel (default: 4)\n"
      << "  --ignored-paths <list> Comma-separated paths to skip\n"
      << "  --descriptive         Print mutations instead of applying them\n"
      << "  --dry-run             Report vectorize work without embedding\n"
      << "  --json                Print results as JSON\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

int RunCodemem(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &log) {
  const auto command_line = ParseCommandLine(arguments);
  if (command_line.options.show_help) {
    PrintUsage(out);
    return kExitSuccess;
  }

  auto resolved = command_line;
  resolved.options = ResolveOptions(command_line.options);
  auto logger = MakeLogger(BuildLoggingConfig(resolved.options), log);

  const auto descriptive = resolved.options.output_mode.value_or(
                               OutputMode::kDirect) == OutputMode::kDescriptive;
  auto session = ConfigureSession(resolved.options, ProjectRootFor(resolved),
                                  logger, out)
                     .Build();
  // Mutation descriptions own `out` in descriptive mode.
  return Execute(resolved, session, descriptive ? log : out);
}

} // namespace codemem
