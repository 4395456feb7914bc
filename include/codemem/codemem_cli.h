#pragma once

#include <codemem/backend_registry.h>
#include <codemem/config.h>
#include <codemem/logging.h>
#include <codemem/memory_session.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codemem {

struct CommandLine {
  std::string command;
  std::vector<std::string> positionals;
  std::optional<std::string> query;
  MemoryOptions options;
};

CommandLine ParseCommandLine(const std::vector<std::string> &arguments);

LoggingConfig BuildLoggingConfig(const MemoryOptions &options);

// Wires a session from resolved options. `descriptive_output` receives the
// mutation descriptions when the output mode is descriptive.
MemorySessionBuilder
ConfigureSession(const MemoryOptions &options,
                 const std::filesystem::path &project_root,
                 std::shared_ptr<Logger> logger,
                 std::ostream &descriptive_output,
                 const BackendRegistry &registry = GlobalBackendRegistry());

void PrintUsage(std::ostream &out);

// Runs one command. Results go to `out`, log lines to `log`. Returns the
// process exit code; fatal errors propagate as exceptions.
int RunCodemem(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &log);

} // namespace codemem
