#include <codemem/errors.h>

#include <utility>

namespace codemem {

ParseFailure::ParseFailure(std::string file_path, std::string reason)
    : Error("Failed to parse " + file_path + ": " + reason),
      file_path_(std::move(file_path)), reason_(std::move(reason)) {}

StoreConnectionError::StoreConnectionError(const std::string &message)
    : Error("Store connection error: " + message) {}

StoreOperationError::StoreOperationError(std::string key,
                                         const std::string &message)
    : Error("Store operation failed for '" + key + "': " + message),
      key_(std::move(key)) {}

std::string EmbedErrorKindName(EmbedErrorKind kind) {
  switch (kind) {
  case EmbedErrorKind::kRateLimited:
    return "rate_limited";
  case EmbedErrorKind::kProviderUnavailable:
    return "provider_unavailable";
  case EmbedErrorKind::kInvalidInput:
    return "invalid_input";
  }
  return "unknown";
}

EmbedError::EmbedError(EmbedErrorKind kind, const std::string &message,
                       std::optional<std::size_t> item_index)
    : Error(EmbedErrorKindName(kind) + ": " + message), kind_(kind),
      item_index_(item_index) {}

ConfigurationError::ConfigurationError(const std::string &message)
    : Error(message) {}

} // namespace codemem
