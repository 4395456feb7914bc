#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace codemem {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The whole file could not be parsed. Malformed sub-nodes are counted and
// logged by the extractor instead of raising this.
class ParseFailure : public Error {
public:
  ParseFailure(std::string file_path, std::string reason);

  const std::string &file_path() const { return file_path_; }
  const std::string &reason() const { return reason_; }

private:
  std::string file_path_;
  std::string reason_;
};

class StoreConnectionError : public Error {
public:
  explicit StoreConnectionError(const std::string &message);
};

class StoreOperationError : public Error {
public:
  StoreOperationError(std::string key, const std::string &message);

  const std::string &key() const { return key_; }

private:
  std::string key_;
};

enum class EmbedErrorKind { kRateLimited, kProviderUnavailable, kInvalidInput };

std::string EmbedErrorKindName(EmbedErrorKind kind);

class EmbedError : public Error {
public:
  EmbedError(EmbedErrorKind kind, const std::string &message,
             std::optional<std::size_t> item_index = std::nullopt);

  EmbedErrorKind kind() const { return kind_; }
  // Position of the offending input inside the batch, when the provider
  // reports one.
  const std::optional<std::size_t> &item_index() const { return item_index_; }

private:
  EmbedErrorKind kind_;
  std::optional<std::size_t> item_index_;
};

class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &message);
};

} // namespace codemem
