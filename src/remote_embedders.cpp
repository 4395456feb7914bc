#include <codemem/remote_embedders.h>

#include <codemem/entity_codec.h>
#include <codemem/errors.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <utility>

namespace codemem {

namespace {
std::string RequireCredential(const CredentialSource &credentials,
                              const std::string &variable,
                              const std::string &provider) {
  auto value = credentials.Lookup(variable);
  if (!value) {
    throw ConfigurationError("Embedding provider '" + provider +
                             "' requires the " + variable +
                             " environment variable");
  }
  return *value;
}

std::shared_ptr<HttpTransport>
RequireTransport(std::shared_ptr<HttpTransport> transport) {
  if (!transport) {
    return std::make_shared<CurlHttpTransport>();
  }
  return transport;
}

std::vector<float> ToVector(const nlohmann::json &values) {
  std::vector<float> vector;
  vector.reserve(values.size());
  for (const auto &value : values) {
    vector.push_back(value.get<float>());
  }
  return vector;
}

// Token-level output is mean-pooled into one sentence vector.
std::vector<float> MeanPool(const nlohmann::json &tokens) {
  std::vector<float> pooled;
  for (const auto &token : tokens) {
    const auto values = ToVector(token);
    if (pooled.empty()) {
      pooled.assign(values.size(), 0.0F);
    }
    if (values.size() != pooled.size()) {
      throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                       "Token vectors have inconsistent dimensions");
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
      pooled[i] += values[i];
    }
  }
  if (!tokens.empty()) {
    for (auto &value : pooled) {
      value /= static_cast<float>(tokens.size());
    }
  }
  return pooled;
}

void RequireCount(const std::string &provider, std::size_t received,
                  std::size_t expected) {
  if (received != expected) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     provider + " returned " + std::to_string(received) +
                         " vectors for " + std::to_string(expected) +
                         " inputs");
  }
}

void LogRequest(Logger &logger, const std::string &provider,
                const std::string &model, std::size_t batch_size,
                long status, std::chrono::steady_clock::time_point started) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  logger.Log(LogLevel::kDebug, "embed.request",
             {{"provider", provider},
              {"model", model},
              {"batch", std::to_string(batch_size)},
              {"status", std::to_string(status)},
              {"duration_ms", std::to_string(elapsed.count())}});
}
} // namespace

OpenAiEmbedder::OpenAiEmbedder(const CredentialSource &credentials,
                               std::shared_ptr<HttpTransport> transport,
                               RemoteEmbedderOptions options,
                               std::shared_ptr<Logger> logger)
    : api_key_(RequireCredential(credentials, kOpenAiKeyVariable, "openai")),
      model_(options.model.empty() ? kOpenAiDefaultModel
                                   : std::move(options.model)),
      endpoint_(options.endpoint.empty() ? kOpenAiEndpoint
                                         : std::move(options.endpoint)),
      transport_(RequireTransport(std::move(transport))),
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::vector<float>>
OpenAiEmbedder::Embed(const std::vector<std::string> &batch) {
  if (batch.empty()) {
    return {};
  }
  const nlohmann::json request = {{"model", model_}, {"input", batch}};
  const auto started = std::chrono::steady_clock::now();
  const auto response = transport_->PostJson(
      endpoint_, {{"Authorization", "Bearer " + api_key_}},
      DumpJson(request));
  LogRequest(*logger_, ProviderId(), model_, batch.size(), response.status,
             started);
  ThrowForStatus(ProviderId(), response);

  try {
    const auto document = nlohmann::json::parse(response.body);
    const auto &data = document.at("data");
    RequireCount(ProviderId(), data.size(), batch.size());
    std::vector<std::vector<float>> vectors(batch.size());
    std::vector<bool> filled(batch.size(), false);
    for (std::size_t position = 0; position < data.size(); ++position) {
      const auto &item = data[position];
      const auto index = item.value("index", position);
      if (index >= vectors.size()) {
        throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                         "openai returned an out-of-range index");
      }
      if (filled[index]) {
        throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                         "openai returned index " + std::to_string(index) +
                             " more than once");
      }
      vectors[index] = ToVector(item.at("embedding"));
      filled[index] = true;
    }
    return vectors;
  } catch (const nlohmann::json::exception &ex) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     std::string("openai returned an invalid response: ") +
                         ex.what());
  }
}

HuggingFaceEmbedder::HuggingFaceEmbedder(
    const CredentialSource &credentials,
    std::shared_ptr<HttpTransport> transport, RemoteEmbedderOptions options,
    std::shared_ptr<Logger> logger)
    : api_key_(RequireCredential(credentials, kHuggingFaceKeyVariable,
                                 "huggingface")),
      model_(options.model.empty() ? kHuggingFaceDefaultModel
                                   : std::move(options.model)),
      endpoint_(options.endpoint.empty()
                    ? std::string(kHuggingFaceEndpoint) + model_
                    : std::move(options.endpoint)),
      transport_(RequireTransport(std::move(transport))),
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::vector<float>>
HuggingFaceEmbedder::Embed(const std::vector<std::string> &batch) {
  if (batch.empty()) {
    return {};
  }
  const nlohmann::json request = {
      {"inputs", batch}, {"options", {{"wait_for_model", true}}}};
  const auto started = std::chrono::steady_clock::now();
  const auto response = transport_->PostJson(
      endpoint_, {{"Authorization", "Bearer " + api_key_}},
      DumpJson(request));
  LogRequest(*logger_, ProviderId(), model_, batch.size(), response.status,
             started);
  ThrowForStatus(ProviderId(), response);

  try {
    const auto document = nlohmann::json::parse(response.body);
    if (!document.is_array()) {
      throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                       "huggingface returned a non-array response");
    }
    RequireCount(ProviderId(), document.size(), batch.size());
    std::vector<std::vector<float>> vectors;
    vectors.reserve(document.size());
    for (const auto &item : document) {
      const bool token_level = !item.empty() && item.front().is_array();
      vectors.push_back(token_level ? MeanPool(item) : ToVector(item));
    }
    return vectors;
  } catch (const nlohmann::json::exception &ex) {
    throw EmbedError(EmbedErrorKind::kProviderUnavailable,
                     std::string("huggingface returned an invalid response: ") +
                         ex.what());
  }
}

} // namespace codemem
