#pragma once

#include <codemem/http_client.h>
#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace codemem {

inline constexpr const char kOpenAiKeyVariable[] = "OPENAI_API_KEY";
inline constexpr const char kOpenAiDefaultModel[] = "text-embedding-3-small";
inline constexpr const char kOpenAiEndpoint[] =
    "https://api.openai.com/v1/embeddings";

inline constexpr const char kHuggingFaceKeyVariable[] = "HF_API_KEY";
inline constexpr const char kHuggingFaceDefaultModel[] =
    "sentence-transformers/all-MiniLM-L6-v2";
inline constexpr const char kHuggingFaceEndpoint[] =
    "https://api-inference.huggingface.co/pipeline/feature-extraction/";

struct RemoteEmbedderOptions {
  std::string model;
  // Overrides the provider's public endpoint, e.g. for a proxy.
  std::string endpoint;
};

class OpenAiEmbedder : public Embedder {
public:
  // Throws ConfigurationError when OPENAI_API_KEY is not available.
  OpenAiEmbedder(const CredentialSource &credentials,
                 std::shared_ptr<HttpTransport> transport,
                 RemoteEmbedderOptions options = {},
                 std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::vector<float>>
  Embed(const std::vector<std::string> &batch) override;
  std::string ProviderId() const override { return "openai"; }
  std::string ModelId() const override { return model_; }

private:
  std::string api_key_;
  std::string model_;
  std::string endpoint_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<Logger> logger_;
};

class HuggingFaceEmbedder : public Embedder {
public:
  // Throws ConfigurationError when HF_API_KEY is not available.
  HuggingFaceEmbedder(const CredentialSource &credentials,
                      std::shared_ptr<HttpTransport> transport,
                      RemoteEmbedderOptions options = {},
                      std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::vector<float>>
  Embed(const std::vector<std::string> &batch) override;
  std::string ProviderId() const override { return "huggingface"; }
  std::string ModelId() const override { return model_; }

private:
  std::string api_key_;
  std::string model_;
  std::string endpoint_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<Logger> logger_;
};

} // namespace codemem
