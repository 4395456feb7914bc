#include <codemem/errors.h>
#include <codemem/http_client.h>
#include <codemem/remote_embedders.h>

#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <memory>

namespace codemem {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::SaveArg;

class MockHttpTransport : public HttpTransport {
public:
  MOCK_METHOD(HttpResponse, PostJson,
              (const std::string &url, const HttpHeaders &headers,
               const std::string &body),
              (override));
};

class MapCredentialSource : public CredentialSource {
public:
  explicit MapCredentialSource(std::map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::optional<std::string> Lookup(const std::string &name) const override {
    const auto found = values_.find(name);
    if (found == values_.end()) {
      return std::nullopt;
    }
    return found->second;
  }

private:
  std::map<std::string, std::string> values_;
};

EmbedErrorKind KindFor(long status) {
  try {
    ThrowForStatus("test", HttpResponse{status, "{}"});
  } catch (const EmbedError &error) {
    return error.kind();
  }
  throw std::logic_error("status " + std::to_string(status) + " did not throw");
}

TEST(ThrowForStatusTest, MapsStatusCodesToErrorKinds) {
  EXPECT_NO_THROW(ThrowForStatus("test", HttpResponse{200, ""}));
  EXPECT_NO_THROW(ThrowForStatus("test", HttpResponse{204, ""}));
  EXPECT_EQ(EmbedErrorKind::kRateLimited, KindFor(429));
  EXPECT_EQ(EmbedErrorKind::kInvalidInput, KindFor(400));
  EXPECT_EQ(EmbedErrorKind::kInvalidInput, KindFor(413));
  EXPECT_EQ(EmbedErrorKind::kInvalidInput, KindFor(422));
  EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, KindFor(401));
  EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, KindFor(500));
  EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, KindFor(503));
}

TEST(OpenAiEmbedderTest, RequiresApiKey) {
  MapCredentialSource credentials({});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_THROW(OpenAiEmbedder embedder(credentials, transport),
               ConfigurationError);
}

TEST(OpenAiEmbedderTest, SendsBatchAndOrdersVectorsByIndex) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  std::string url;
  HttpHeaders headers;
  std::string body;
  EXPECT_CALL(*transport, PostJson(_, _, _))
      .WillOnce(::testing::DoAll(
          SaveArg<0>(&url), SaveArg<1>(&headers), SaveArg<2>(&body),
          Return(HttpResponse{200, R"({"data": [
              {"index": 1, "embedding": [0.0, 1.0]},
              {"index": 0, "embedding": [1.0, 0.0]}]})"})));
  OpenAiEmbedder embedder(credentials, transport);

  const auto vectors = embedder.Embed({"first", "second"});

  ASSERT_EQ(2u, vectors.size());
  EXPECT_THAT(vectors[0], ElementsAre(1.0F, 0.0F));
  EXPECT_THAT(vectors[1], ElementsAre(0.0F, 1.0F));
  EXPECT_EQ(kOpenAiEndpoint, url);
  EXPECT_THAT(headers, ElementsAre(std::make_pair(std::string("Authorization"),
                                                  std::string("Bearer sk-test"))));
  const auto request = nlohmann::json::parse(body);
  EXPECT_EQ(kOpenAiDefaultModel, request["model"]);
  EXPECT_EQ(nlohmann::json({"first", "second"}), request["input"]);
  EXPECT_EQ("openai", embedder.ProviderId());
  EXPECT_EQ(kOpenAiDefaultModel, embedder.ModelId());
}

TEST(OpenAiEmbedderTest, HonoursModelAndEndpointOverrides) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson("http://proxy/embeddings", _, _))
      .WillOnce(Return(HttpResponse{
          200, R"({"data": [{"index": 0, "embedding": [0.5]}]})"}));
  RemoteEmbedderOptions options;
  options.model = "text-embedding-3-large";
  options.endpoint = "http://proxy/embeddings";
  OpenAiEmbedder embedder(credentials, transport, options);

  EXPECT_EQ(1u, embedder.Embed({"text"}).size());
  EXPECT_EQ("text-embedding-3-large", embedder.ModelId());
}

TEST(OpenAiEmbedderTest, ReportsProviderErrors) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson(_, _, _))
      .WillOnce(Return(HttpResponse{429, R"({"error": "slow down"})"}))
      .WillOnce(Return(HttpResponse{200, "not json"}))
      .WillOnce(Return(HttpResponse{200, R"({"data": []})"}));
  OpenAiEmbedder embedder(credentials, transport);

  try {
    embedder.Embed({"text"});
    FAIL() << "expected rate limit";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kRateLimited, error.kind());
  }
  try {
    embedder.Embed({"text"});
    FAIL() << "expected invalid response";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, error.kind());
  }
  try {
    embedder.Embed({"text"});
    FAIL() << "expected count mismatch";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, error.kind());
  }
}

TEST(OpenAiEmbedderTest, RejectsRepeatedIndex) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson(_, _, _))
      .WillOnce(Return(HttpResponse{200, R"({"data": [
          {"index": 0, "embedding": [1.0, 0.0]},
          {"index": 0, "embedding": [0.0, 1.0]}]})"}));
  OpenAiEmbedder embedder(credentials, transport);

  try {
    embedder.Embed({"first", "second"});
    FAIL() << "expected a repeated index to be rejected";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, error.kind());
  }
}

TEST(OpenAiEmbedderTest, EmptyBatchSkipsTheRequest) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson(_, _, _)).Times(0);
  OpenAiEmbedder embedder(credentials, transport);

  EXPECT_TRUE(embedder.Embed({}).empty());
}

TEST(HuggingFaceEmbedderTest, RequiresApiKey) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kOpenAiKeyVariable, "sk-test"}});
  EXPECT_THROW(
      HuggingFaceEmbedder(credentials, std::make_shared<MockHttpTransport>()),
      ConfigurationError);
}

TEST(HuggingFaceEmbedderTest, PostsToModelPipelineEndpoint) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kHuggingFaceKeyVariable, "hf-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  std::string body;
  EXPECT_CALL(*transport,
              PostJson(std::string(kHuggingFaceEndpoint) +
                           kHuggingFaceDefaultModel,
                       _, _))
      .WillOnce(::testing::DoAll(
          SaveArg<2>(&body),
          Return(HttpResponse{200, "[[0.25, 0.75], [1.0, 0.0]]"})));
  HuggingFaceEmbedder embedder(credentials, transport);

  const auto vectors = embedder.Embed({"a", "b"});

  ASSERT_EQ(2u, vectors.size());
  EXPECT_THAT(vectors[0], ElementsAre(0.25F, 0.75F));
  EXPECT_THAT(vectors[1], ElementsAre(1.0F, 0.0F));
  const auto request = nlohmann::json::parse(body);
  EXPECT_EQ(nlohmann::json({"a", "b"}), request["inputs"]);
  EXPECT_TRUE(request["options"]["wait_for_model"].get<bool>());
}

TEST(HuggingFaceEmbedderTest, MeanPoolsTokenLevelOutput) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kHuggingFaceKeyVariable, "hf-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson(_, _, _))
      .WillOnce(Return(HttpResponse{200, "[[[1.0, 2.0], [3.0, 4.0]]]"}));
  HuggingFaceEmbedder embedder(credentials, transport);

  const auto vectors = embedder.Embed({"tokens"});

  ASSERT_EQ(1u, vectors.size());
  EXPECT_THAT(vectors[0], ElementsAre(2.0F, 3.0F));
}

TEST(HuggingFaceEmbedderTest, ReportsMalformedResponses) {
  MapCredentialSource credentials(
      std::map<std::string, std::string>{{kHuggingFaceKeyVariable, "hf-test"}});
  auto transport = std::make_shared<MockHttpTransport>();
  EXPECT_CALL(*transport, PostJson(_, _, _))
      .WillOnce(Return(HttpResponse{200, R"({"error": "loading"})"}))
      .WillOnce(Return(HttpResponse{413, "payload too large"}));
  HuggingFaceEmbedder embedder(credentials, transport);

  try {
    embedder.Embed({"x"});
    FAIL() << "expected malformed response";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kProviderUnavailable, error.kind());
  }
  try {
    embedder.Embed({"x"});
    FAIL() << "expected invalid input";
  } catch (const EmbedError &error) {
    EXPECT_EQ(EmbedErrorKind::kInvalidInput, error.kind());
  }
}

} // namespace
} // namespace codemem
