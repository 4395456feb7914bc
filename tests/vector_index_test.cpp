#include <codemem/entity_codec.h>
#include <codemem/errors.h>
#include <codemem/hashing_embedder.h>
#include <codemem/in_memory_store_client.h>
#include <codemem/store_vector_index.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

namespace codemem {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

EmbeddingRecord MakeRecord(const ProjectPrefix &prefix, EntityType type,
                           const std::string &file, const std::string &name,
                           std::vector<float> vector) {
  EntityRecord entity;
  entity.entity_type = type;
  entity.file_path = file;
  entity.name = name;
  entity.line_start = 1;
  entity.line_end = 2;

  EmbeddingRecord record;
  record.key = ComputeKey(prefix, entity);
  record.vector = std::move(vector);
  record.provider_id = "test";
  record.model_id = "unit";
  record.metadata = MetadataForEntity(entity);
  return record;
}

std::vector<std::string> HitKeys(const std::vector<SearchHit> &hits) {
  std::vector<std::string> keys;
  for (const auto &hit : hits) {
    keys.push_back(hit.key);
  }
  return keys;
}

class StoreVectorIndexTest : public ::testing::Test {
protected:
  StoreVectorIndexTest()
      : store_(std::make_shared<InMemoryStoreClient>()),
        prefix_(ProjectPrefix::FromProjectName("demo")),
        index_(store_, prefix_) {
    index_.Upsert(MakeRecord(prefix_, EntityType::kFunction, "a.py", "exact",
                             {1.0F, 0.0F, 0.0F}));
    index_.Upsert(MakeRecord(prefix_, EntityType::kFunction, "b.py", "close",
                             {0.8F, 0.6F, 0.0F}));
    index_.Upsert(MakeRecord(prefix_, EntityType::kClass, "a.py", "Far",
                             {0.0F, 0.0F, 1.0F}));
    index_.Upsert(MakeRecord(prefix_, EntityType::kVariable, "b.py", "OPPOSITE",
                             {-1.0F, 0.0F, 0.0F}));
  }

  std::shared_ptr<InMemoryStoreClient> store_;
  ProjectPrefix prefix_;
  StoreVectorIndex index_;
};

TEST(CosineSimilarityTest, HandlesDegenerateInputs) {
  EXPECT_DOUBLE_EQ(1.0, CosineSimilarity({1.0F, 2.0F}, {2.0F, 4.0F}));
  EXPECT_DOUBLE_EQ(-1.0, CosineSimilarity({1.0F, 0.0F}, {-3.0F, 0.0F}));
  EXPECT_DOUBLE_EQ(0.0, CosineSimilarity({1.0F, 0.0F}, {1.0F, 0.0F, 0.0F}));
  EXPECT_DOUBLE_EQ(0.0, CosineSimilarity({}, {}));
  EXPECT_DOUBLE_EQ(0.0, CosineSimilarity({0.0F, 0.0F}, {1.0F, 0.0F}));
}

TEST(CosineSimilarityTest, NonFiniteComponentsScoreZero) {
  const auto inf = std::numeric_limits<float>::infinity();
  const auto nan = std::numeric_limits<float>::quiet_NaN();
  EXPECT_DOUBLE_EQ(0.0, CosineSimilarity({inf, 0.0F}, {1.0F, 0.0F}));
  EXPECT_DOUBLE_EQ(0.0, CosineSimilarity({nan, 1.0F}, {1.0F, 1.0F}));
}

TEST_F(StoreVectorIndexTest, OverflowedQueryStillRanksByKey) {
  const auto hits = index_.Search(
      {std::numeric_limits<float>::infinity(), 0.0F, 0.0F}, SearchOptions{});

  EXPECT_THAT(HitKeys(hits),
              ElementsAre("code:demo:class:a.py:Far",
                          "code:demo:function:a.py:exact",
                          "code:demo:function:b.py:close",
                          "code:demo:variable:b.py:OPPOSITE"));
  for (const auto &hit : hits) {
    EXPECT_DOUBLE_EQ(0.0, hit.score);
  }
}

TEST_F(StoreVectorIndexTest, StoresEmbeddingsBesideTheirEntities) {
  EXPECT_EQ(4u, index_.Count());
  EXPECT_TRUE(store_->Get("code:demo:function:a.py:exact#embedding").has_value());
  EXPECT_FALSE(store_->Get("code:demo:function:a.py:exact").has_value());
}

TEST_F(StoreVectorIndexTest, RanksByDescendingSimilarity) {
  SearchOptions options;
  const auto hits = index_.Search({1.0F, 0.0F, 0.0F}, options);

  ASSERT_EQ(4u, hits.size());
  EXPECT_EQ("code:demo:function:a.py:exact", hits[0].key);
  EXPECT_NEAR(1.0, hits[0].score, 1e-6);
  EXPECT_EQ("code:demo:function:b.py:close", hits[1].key);
  EXPECT_NEAR(0.8, hits[1].score, 1e-6);
  EXPECT_EQ("code:demo:variable:b.py:OPPOSITE", hits[3].key);
  EXPECT_EQ("exact", hits[0].metadata.name);
  EXPECT_EQ("a.py", hits[0].metadata.file_path);
}

TEST_F(StoreVectorIndexTest, ClampsResultsToTopK) {
  SearchOptions options;
  options.top_k = 2;
  EXPECT_EQ(2u, index_.Search({1.0F, 0.0F, 0.0F}, options).size());

  options.top_k = 50;
  EXPECT_EQ(4u, index_.Search({1.0F, 0.0F, 0.0F}, options).size());

  options.top_k = 0;
  EXPECT_THAT(index_.Search({1.0F, 0.0F, 0.0F}, options), IsEmpty());
}

TEST_F(StoreVectorIndexTest, BreaksScoreTiesByKey) {
  index_.Upsert(MakeRecord(prefix_, EntityType::kFunction, "a.py", "twin",
                           {1.0F, 0.0F, 0.0F}));
  SearchOptions options;
  options.top_k = 2;

  EXPECT_THAT(HitKeys(index_.Search({2.0F, 0.0F, 0.0F}, options)),
              ElementsAre("code:demo:function:a.py:exact",
                          "code:demo:function:a.py:twin"));
}

TEST_F(StoreVectorIndexTest, MismatchedDimensionsScoreZero) {
  SearchOptions options;
  const auto hits = index_.Search({1.0F, 0.0F}, options);

  ASSERT_EQ(4u, hits.size());
  for (const auto &hit : hits) {
    EXPECT_DOUBLE_EQ(0.0, hit.score);
  }
}

TEST_F(StoreVectorIndexTest, AppliesTypeFileAndScoreFilters) {
  SearchOptions by_type;
  by_type.entity_types = {EntityType::kClass, EntityType::kVariable};
  EXPECT_THAT(HitKeys(index_.Search({0.0F, 0.0F, 1.0F}, by_type)),
              ElementsAre("code:demo:class:a.py:Far",
                          "code:demo:variable:b.py:OPPOSITE"));

  SearchOptions by_file;
  by_file.file_path = "b.py";
  EXPECT_THAT(HitKeys(index_.Search({1.0F, 0.0F, 0.0F}, by_file)),
              ElementsAre("code:demo:function:b.py:close",
                          "code:demo:variable:b.py:OPPOSITE"));

  SearchOptions combined;
  combined.file_path = "a.py";
  combined.entity_types = {EntityType::kFunction};
  EXPECT_THAT(HitKeys(index_.Search({1.0F, 0.0F, 0.0F}, combined)),
              ElementsAre("code:demo:function:a.py:exact"));

  SearchOptions by_score;
  by_score.min_score = 0.5;
  EXPECT_THAT(HitKeys(index_.Search({1.0F, 0.0F, 0.0F}, by_score)),
              ElementsAre("code:demo:function:a.py:exact",
                          "code:demo:function:b.py:close"));
}

TEST_F(StoreVectorIndexTest, SearchStaysInsideItsProject) {
  StoreVectorIndex other(store_, ProjectPrefix::FromProjectName("other"));
  other.Upsert(MakeRecord(ProjectPrefix::FromProjectName("other"),
                          EntityType::kFunction, "a.py", "exact",
                          {1.0F, 0.0F, 0.0F}));

  EXPECT_EQ(1u, other.Count());
  EXPECT_EQ(4u, index_.Count());
  EXPECT_THAT(HitKeys(other.Search({1.0F, 0.0F, 0.0F}, {})),
              ElementsAre("code:other:function:a.py:exact"));
}

TEST_F(StoreVectorIndexTest, RejectsKeysOutsideThePrefix) {
  auto record = MakeRecord(ProjectPrefix::FromProjectName("other"),
                           EntityType::kFunction, "a.py", "run", {1.0F});
  EXPECT_THROW(index_.Upsert(record), StoreOperationError);

  record.key = EmbeddingKey("code:demo:function:a.py:run");
  EXPECT_THROW(index_.Upsert(record), StoreOperationError);
}

TEST_F(StoreVectorIndexTest, SkipsUnreadableRecords) {
  store_->Set("code:demo:function:c.py:corrupt#embedding", "not json");
  std::ostringstream log;
  StoreVectorIndex index(store_, prefix_, MakeLogger({LogLevel::kWarn}, log));

  EXPECT_EQ(4u, index.Search({1.0F, 0.0F, 0.0F}, {}).size());
  EXPECT_THAT(log.str(), ::testing::HasSubstr("search.record_unreadable"));
}

TEST(HashingEmbedderTest, IsDeterministicAndNormalised) {
  HashingEmbedder embedder(64);
  const auto first = embedder.Embed({"def parse_config(path)", ""});
  const auto second = embedder.Embed({"def parse_config(path)"});

  ASSERT_EQ(2u, first.size());
  ASSERT_EQ(64u, first[0].size());
  EXPECT_EQ(first[0], second[0]);

  double norm = 0.0;
  for (const auto value : first[0]) {
    norm += static_cast<double>(value) * value;
  }
  EXPECT_NEAR(1.0, std::sqrt(norm), 1e-5);
  EXPECT_EQ(std::vector<float>(64, 0.0F), first[1]);
  EXPECT_EQ("feature-hash-64", embedder.ModelId());
  EXPECT_EQ("hashing", embedder.ProviderId());
}

TEST(HashingEmbedderTest, SharedVocabularyScoresHigher) {
  HashingEmbedder embedder;
  const auto vectors = embedder.Embed(
      {"load config file", "function loadConfig reads the config file",
       "render html template"});

  EXPECT_GT(CosineSimilarity(vectors[0], vectors[1]),
            CosineSimilarity(vectors[0], vectors[2]));
}

TEST(HashingEmbedderTest, RejectsZeroDimensions) {
  EXPECT_THROW(HashingEmbedder(0), ConfigurationError);
}

TEST(TokenizeForEmbeddingTest, SplitsIdentifiers) {
  EXPECT_THAT(TokenizeForEmbedding("parseHTTPRequest(self, raw_bytes)"),
              ElementsAre("parse", "httprequest", "self", "raw", "bytes"));
  EXPECT_THAT(TokenizeForEmbedding("  "), IsEmpty());
}

} // namespace
} // namespace codemem
