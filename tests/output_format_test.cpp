#include <codemem/entity_codec.h>
#include <codemem/errors.h>
#include <codemem/output_format.h>

#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace codemem {
namespace {

using ::testing::HasSubstr;

EntityRecord SampleMethod() {
  EntityRecord entity;
  entity.entity_type = EntityType::kMethod;
  entity.file_path = "shop/cart.py";
  entity.name = "total";
  entity.parent_class = "Cart";
  entity.signature = "def total(self) -> int";
  entity.line_start = 10;
  entity.line_end = 14;
  return entity;
}

TEST(EntityCodecTest, OmitsAbsentOptionalFields) {
  const auto document = EntityToJson(SampleMethod());

  EXPECT_EQ("method", document["entity_type"]);
  EXPECT_EQ("Cart", document["parent_class"]);
  EXPECT_FALSE(document.contains("docstring"));
  EXPECT_FALSE(document.contains("bases"));
  EXPECT_FALSE(document.contains("value_repr"));
}

TEST(EntityCodecTest, ReadsBackStoredEntities) {
  auto entity = SampleMethod();
  entity.docstring = "Sum of items.";
  const auto key = "code:shop:method:shop/cart.py:Cart.total";

  EXPECT_EQ(entity, DeserializeEntity(key, SerializeEntity(entity)));
}

TEST(EntityCodecTest, ReportsUnreadablePayloadsWithTheirKey) {
  try {
    DeserializeEntity("code:shop:function:a.py:x", "[1, 2]");
    FAIL() << "expected StoreOperationError";
  } catch (const StoreOperationError &error) {
    EXPECT_EQ("code:shop:function:a.py:x", error.key());
  }
  EXPECT_THROW(DeserializeEntity("k", "{not json"), StoreOperationError);
  EXPECT_THROW(
      DeserializeEntity("k", R"({"entity_type": "module", "file_path": "a.py",
                                 "name": "x"})"),
      StoreOperationError);
}

TEST(RenderEntitiesTest, RendersTextLines) {
  EntityRecord variable;
  variable.entity_type = EntityType::kVariable;
  variable.file_path = "shop/cart.py";
  variable.name = "LIMIT";
  variable.line_start = 2;
  variable.line_end = 2;
  variable.value_repr = "5";

  const auto text =
      RenderEntities({SampleMethod(), variable}, OutputFormat::kText);

  EXPECT_THAT(text, HasSubstr("method Cart.total  shop/cart.py:10-14\n"
                              "    def total(self) -> int\n"));
  EXPECT_THAT(text, HasSubstr("variable LIMIT  shop/cart.py:2-2\n    = 5\n"));
  EXPECT_EQ("No matching entities\n", RenderEntities({}, OutputFormat::kText));
}

TEST(RenderEntitiesTest, RendersJsonArray) {
  const auto document = nlohmann::json::parse(
      RenderEntities({SampleMethod()}, OutputFormat::kJson));
  ASSERT_TRUE(document.is_array());
  ASSERT_EQ(1u, document.size());
  EXPECT_EQ("total", document[0]["name"]);
  EXPECT_TRUE(nlohmann::json::parse(RenderEntities({}, OutputFormat::kJson))
                  .empty());
}

TEST(RenderRecallResultsTest, PrefixesScores) {
  const auto text = RenderRecallResults({RecallResult{SampleMethod(), 0.87654}},
                                        OutputFormat::kText);
  EXPECT_EQ(0u, text.find("0.8765  method Cart.total"));

  const auto document = nlohmann::json::parse(RenderRecallResults(
      {RecallResult{SampleMethod(), 0.5}}, OutputFormat::kJson));
  EXPECT_DOUBLE_EQ(0.5, document[0]["score"].get<double>());
  EXPECT_EQ("Cart", document[0]["entity"]["parent_class"]);
}

TEST(RenderSummariesTest, RendersWriteAndVectorizeSummaries) {
  WriteSummary write;
  write.entities_written = 4;
  write.files_written = 2;
  write.entities_failed = 1;
  write.failed_keys = {"code:shop:function:a.py:x"};
  const auto write_text = RenderWriteSummary(write, OutputFormat::kText);
  EXPECT_THAT(write_text, HasSubstr("Indexed 4 entities from 2 files\n"));
  EXPECT_THAT(write_text, HasSubstr("  key: code:shop:function:a.py:x\n"));

  VectorizeSummary vectorize;
  vectorize.indexed = 8;
  vectorize.batches = 3;
  vectorize.failed = 2;
  vectorize.failed_batches = 1;
  EXPECT_EQ("Vectorized 8 entities in 3 batches (2 failed, 1 failed batches)\n",
            RenderVectorizeSummary(vectorize, OutputFormat::kText));
  const auto document = nlohmann::json::parse(
      RenderVectorizeSummary(vectorize, OutputFormat::kJson));
  EXPECT_EQ(8, document["indexed"].get<int>());
  EXPECT_FALSE(document["dry_run"].get<bool>());
}

TEST(RenderStatusTest, ListsCountsAndFiles) {
  StatusSummary status;
  status.file_count = 1;
  status.entity_count = 3;
  status.function_count = 3;
  status.files = {"app.py"};

  const auto text = RenderStatus(status, OutputFormat::kText);
  EXPECT_THAT(text, HasSubstr("Files:      1\n"));
  EXPECT_THAT(text, HasSubstr("  functions 3\n"));
  EXPECT_THAT(text, HasSubstr("  app.py\n"));

  const auto document =
      nlohmann::json::parse(RenderStatus(status, OutputFormat::kJson));
  EXPECT_EQ(3, document["entity_count"].get<int>());
}

} // namespace
} // namespace codemem
