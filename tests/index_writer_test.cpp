#include <codemem/entity_codec.h>
#include <codemem/errors.h>
#include <codemem/in_memory_store_client.h>
#include <codemem/index_writer.h>
#include <codemem/python_entity_extractor.h>
#include <codemem/python_source_enumerator.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <set>
#include <sstream>

#include "test_support/temporary_project.h"

namespace codemem {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

// Delegates to an in-memory store but fails writes to chosen keys.
class FlakyStoreClient : public StoreClient {
public:
  std::optional<std::string> Get(const std::string &key) override {
    return inner.Get(key);
  }
  void Set(const std::string &key, const std::string &value) override {
    FailIfListed(key);
    inner.Set(key, value);
  }
  void SetAdd(const std::string &key, const std::string &member) override {
    FailIfListed(key);
    inner.SetAdd(key, member);
  }
  void SetRemove(const std::string &key, const std::string &member) override {
    FailIfListed(key);
    inner.SetRemove(key, member);
  }
  std::vector<std::string> SetMembers(const std::string &key) override {
    return inner.SetMembers(key);
  }
  StoreValueType TypeOf(const std::string &key) override {
    return inner.TypeOf(key);
  }
  bool Delete(const std::string &key) override {
    FailIfListed(key);
    return inner.Delete(key);
  }
  std::vector<std::string> ScanPrefix(const std::string &prefix) override {
    if (disconnected) {
      throw StoreConnectionError("connection reset by peer");
    }
    return inner.ScanPrefix(prefix);
  }

  InMemoryStoreClient inner;
  std::set<std::string> failing_keys;
  bool disconnected = false;

private:
  void FailIfListed(const std::string &key) {
    if (disconnected) {
      throw StoreConnectionError("connection reset by peer");
    }
    if (failing_keys.count(key) != 0) {
      throw StoreOperationError(key, "injected failure");
    }
  }
};

class IndexWriterTest : public ::testing::Test {
protected:
  IndexWriterTest() : project_("shop") {
    project_.AddFile("orders.py", "class Order:\n"
                                  "    total = 0\n"
                                  "\n"
                                  "    def pay(self):\n"
                                  "        return True\n");
    project_.AddFile("util.py", "LIMIT = 3\n"
                                "\n"
                                "def helper():\n"
                                "    pass\n");
    project_.AddFile("pkg/models.py", "def build():\n"
                                      "    pass\n");
  }

  std::vector<SourceFile> Enumerate() const {
    PythonSourceEnumerator enumerator;
    return enumerator.Enumerate(project_.root()).files;
  }

  IndexWriter MakeWriter(std::shared_ptr<StoreClient> store,
                         const std::string &project_name = "shop",
                         std::size_t parallel = 2) const {
    IndexWriterOptions options;
    options.max_parallel_files = parallel;
    return IndexWriter(std::move(store),
                       std::make_shared<PythonEntityExtractor>(),
                       ProjectPrefix::FromProjectName(project_name), options);
  }

  test::TemporaryProject project_;
};

TEST_F(IndexWriterTest, IndexesEveryFileAndRecordsBookkeeping) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);

  const auto summary = writer.IndexFiles(Enumerate());

  EXPECT_EQ(3u, summary.files_written);
  EXPECT_EQ(6u, summary.entities_written);
  EXPECT_EQ(0u, summary.FailureCount());
  EXPECT_THAT(store->SetMembers("code:shop:file_index"),
              ElementsAre("orders.py", "pkg/models.py", "util.py"));

  const auto method = store->Get("code:shop:method:orders.py:Order.pay");
  ASSERT_TRUE(method.has_value());
  const auto entity =
      DeserializeEntity("code:shop:method:orders.py:Order.pay", *method);
  EXPECT_EQ("pay", entity.name);
  EXPECT_EQ("Order", entity.parent_class.value_or(""));

  EXPECT_TRUE(store->Get("code:shop:files:util.py").has_value());
  EXPECT_EQ(writer.progress().files_completed.load(), 3u);
}

TEST_F(IndexWriterTest, ReindexingIsIdempotent) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);

  writer.IndexFiles(Enumerate());
  const auto first = store->ScanPrefix("code:shop:");
  writer.IndexFiles(Enumerate());

  EXPECT_EQ(first, store->ScanPrefix("code:shop:"));
}

TEST_F(IndexWriterTest, RemovesEntitiesThatDisappearedFromAFile) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);
  writer.IndexFiles(Enumerate());
  store->Set(EmbeddingKey("code:shop:function:util.py:helper"), "{}");

  project_.AddFile("util.py", "LIMIT = 4\n");
  const auto summary = writer.Refresh(ResolveNamedSources(project_.root(),
                                                          {"util.py"}));

  EXPECT_EQ(1u, summary.files_written);
  EXPECT_FALSE(store->Get("code:shop:function:util.py:helper").has_value());
  EXPECT_FALSE(
      store->Get(EmbeddingKey("code:shop:function:util.py:helper")).has_value());
  EXPECT_TRUE(store->Get("code:shop:variable:util.py:LIMIT").has_value());
}

TEST_F(IndexWriterTest, KeepsEmbeddingsOfEntitiesThatSurvive) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);
  writer.IndexFiles(Enumerate());
  const auto embedding = EmbeddingKey("code:shop:variable:util.py:LIMIT");
  store->Set(embedding, "{}");

  writer.Refresh(ResolveNamedSources(project_.root(), {"util.py"}));

  EXPECT_TRUE(store->Get(embedding).has_value());
}

TEST_F(IndexWriterTest, RefreshTouchesOnlyListedFiles) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);
  writer.IndexFiles(Enumerate());

  project_.AddFile("orders.py", "def checkout():\n    pass\n");
  project_.RemoveFile("util.py");
  project_.AddFile("pkg/models.py", "def rebuilt():\n    pass\n");

  const auto summary = writer.Refresh(
      ResolveNamedSources(project_.root(), {"orders.py", "util.py"}));

  EXPECT_EQ(1u, summary.files_written);
  EXPECT_EQ(1u, summary.files_removed);
  EXPECT_TRUE(store->Get("code:shop:function:orders.py:checkout").has_value());
  EXPECT_FALSE(store->Get("code:shop:class:orders.py:Order").has_value());
  EXPECT_THAT(store->ScanPrefix("code:shop:variable:util.py:"), IsEmpty());
  EXPECT_FALSE(store->Get("code:shop:files:util.py").has_value());
  EXPECT_THAT(store->SetMembers("code:shop:file_index"),
              ElementsAre("orders.py", "pkg/models.py"));
  // Not listed, so the stale entity stays until the next full index.
  EXPECT_TRUE(store->Get("code:shop:function:pkg/models.py:build").has_value());
  EXPECT_FALSE(
      store->Get("code:shop:function:pkg/models.py:rebuilt").has_value());
}

TEST_F(IndexWriterTest, ForgetOnlyTouchesItsOwnPrefix) {
  auto store = std::make_shared<InMemoryStoreClient>();
  auto shop = MakeWriter(store, "shop");
  auto other = MakeWriter(store, "shop2");
  shop.IndexFiles(Enumerate());
  other.IndexFiles(Enumerate());
  const auto shop_keys = store->ScanPrefix("code:shop:");
  const auto other_keys = store->ScanPrefix("code:shop2:");

  const auto summary = shop.Forget();

  EXPECT_EQ(shop_keys.size(), summary.keys_deleted);
  EXPECT_EQ(0u, summary.keys_failed);
  EXPECT_THAT(store->ScanPrefix("code:shop:"), IsEmpty());
  EXPECT_EQ(other_keys, store->ScanPrefix("code:shop2:"));
  EXPECT_EQ(other_keys.size(), store->Size());
}

TEST_F(IndexWriterTest, FailedEntityKeepsFileOutOfProcessedSet) {
  auto store = std::make_shared<FlakyStoreClient>();
  store->failing_keys.insert("code:shop:method:orders.py:Order.pay");
  auto writer = MakeWriter(store);

  const auto summary = writer.IndexFiles(Enumerate());

  EXPECT_EQ(1u, summary.entities_failed);
  EXPECT_EQ(1u, summary.files_failed);
  EXPECT_EQ(2u, summary.files_written);
  EXPECT_THAT(summary.failed_keys,
              ElementsAre("code:shop:method:orders.py:Order.pay"));
  EXPECT_THAT(summary.failed_files, ElementsAre("orders.py"));
  EXPECT_THAT(store->inner.SetMembers("code:shop:file_index"),
              Not(Contains("orders.py")));
  EXPECT_TRUE(store->inner.Get("code:shop:class:orders.py:Order").has_value());
}

TEST_F(IndexWriterTest, FailedReindexTakesFileOutOfProcessedSet) {
  auto store = std::make_shared<FlakyStoreClient>();
  auto writer = MakeWriter(store);
  writer.IndexFiles(Enumerate());
  ASSERT_THAT(store->inner.SetMembers("code:shop:file_index"),
              Contains("util.py"));

  project_.AddFile("util.py", "LIMIT = 3\n"
                              "\n"
                              "def rebuilt():\n"
                              "    pass\n");
  store->failing_keys.insert("code:shop:function:util.py:rebuilt");
  const auto summary = writer.IndexFiles(Enumerate());

  EXPECT_EQ(1u, summary.files_failed);
  EXPECT_EQ(2u, summary.files_written);
  EXPECT_THAT(summary.failed_files, ElementsAre("util.py"));
  EXPECT_THAT(store->inner.SetMembers("code:shop:file_index"),
              ElementsAre("orders.py", "pkg/models.py"));
  EXPECT_TRUE(store->inner.Get("code:shop:function:util.py:helper").has_value());
  EXPECT_TRUE(store->inner.Get("code:shop:variable:util.py:LIMIT").has_value());
}

TEST_F(IndexWriterTest, NonUtf8TextDoesNotStopTheRun) {
  project_.AddFile("latin1.py", "def greet():\n"
                                "    \"\"\"Serve caf\xe9 au lait.\"\"\"\n"
                                "    return 1\n");
  auto store = std::make_shared<InMemoryStoreClient>();
  auto writer = MakeWriter(store);

  const auto summary = writer.IndexFiles(Enumerate());

  EXPECT_EQ(4u, summary.files_written);
  EXPECT_EQ(7u, summary.entities_written);
  EXPECT_EQ(0u, summary.FailureCount());
  const auto key = "code:shop:function:latin1.py:greet";
  const auto payload = store->Get(key);
  ASSERT_TRUE(payload.has_value());
  const auto entity = DeserializeEntity(key, *payload);
  ASSERT_TRUE(entity.docstring.has_value());
  EXPECT_THAT(*entity.docstring, ::testing::HasSubstr("Serve caf"));
  EXPECT_THAT(*entity.docstring, ::testing::HasSubstr("\xEF\xBF\xBD"));
}

TEST_F(IndexWriterTest, SkipsFilesThatCannotBeParsed) {
  project_.AddFile("broken.py", "))))\n]]]] }}}}\n");
  auto store = std::make_shared<InMemoryStoreClient>();
  std::ostringstream log;
  IndexWriter writer(store, std::make_shared<PythonEntityExtractor>(),
                     ProjectPrefix::FromProjectName("shop"), {},
                     MakeLogger({LogLevel::kWarn}, log));

  const auto summary = writer.IndexFiles(Enumerate());

  EXPECT_EQ(1u, summary.files_skipped);
  EXPECT_EQ(3u, summary.files_written);
  EXPECT_THAT(summary.failed_files, ElementsAre("broken.py"));
  EXPECT_THAT(log.str(), ::testing::HasSubstr("index.parse_failed"));
}

TEST_F(IndexWriterTest, ConnectionLossAbortsTheRun) {
  auto store = std::make_shared<FlakyStoreClient>();
  store->disconnected = true;
  auto writer = MakeWriter(store, "shop", 3);

  EXPECT_THROW(writer.IndexFiles(Enumerate()), StoreConnectionError);
}

TEST_F(IndexWriterTest, WriteGroupsEntitiesByFile) {
  auto store = std::make_shared<InMemoryStoreClient>();
  IndexWriter writer(store, nullptr, ProjectPrefix::FromProjectName("shop"));

  EntityRecord first;
  first.entity_type = EntityType::kFunction;
  first.file_path = "a.py";
  first.name = "one";
  auto second = first;
  second.file_path = "b.py";
  second.name = "two";

  const auto summary = writer.Write({first, second});

  EXPECT_EQ(2u, summary.entities_written);
  EXPECT_EQ(2u, summary.files_written);
  EXPECT_THAT(store->SetMembers("code:shop:file_index"),
              ElementsAre("a.py", "b.py"));
  EXPECT_THROW(writer.IndexFiles({}), std::invalid_argument);
}

TEST_F(IndexWriterTest, RequiresAStore) {
  EXPECT_THROW(IndexWriter(nullptr, nullptr,
                           ProjectPrefix::FromProjectName("shop")),
               std::invalid_argument);
}

} // namespace
} // namespace codemem
