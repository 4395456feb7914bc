#include <codemem/errors.h>
#include <codemem/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace codemem {
namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kInfo});

  logger.Log(LogLevel::kDebug, "index.stale_removed", {});
  logger.Log(LogLevel::kInfo, "index.start", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("index.stale_removed"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("index.start"));
}

TEST(LoggingTest, DefaultLevelIsWarn) {
  std::stringstream stream;
  StructuredLogger logger(stream, LoggingConfig{});

  logger.Log(LogLevel::kInfo, "remember.start", {});
  logger.Log(LogLevel::kWarn, "extract.node_skipped", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("remember.start"));
  EXPECT_NE(std::string::npos, output.find("level=warn"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kDebug});

  logger.Log(LogLevel::kDebug, "remember.stage.complete",
             {{"stage", "index"}, {"files", "3"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"index\""));
  EXPECT_NE(std::string::npos, output.find("\"files\": \"3\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"remember.stage.complete\""));
}

TEST(LoggingTest, EscapesQuotesAndNewlinesInFieldValues) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kDebug});

  logger.Log(LogLevel::kWarn, "index.entity_failed",
             {{"error", "bad \"value\"\nsecond line"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos,
            output.find("\"error\": \"bad \\\"value\\\"\\nsecond line\""));
  EXPECT_EQ(output.find('\n'), output.size() - 1);
}

TEST(LoggingTest, ConcurrentWritersProduceWholeLines) {
  std::stringstream stream;
  auto logger = MakeLogger({LogLevel::kInfo}, stream);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&logger, t]() {
      for (int i = 0; i < 50; ++i) {
        logger->Log(LogLevel::kInfo, "worker.tick",
                    {{"worker", std::to_string(t)}});
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  std::string line;
  std::size_t lines = 0;
  while (std::getline(stream, line)) {
    ++lines;
    EXPECT_EQ(0u, line.find('['));
    EXPECT_NE(std::string::npos, line.find("fields={\"worker\": \""));
  }
  EXPECT_EQ(200u, lines);
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(LogLevel::kError, ParseLogLevel("error"));
  EXPECT_EQ(LogLevel::kWarn, ParseLogLevel("Warning"));
  EXPECT_EQ(LogLevel::kInfo, ParseLogLevel(" info "));
  EXPECT_EQ(LogLevel::kDebug, ParseLogLevel("DEBUG"));
  EXPECT_THROW(ParseLogLevel("loud"), ConfigurationError);
  EXPECT_EQ("warn", LogLevelName(LogLevel::kWarn));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<NullLogger>(provided));

  auto custom = std::make_shared<StructuredLogger>(std::cout, LoggingConfig{});
  EXPECT_EQ(custom, EnsureLogger(custom));
}

} // namespace
} // namespace codemem
