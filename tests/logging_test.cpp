#include <jsgraph/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  jsgraph::StructuredLogger logger(stream, {jsgraph::LogLevel::kInfo});

  logger.Log(jsgraph::LogLevel::kDebug, "debug message", {});
  logger.Log(jsgraph::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  jsgraph::StructuredLogger logger(stream, {jsgraph::LogLevel::kDebug});

  logger.Log(jsgraph::LogLevel::kDebug, "graph_builder.file.complete",
             {{"file", "src/a.js"}, {"nodes", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"file\": \"src/a.js\""));
  EXPECT_NE(std::string::npos, output.find("\"nodes\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"graph_builder.file.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = jsgraph::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<jsgraph::NullLogger>(provided));

  auto custom = std::make_shared<jsgraph::StructuredLogger>(
      std::cout, jsgraph::LoggingConfig{});
  EXPECT_EQ(custom, jsgraph::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(jsgraph::LogLevel::kError, jsgraph::ParseLogLevel("ERROR"));
  EXPECT_EQ(jsgraph::LogLevel::kWarn, jsgraph::ParseLogLevel("warning"));
  EXPECT_EQ(jsgraph::LogLevel::kInfo, jsgraph::ParseLogLevel(" Info "));
  EXPECT_EQ(jsgraph::LogLevel::kDebug, jsgraph::ParseLogLevel("debug"));
  EXPECT_THROW(jsgraph::ParseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggingTest, ConcurrentWritersProduceWholeLines) {
  std::stringstream stream;
  jsgraph::StructuredLogger logger(stream, {jsgraph::LogLevel::kInfo});

  std::vector<std::thread> writers;
  for (int i = 0; i < 4; ++i) {
    writers.emplace_back([&logger, i]() {
      for (int j = 0; j < 50; ++j) {
        logger.Log(jsgraph::LogLevel::kInfo, "worker.event",
                   {{"worker", std::to_string(i)}});
      }
    });
  }
  for (auto &writer : writers) {
    writer.join();
  }

  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    EXPECT_EQ(0u, line.find('['));
    EXPECT_NE(std::string::npos, line.find("message=\"worker.event\""));
    ++lines;
  }
  EXPECT_EQ(200, lines);
}

} // namespace
