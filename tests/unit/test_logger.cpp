#include "logger/Logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string readAll(const fs::path &file) {
  std::ifstream in(file);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST(Logger, LevelCanBeChanged) {
  const auto previous = Logger::level();
  Logger::setLevel(Logger::Level::Error);
  EXPECT_EQ(Logger::level(), Logger::Level::Error);
  Logger::setLevel(previous);
}

TEST(Logger, WritesFileOnlyAfterInitAndFiltersByLevel) {
  const auto previous = Logger::level();
  fs::path folder = fs::temp_directory_path() /
                    ("gauge_logs_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

  Logger::setLevel(Logger::Level::Warning);
  Logger::init(folder.string());
  Logger::logInfo("[Test] filtered out");
  Logger::logWarning("[Test] kept warning");
  Logger::shutdown();
  Logger::setLevel(previous);

  std::vector<fs::path> files;
  for (const auto &entry : fs::directory_iterator(folder)) {
    files.push_back(entry.path());
  }
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].extension(), ".log");
  EXPECT_EQ(files[0].filename().string().rfind("dstdsv_gauge_", 0), 0u);

  const std::string content = readAll(files[0]);
  EXPECT_NE(content.find("[WARNING]"), std::string::npos);
  EXPECT_NE(content.find("kept warning"), std::string::npos);
  EXPECT_EQ(content.find("filtered out"), std::string::npos);

  std::error_code ec;
  fs::remove_all(folder, ec);
}
