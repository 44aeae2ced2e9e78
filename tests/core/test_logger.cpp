#include "core/file_log_writer.h"
#include "core/logger.h"
#include "test_runner.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
std::string readFile(const std::string &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

int main() {
  TestRunner runner;
  auto dir = std::filesystem::temp_directory_path() / "intelliscan_log_test";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  runner.runTest("FileLogWriter creates missing directories", [&]() {
    std::string path = (dir / "nested" / "scan.log").string();
    FileLogWriter writer(path);
    runner.assertTrue(writer.isOpen(), "file opened");
    runner.assertTrue(writer.write("first line"), "write succeeded");
    writer.close();
    runner.assertFalse(writer.isOpen(), "closed");
    runner.assertTrue(readFile(path).find("first line") != std::string::npos,
                      "line written");
  });

  runner.runTest("FileLogWriter rotates into numbered backups", [&]() {
    std::string path = (dir / "rotate.log").string();
    FileLogWriter writer(path, 64, 2);
    for (int i = 0; i < 20; ++i) {
      writer.write("line " + std::to_string(i) + " padding padding padding");
    }
    writer.close();
    runner.assertTrue(std::filesystem::exists(path + ".1"), "first backup");
    runner.assertTrue(std::filesystem::exists(path + ".2"), "second backup");
    runner.assertFalse(std::filesystem::exists(path + ".3"),
                       "backups capped at two");
  });

  runner.runTest("Logger writes formatted lines above the level", [&]() {
    std::string path = (dir / "logger.log").string();
    Logger::initialize(path);
    Logger::setLogLevel(LogLevel::INFO);
    Logger::debug(LogCategory::SCAN, "hidden", "should not appear");
    Logger::info(LogCategory::SCAN, "runScan", "scan started");
    Logger::shutdown();

    std::string contents = readFile(path);
    runner.assertTrue(contents.find("[INFO] [SCAN] [runScan] scan started") !=
                          std::string::npos,
                      "formatted info line");
    runner.assertTrue(contents.find("should not appear") == std::string::npos,
                      "debug filtered");
  });

  runner.runTest("Category names map back to categories", [&]() {
    runner.assertTrue(Logger::stringToCategory("DETECTION") ==
                          LogCategory::DETECTION,
                      "known category");
    runner.assertTrue(Logger::stringToCategory("NOPE") == LogCategory::UNKNOWN,
                      "unknown category");
  });

  std::filesystem::remove_all(dir, ec);
  runner.printSummary();
  return 0;
}
