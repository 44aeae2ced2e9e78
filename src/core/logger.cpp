#include "core/logger.h"
#include "core/file_log_writer.h"
#include <algorithm>

// Static member initialization for Logger. writer_ is the active sink,
// logMutex serializes writes to it, and configMutex guards the level.
std::unique_ptr<ILogWriter> Logger::writer_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},       {"DATABASE", LogCategory::DATABASE},
    {"CONFIG", LogCategory::CONFIG},       {"SCHEMA", LogCategory::SCHEMA},
    {"STRATEGY", LogCategory::STRATEGY},   {"SCAN", LogCategory::SCAN},
    {"DETECTION", LogCategory::DETECTION}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  auto it = levelMap.find(levelStr);
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

// Initializes the Logger sink. When logFile is empty, lines go to stderr
// through a ConsoleLogWriter. Otherwise a rotating FileLogWriter is opened;
// if the file cannot be opened the console writer is used instead and a
// warning is printed so the failure is not silent.
void Logger::initialize(const std::string &logFile) {
  std::unique_ptr<ILogWriter> next;
  if (!logFile.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(logFile);
    if (fileWriter->isOpen()) {
      next = std::move(fileWriter);
    } else {
      std::cerr << "Warning: could not open log file '" << logFile
                << "', logging to stderr" << std::endl;
    }
  }
  if (!next) {
    next = std::make_unique<ConsoleLogWriter>();
  }

  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_) {
    writer_->close();
  }
  writer_ = std::move(next);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_) {
    writer_->flush();
    writer_->close();
  }
  writer_.reset();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Sets the level from its name, case-insensitively. Accepts DEBUG, INFO,
// WARN/WARNING, ERROR and FATAL/CRITICAL. Returns false and leaves the level
// unchanged for anything else.
bool Logger::setLogLevel(const std::string &levelStr) {
  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return false;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
  return true;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
