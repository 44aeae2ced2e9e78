#include "core/logger.h"
#include "core/scanner_config.h"
#include "scanner/activity_tracker.h"
#include "scanner/database_scanner.h"
#include "utils/scan_cache.h"
#include "utils/string_utils.h"
#include <iostream>

namespace {
constexpr int EXIT_SCAN_COMPLETED = 0;
constexpr int EXIT_SCAN_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_CONNECTION_ERROR = 3;

struct CommandLine {
  std::string configPath = "config.json";
  std::optional<ScanMode> mode;
  std::optional<int> maxTables;
};

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " [--config file] [--mode fast|smart|deep] [--max-tables N]"
            << std::endl;
}

// Returns false and prints the reason when the arguments are unusable.
bool parseCommandLine(int argc, char **argv, CommandLine &out) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return false;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: missing value for " << arg << std::endl;
      return false;
    }
    std::string value = argv[++i];

    if (arg == "--config") {
      out.configPath = value;
    } else if (arg == "--mode") {
      out.mode = parseScanMode(value);
      if (!out.mode) {
        std::cerr << "Error: unknown scan mode '" << value << "'" << std::endl;
        return false;
      }
    } else if (arg == "--max-tables") {
      if (!StringUtils::isAllDigits(value) || value.size() > 6 ||
          std::stoi(value) == 0) {
        std::cerr << "Error: --max-tables needs a positive integer"
                  << std::endl;
        return false;
      }
      out.maxTables = std::stoi(value);
    } else {
      std::cerr << "Error: unknown option " << arg << std::endl;
      return false;
    }
  }
  return true;
}
} // namespace

int main(int argc, char **argv) {
  CommandLine commandLine;
  if (!parseCommandLine(argc, argv, commandLine)) {
    printUsage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  ScannerConfig config = ScannerConfig::loadFromFile(commandLine.configPath);
  if (!config.isValid()) {
    for (const auto &error : config.errors()) {
      std::cerr << "Configuration error: " << error << std::endl;
    }
    if (config.errors().empty()) {
      std::cerr << "Configuration error: no connection configured"
                << std::endl;
    }
    return EXIT_CONFIG_ERROR;
  }
  if (commandLine.mode)
    config.setScanMode(*commandLine.mode);
  if (commandLine.maxTables)
    config.setMaxTables(commandLine.maxTables);

  Logger::initialize(config.logFile());
  if (!Logger::setLogLevel(config.logLevel())) {
    Logger::warning(LogCategory::CONFIG, "main",
                    "Unknown log level '" + config.logLevel() +
                        "', using INFO");
  }

  int exitCode = EXIT_SCAN_COMPLETED;
  try {
    DatabaseScanner scanner(std::make_shared<MemoryScanCache>(),
                            std::make_shared<LoggingActivityTracker>());

    ScanResult result = scanner.runScan(
        *config.connection(), config.scanMode(), config.maxTables(),
        [](int completed, int total, const std::string &message) {
          std::cerr << "[" << completed << "/" << total << "] " << message
                    << std::endl;
        });

    std::cout << toJsonText(result) << std::endl;
    exitCode =
        result.status == "completed" ? EXIT_SCAN_COMPLETED : EXIT_SCAN_FAILED;
  } catch (const ConnectionError &e) {
    Logger::error(LogCategory::DATABASE, "main", e.what());
    std::cerr << "Connection error: " << e.what() << std::endl;
    exitCode = EXIT_CONNECTION_ERROR;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Scan aborted: " + std::string(e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    exitCode = EXIT_SCAN_FAILED;
  }

  Logger::shutdown();
  return exitCode;
}
