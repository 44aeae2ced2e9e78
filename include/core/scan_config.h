#ifndef SCAN_CONFIG_H
#define SCAN_CONFIG_H

#include <atomic>
#include <stdexcept>
#include <string>

struct ScanConfig {
  static std::atomic<size_t> MAX_SCAN_TIME_SECONDS;
  static std::atomic<size_t> TABLE_TIMEOUT_SECONDS;
  static std::atomic<size_t> CONNECT_TIMEOUT_SECONDS;
  static std::atomic<size_t> QUERY_TIMEOUT_SECONDS;
  static std::atomic<size_t> REDIS_KEY_SCAN_LIMIT;
  static std::atomic<size_t> SCHEMA_SAMPLE_DOCUMENTS;

  static constexpr size_t DEFAULT_MAX_SCAN_TIME = 300;
  static constexpr size_t DEFAULT_TABLE_TIMEOUT = 60;
  static constexpr size_t DEFAULT_CONNECT_TIMEOUT = 15;
  static constexpr size_t DEFAULT_QUERY_TIMEOUT = 30;
  static constexpr size_t DEFAULT_REDIS_KEY_SCAN_LIMIT = 10000;
  static constexpr size_t DEFAULT_SCHEMA_SAMPLE_DOCUMENTS = 5;

  static constexpr size_t MIN_MAX_SCAN_TIME = 10;
  static constexpr size_t MAX_MAX_SCAN_TIME = 3600;
  static constexpr size_t MIN_TABLE_TIMEOUT = 1;
  static constexpr size_t MAX_TABLE_TIMEOUT = 600;
  static constexpr size_t MIN_CONNECT_TIMEOUT = 1;
  static constexpr size_t MAX_CONNECT_TIMEOUT = 120;
  static constexpr size_t MIN_QUERY_TIMEOUT = 1;
  static constexpr size_t MAX_QUERY_TIMEOUT = 600;
  static constexpr size_t MIN_REDIS_KEY_SCAN_LIMIT = 100;
  static constexpr size_t MAX_REDIS_KEY_SCAN_LIMIT = 100000;
  static constexpr size_t MIN_SCHEMA_SAMPLE_DOCUMENTS = 1;
  static constexpr size_t MAX_SCHEMA_SAMPLE_DOCUMENTS = 50;

  static void setMaxScanTime(size_t seconds) {
    checkRange("MAX_SCAN_TIME_SECONDS", seconds, MIN_MAX_SCAN_TIME,
               MAX_MAX_SCAN_TIME);
    MAX_SCAN_TIME_SECONDS = seconds;
  }

  static size_t getMaxScanTime() { return MAX_SCAN_TIME_SECONDS; }

  static void setTableTimeout(size_t seconds) {
    checkRange("TABLE_TIMEOUT_SECONDS", seconds, MIN_TABLE_TIMEOUT,
               MAX_TABLE_TIMEOUT);
    TABLE_TIMEOUT_SECONDS = seconds;
  }

  static size_t getTableTimeout() { return TABLE_TIMEOUT_SECONDS; }

  static void setConnectTimeout(size_t seconds) {
    checkRange("CONNECT_TIMEOUT_SECONDS", seconds, MIN_CONNECT_TIMEOUT,
               MAX_CONNECT_TIMEOUT);
    CONNECT_TIMEOUT_SECONDS = seconds;
  }

  static size_t getConnectTimeout() { return CONNECT_TIMEOUT_SECONDS; }

  static void setQueryTimeout(size_t seconds) {
    checkRange("QUERY_TIMEOUT_SECONDS", seconds, MIN_QUERY_TIMEOUT,
               MAX_QUERY_TIMEOUT);
    QUERY_TIMEOUT_SECONDS = seconds;
  }

  static size_t getQueryTimeout() { return QUERY_TIMEOUT_SECONDS; }

  static void setRedisKeyScanLimit(size_t v) {
    checkRange("REDIS_KEY_SCAN_LIMIT", v, MIN_REDIS_KEY_SCAN_LIMIT,
               MAX_REDIS_KEY_SCAN_LIMIT);
    REDIS_KEY_SCAN_LIMIT = v;
  }

  static size_t getRedisKeyScanLimit() { return REDIS_KEY_SCAN_LIMIT; }

  static void setSchemaSampleDocuments(size_t v) {
    checkRange("SCHEMA_SAMPLE_DOCUMENTS", v, MIN_SCHEMA_SAMPLE_DOCUMENTS,
               MAX_SCHEMA_SAMPLE_DOCUMENTS);
    SCHEMA_SAMPLE_DOCUMENTS = v;
  }

  static size_t getSchemaSampleDocuments() { return SCHEMA_SAMPLE_DOCUMENTS; }

  static void resetToDefaults();

private:
  static void checkRange(const char *name, size_t value, size_t min,
                         size_t max) {
    if (value < min || value > max) {
      throw std::invalid_argument(std::string(name) + " must be between " +
                                  std::to_string(min) + " and " +
                                  std::to_string(max));
    }
  }
};

#endif
