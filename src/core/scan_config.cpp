#include "core/scan_config.h"

// Runtime scan limits. Atomic so that worker threads can read them while the
// CLI or a test adjusts them.
std::atomic<size_t> ScanConfig::MAX_SCAN_TIME_SECONDS =
    ScanConfig::DEFAULT_MAX_SCAN_TIME;
std::atomic<size_t> ScanConfig::TABLE_TIMEOUT_SECONDS =
    ScanConfig::DEFAULT_TABLE_TIMEOUT;
std::atomic<size_t> ScanConfig::CONNECT_TIMEOUT_SECONDS =
    ScanConfig::DEFAULT_CONNECT_TIMEOUT;
std::atomic<size_t> ScanConfig::QUERY_TIMEOUT_SECONDS =
    ScanConfig::DEFAULT_QUERY_TIMEOUT;
std::atomic<size_t> ScanConfig::REDIS_KEY_SCAN_LIMIT =
    ScanConfig::DEFAULT_REDIS_KEY_SCAN_LIMIT;
std::atomic<size_t> ScanConfig::SCHEMA_SAMPLE_DOCUMENTS =
    ScanConfig::DEFAULT_SCHEMA_SAMPLE_DOCUMENTS;

void ScanConfig::resetToDefaults() {
  MAX_SCAN_TIME_SECONDS = DEFAULT_MAX_SCAN_TIME;
  TABLE_TIMEOUT_SECONDS = DEFAULT_TABLE_TIMEOUT;
  CONNECT_TIMEOUT_SECONDS = DEFAULT_CONNECT_TIMEOUT;
  QUERY_TIMEOUT_SECONDS = DEFAULT_QUERY_TIMEOUT;
  REDIS_KEY_SCAN_LIMIT = DEFAULT_REDIS_KEY_SCAN_LIMIT;
  SCHEMA_SAMPLE_DOCUMENTS = DEFAULT_SCHEMA_SAMPLE_DOCUMENTS;
}
