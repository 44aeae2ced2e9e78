#ifndef SCAN_CACHE_H
#define SCAN_CACHE_H

#include <chrono>
#include <list>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

using json = nlohmann::json;

// Cache for data computed during a scan (schema summaries). Entries are
// informational; the scanner never skips work because of a hit.
class IScanCache {
public:
  virtual ~IScanCache() = default;

  virtual std::optional<json> get(const std::string &key) = 0;
  virtual void put(const std::string &key, const json &value,
                   std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;
};

class NoOpScanCache : public IScanCache {
public:
  std::optional<json> get(const std::string &) override {
    return std::nullopt;
  }
  void put(const std::string &, const json &,
           std::optional<std::chrono::seconds>) override {}
};

// In-process LRU cache with per-entry TTL. Thread-safe.
class MemoryScanCache : public IScanCache {
public:
  explicit MemoryScanCache(
      size_t maxSize = 256,
      std::chrono::seconds defaultTTL = std::chrono::seconds(3600));

  std::optional<json> get(const std::string &key) override;
  void put(const std::string &key, const json &value,
           std::optional<std::chrono::seconds> ttl = std::nullopt) override;

  size_t size() const;

private:
  struct CacheEntry {
    json value;
    std::chrono::steady_clock::time_point expiresAt;
    std::list<std::string>::iterator lruIterator;
  };

  mutable std::mutex mutex_;
  size_t maxSize_;
  std::chrono::seconds defaultTTL_;
  std::list<std::string> accessOrder_;
  std::unordered_map<std::string, CacheEntry> cache_;

  void evictLRU();
  bool isExpired(const CacheEntry &entry) const;
};

#endif
