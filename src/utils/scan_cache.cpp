#include "utils/scan_cache.h"
#include "core/logger.h"
#include <stdexcept>

MemoryScanCache::MemoryScanCache(size_t maxSize,
                                 std::chrono::seconds defaultTTL)
    : maxSize_(maxSize), defaultTTL_(defaultTTL) {
  if (maxSize_ == 0) {
    throw std::invalid_argument("MemoryScanCache max size must be positive");
  }
  Logger::debug(LogCategory::SYSTEM, "MemoryScanCache",
                "Initialized with max size: " + std::to_string(maxSize_) +
                    ", default TTL: " + std::to_string(defaultTTL_.count()) +
                    "s");
}

std::optional<json> MemoryScanCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = cache_.find(key);
  if (it == cache_.end()) {
    return std::nullopt;
  }

  if (isExpired(it->second)) {
    accessOrder_.erase(it->second.lruIterator);
    cache_.erase(it);
    return std::nullopt;
  }

  accessOrder_.splice(accessOrder_.begin(), accessOrder_,
                      it->second.lruIterator);
  return it->second.value;
}

void MemoryScanCache::put(const std::string &key, const json &value,
                          std::optional<std::chrono::seconds> ttl) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto expiresAt = std::chrono::steady_clock::now() + ttl.value_or(defaultTTL_);

  auto it = cache_.find(key);
  if (it != cache_.end()) {
    it->second.value = value;
    it->second.expiresAt = expiresAt;
    accessOrder_.splice(accessOrder_.begin(), accessOrder_,
                        it->second.lruIterator);
    return;
  }

  if (cache_.size() >= maxSize_) {
    evictLRU();
  }

  accessOrder_.push_front(key);
  CacheEntry entry;
  entry.value = value;
  entry.expiresAt = expiresAt;
  entry.lruIterator = accessOrder_.begin();
  cache_.emplace(key, std::move(entry));
}

size_t MemoryScanCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

// Caller holds mutex_.
void MemoryScanCache::evictLRU() {
  if (accessOrder_.empty()) {
    return;
  }
  Logger::debug(LogCategory::SYSTEM, "MemoryScanCache",
                "Evicting " + accessOrder_.back());
  cache_.erase(accessOrder_.back());
  accessOrder_.pop_back();
}

bool MemoryScanCache::isExpired(const CacheEntry &entry) const {
  return std::chrono::steady_clock::now() >= entry.expiresAt;
}
