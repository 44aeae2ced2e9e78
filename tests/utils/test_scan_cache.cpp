#include "core/logger.h"
#include "test_runner.h"
#include "utils/scan_cache.h"
#include <stdexcept>

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  TestRunner runner;

  runner.runTest("Stored values come back until they expire", [&]() {
    MemoryScanCache cache;
    cache.put("schema:a", json{{"totalTables", 3}});
    auto hit = cache.get("schema:a");
    runner.assertTrue(hit.has_value(), "hit");
    if (hit)
      runner.assertEquals(3, (*hit)["totalTables"].get<int64_t>(), "value");
    runner.assertFalse(cache.get("schema:b").has_value(), "miss");
  });

  runner.runTest("Putting an existing key replaces it", [&]() {
    MemoryScanCache cache(2);
    cache.put("k", json(1));
    cache.put("k", json(2));
    runner.assertEquals(1, static_cast<int64_t>(cache.size()), "one entry");
    auto hit = cache.get("k");
    runner.assertTrue(hit.has_value() && *hit == 2, "newest value");
  });

  runner.runTest("Full cache evicts the least recently used entry", [&]() {
    MemoryScanCache single(1);
    single.put("first", json(1));
    single.put("second", json(2));
    runner.assertEquals(1, static_cast<int64_t>(single.size()), "size capped");
    runner.assertFalse(single.get("first").has_value(), "first evicted");
    runner.assertTrue(single.get("second").has_value(), "second kept");

    MemoryScanCache cache(2);
    cache.put("a", json(1));
    cache.put("b", json(2));
    runner.assertTrue(cache.get("a").has_value(), "touch a");
    cache.put("c", json(3));
    runner.assertTrue(cache.get("a").has_value(), "recently used a kept");
    runner.assertFalse(cache.get("b").has_value(), "b evicted");
    runner.assertTrue(cache.get("c").has_value(), "c stored");
  });

  runner.runTest("Zero TTL entries expire immediately", [&]() {
    MemoryScanCache cache;
    cache.put("gone", json(1), std::chrono::seconds(0));
    runner.assertFalse(cache.get("gone").has_value(), "expired on read");
    runner.assertEquals(0, static_cast<int64_t>(cache.size()),
                        "expired entry dropped");

    MemoryScanCache shortLived(4, std::chrono::seconds(0));
    shortLived.put("default", json(1));
    runner.assertFalse(shortLived.get("default").has_value(),
                       "default TTL applies");
  });

  runner.runTest("Zero capacity is rejected", [&]() {
    bool thrown = false;
    try {
      MemoryScanCache cache(0);
    } catch (const std::invalid_argument &) {
      thrown = true;
    }
    runner.assertTrue(thrown, "invalid_argument");
  });

  runner.printSummary();
  return 0;
}
