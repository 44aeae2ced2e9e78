#ifndef DATABASE_SCANNER_H
#define DATABASE_SCANNER_H

#include "scanner/activity_tracker.h"
#include "scanner/parallel_scan_engine.h"
#include "scanner/scan_types.h"
#include "utils/engine_factory.h"
#include "utils/scan_cache.h"
#include <memory>
#include <optional>

// Runs one scan end to end: connect, introspect, score, pick a strategy,
// sample the selected tables in parallel and aggregate the findings.
//
// A DatabaseScanner can run several scans, including concurrently. No state
// from one scan is visible in another apart from the cache.
class DatabaseScanner {
public:
  explicit DatabaseScanner(std::shared_ptr<IScanCache> cache = nullptr,
                           std::shared_ptr<IActivityTracker> tracker = nullptr,
                           ConnectionOpener opener = EngineFactory::open);

  DatabaseScanner(const DatabaseScanner &) = delete;
  DatabaseScanner &operator=(const DatabaseScanner &) = delete;

  // Throws ConnectionError when the database cannot be opened. Every other
  // failure of the scan is reported in the returned ScanResult.
  ScanResult runScan(const ConnectionParameters &params, ScanMode mode,
                     std::optional<int> maxTables = std::nullopt,
                     const ProgressCallback &progress = nullptr);

  // "db_scan_" followed by 8 random hex digits.
  static std::string generateScanId();

private:
  std::shared_ptr<IScanCache> cache_;
  std::shared_ptr<IActivityTracker> tracker_;
  ConnectionOpener opener_;
  std::shared_ptr<const DetectorSet> detectors_;
  std::unique_ptr<ParallelScanEngine> engine_;

  void cacheAnalysis(const ConnectionParameters &params,
                     const SchemaAnalysis &analysis);
};

#endif
