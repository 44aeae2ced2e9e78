#ifndef PARALLEL_SCAN_ENGINE_H
#define PARALLEL_SCAN_ENGINE_H

#include "detectors/detector_set.h"
#include "scanner/scan_types.h"
#include "utils/engine_factory.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// What one worker hands back for one table.
struct TableScanOutcome {
  size_t taskId = 0;
  std::string table;
  bool success = false;
  std::vector<Finding> findings;
  int64_t rowsSampled = 0;
  std::string error;
  double seconds = 0.0;
};

struct ScanStats {
  int tablesScanned = 0;
  int tablesSkipped = 0;
  int64_t rowsAnalyzed = 0;
  double elapsedSeconds = 0.0;
  bool budgetExceeded = false;
  std::vector<std::string> scannedTables;
};

struct TableScanBatch {
  std::vector<Finding> findings;
  ScanStats stats;
};

// Samples tables on at most strategy.workers threads. Each task opens its
// own connection through the opener and sends its outcome back over a
// queue; only the calling thread merges outcomes and reports progress.
//
// A task that exceeds strategy.tableTimeoutSeconds is abandoned: its cancel
// flag is raised and the table counts as skipped. The abandoned thread keeps
// its worker slot until it actually returns, since it may still hold a
// connection. Once strategy.maxScanTimeSeconds has elapsed no further tables
// are started and the remaining ones count as skipped.
//
// Finished abandoned threads are joined at the start and end of scan() and
// by abandonedTasks(); the rest are joined when the engine is destroyed.
class ParallelScanEngine {
public:
  explicit ParallelScanEngine(std::shared_ptr<const DetectorSet> detectors,
                              ConnectionOpener opener = EngineFactory::open);
  ~ParallelScanEngine();

  ParallelScanEngine(const ParallelScanEngine &) = delete;
  ParallelScanEngine &operator=(const ParallelScanEngine &) = delete;

  TableScanBatch scan(const std::vector<TableDescriptor> &tables,
                      const ConnectionParameters &params,
                      const ScanStrategy &strategy,
                      const ProgressCallback &progress);

  // Abandoned tasks whose thread has not returned yet.
  size_t abandonedTasks();

  // Samples one table and runs the detectors on every cell. Findings with
  // the same column and detector type are merged into one with an
  // occurrence count. Runs on a worker thread.
  static TableScanOutcome scanTable(const TableDescriptor &table,
                                    const ConnectionParameters &params,
                                    size_t sampleSize,
                                    const DetectorSet &detectors,
                                    const ConnectionOpener &opener,
                                    const std::atomic<bool> &cancel);

private:
  struct AbandonedTask {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Joins abandoned threads that have finished and returns how many are
  // still running.
  size_t reapAbandoned();

  std::shared_ptr<const DetectorSet> detectors_;
  ConnectionOpener opener_;

  std::mutex abandonedMutex_;
  std::vector<AbandonedTask> abandoned_;
};

#endif
