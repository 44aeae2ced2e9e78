#include "scanner/parallel_scan_engine.h"
#include "core/logger.h"
#include "scanner/thread_safe_queue.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace {

using Clock = std::chrono::steady_clock;

struct RunningTask {
  std::thread thread;
  std::shared_ptr<std::atomic<bool>> cancel;
  std::shared_ptr<std::atomic<bool>> done;
  Clock::time_point started;
  std::string table;
};

void reportProgress(const ProgressCallback &progress, int completed,
                    int total, const std::string &message) {
  if (!progress) {
    return;
  }
  try {
    progress(completed, total, message);
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::SCAN, "reportProgress",
                    "Progress callback threw: " + std::string(e.what()));
  }
}

} // namespace

ParallelScanEngine::ParallelScanEngine(
    std::shared_ptr<const DetectorSet> detectors, ConnectionOpener opener)
    : detectors_(std::move(detectors)), opener_(std::move(opener)) {
  if (!detectors_) {
    throw std::invalid_argument("ParallelScanEngine requires a detector set");
  }
  if (!opener_) {
    throw std::invalid_argument(
        "ParallelScanEngine requires a connection opener");
  }
}

ParallelScanEngine::~ParallelScanEngine() {
  std::lock_guard<std::mutex> lock(abandonedMutex_);
  for (auto &task : abandoned_) {
    if (task.thread.joinable()) {
      task.thread.join();
    }
  }
}

size_t ParallelScanEngine::reapAbandoned() {
  std::lock_guard<std::mutex> lock(abandonedMutex_);
  for (auto it = abandoned_.begin(); it != abandoned_.end();) {
    if (!it->done->load()) {
      ++it;
      continue;
    }
    if (it->thread.joinable()) {
      it->thread.join();
    }
    it = abandoned_.erase(it);
  }
  return abandoned_.size();
}

size_t ParallelScanEngine::abandonedTasks() { return reapAbandoned(); }

TableScanOutcome ParallelScanEngine::scanTable(
    const TableDescriptor &table, const ConnectionParameters &params,
    size_t sampleSize, const DetectorSet &detectors,
    const ConnectionOpener &opener, const std::atomic<bool> &cancel) {
  TableScanOutcome outcome;
  outcome.table = table.qualifiedName();
  auto start = Clock::now();

  try {
    auto connection = opener(params);
    auto rows = connection->sampleRows(table, sampleSize, cancel);

    std::vector<Finding> merged;
    std::map<std::pair<std::string, std::string>, size_t> index;
    for (const auto &row : rows) {
      if (cancel) {
        break;
      }
      for (const auto &cell : row) {
        for (auto &finding : detectors.scanValue(cell.value)) {
          auto key = std::make_pair(cell.column, finding.detectorType);
          auto it = index.find(key);
          if (it != index.end()) {
            Finding &existing = merged[it->second];
            existing.occurrences++;
            existing.confidence =
                std::max(existing.confidence, finding.confidence);
            continue;
          }
          finding.table = outcome.table;
          finding.column = cell.column;
          index.emplace(key, merged.size());
          merged.push_back(std::move(finding));
        }
      }
      outcome.rowsSampled++;
    }

    outcome.findings = std::move(merged);
    outcome.success = !cancel;
    if (cancel) {
      outcome.error = "cancelled";
    }
  } catch (const std::exception &e) {
    outcome.success = false;
    outcome.error = e.what();
  }

  outcome.seconds = TimeUtils::secondsSince(start);
  return outcome;
}

// Runs the scan loop on the calling thread. Up to strategy.workers tasks are
// in flight at once; each one is a thread that opens its own connection,
// samples one table and pushes a TableScanOutcome onto a shared queue. The
// loop pops outcomes with a short timeout so it can check per-table
// deadlines and the overall budget between results.
//
// Timed-out tasks are not waited for. Their cancel flag is set, their thread
// moves to abandoned_ and whatever they push later is ignored. Until such a
// thread raises its done flag it still counts against strategy.workers. The
// queue is held by shared_ptr so late pushes stay valid after scan() returns.
TableScanBatch
ParallelScanEngine::scan(const std::vector<TableDescriptor> &tables,
                         const ConnectionParameters &params,
                         const ScanStrategy &strategy,
                         const ProgressCallback &progress) {
  TableScanBatch batch;
  auto scanStart = Clock::now();
  const int total = static_cast<int>(tables.size());
  const size_t workers = static_cast<size_t>(std::max(1, strategy.workers));
  const size_t sampleSize =
      static_cast<size_t>(std::max(1, strategy.sampleSize));
  const auto tableTimeout =
      std::chrono::seconds(std::max(1, strategy.tableTimeoutSeconds));
  const auto scanBudget =
      std::chrono::seconds(std::max(1, strategy.maxScanTimeSeconds));

  Logger::info(LogCategory::SCAN, "scan",
               "Scanning " + std::to_string(total) + " tables with " +
                   std::to_string(workers) + " workers, sample size " +
                   std::to_string(sampleSize));

  auto channel = std::make_shared<ThreadSafeQueue<TableScanOutcome>>();
  std::unordered_map<size_t, RunningTask> running;
  size_t next = 0;
  int completed = 0;
  bool budgetExceeded = false;

  reportProgress(progress, 0, total, "Starting scan");

  while (true) {
    size_t liveAbandoned = reapAbandoned();
    while (!budgetExceeded && running.size() + liveAbandoned < workers &&
           next < tables.size()) {
      if (Clock::now() - scanStart >= scanBudget) {
        budgetExceeded = true;
        break;
      }

      size_t taskId = next++;
      RunningTask task;
      task.cancel = std::make_shared<std::atomic<bool>>(false);
      task.done = std::make_shared<std::atomic<bool>>(false);
      task.started = Clock::now();
      task.table = tables[taskId].qualifiedName();

      auto cancel = task.cancel;
      auto done = task.done;
      auto detectors = detectors_;
      auto opener = opener_;
      TableDescriptor table = tables[taskId];
      ConnectionParameters taskParams = params;
      task.thread = std::thread([=]() {
        TableScanOutcome outcome;
        try {
          outcome = scanTable(table, taskParams, sampleSize, *detectors,
                              opener, *cancel);
        } catch (const std::exception &e) {
          outcome.table = table.qualifiedName();
          outcome.success = false;
          outcome.error = e.what();
        }
        outcome.taskId = taskId;
        channel->push(std::move(outcome));
        done->store(true);
      });

      Logger::debug(LogCategory::SCAN, "scan",
                    "Dispatched table " + task.table);
      running.emplace(taskId, std::move(task));
    }

    // Abandoned threads may still be holding every slot; keep polling until
    // one returns or the budget runs out.
    if (running.empty() && (budgetExceeded || next >= tables.size())) {
      break;
    }

    TableScanOutcome outcome;
    if (channel->pop(outcome, std::chrono::milliseconds(100))) {
      auto it = running.find(outcome.taskId);
      if (it != running.end()) {
        if (it->second.thread.joinable()) {
          it->second.thread.join();
        }
        running.erase(it);
        completed++;

        if (outcome.success) {
          batch.stats.tablesScanned++;
          batch.stats.rowsAnalyzed += outcome.rowsSampled;
          batch.stats.scannedTables.push_back(outcome.table);
          for (auto &finding : outcome.findings) {
            batch.findings.push_back(std::move(finding));
          }
          reportProgress(progress, completed, total,
                         "Scanned " + outcome.table);
        } else {
          batch.stats.tablesSkipped++;
          Logger::warning(LogCategory::SCAN, "scan",
                          "Skipping table " + outcome.table + ": " +
                              outcome.error);
          reportProgress(progress, completed, total,
                         "Skipped " + outcome.table);
        }
      }
    }

    auto now = Clock::now();
    for (auto it = running.begin(); it != running.end();) {
      if (now - it->second.started < tableTimeout) {
        ++it;
        continue;
      }
      it->second.cancel->store(true);
      Logger::warning(LogCategory::SCAN, "scan",
                      "Table " + it->second.table + " exceeded " +
                          std::to_string(tableTimeout.count()) +
                          "s, abandoning");
      {
        std::lock_guard<std::mutex> lock(abandonedMutex_);
        abandoned_.push_back(
            {std::move(it->second.thread), it->second.done});
      }
      std::string table = it->second.table;
      it = running.erase(it);
      completed++;
      batch.stats.tablesSkipped++;
      reportProgress(progress, completed, total, "Timed out " + table);
    }

    if (!budgetExceeded && now - scanStart >= scanBudget) {
      budgetExceeded = true;
    }
  }

  if (next < tables.size()) {
    int undispatched = static_cast<int>(tables.size() - next);
    batch.stats.tablesSkipped += undispatched;
    Logger::warning(LogCategory::SCAN, "scan",
                    "Scan budget of " + std::to_string(scanBudget.count()) +
                        "s reached, " + std::to_string(undispatched) +
                        " tables not started");
    completed = total;
    reportProgress(progress, completed, total, "Scan budget exhausted");
  }

  size_t stillRunning = reapAbandoned();
  if (stillRunning > 0) {
    Logger::warning(LogCategory::SCAN, "scan",
                    std::to_string(stillRunning) +
                        " abandoned tasks have not returned yet");
  }

  batch.stats.budgetExceeded = budgetExceeded;
  batch.stats.elapsedSeconds = TimeUtils::secondsSince(scanStart);

  Logger::info(LogCategory::SCAN, "scan",
               "Scan finished: " + std::to_string(batch.stats.tablesScanned) +
                   " scanned, " + std::to_string(batch.stats.tablesSkipped) +
                   " skipped, " + std::to_string(batch.findings.size()) +
                   " findings in " +
                   std::to_string(batch.stats.elapsedSeconds) + "s");
  return batch;
}
