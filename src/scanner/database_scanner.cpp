#include "scanner/database_scanner.h"
#include "core/logger.h"
#include "scanner/priority_scorer.h"
#include "scanner/result_aggregator.h"
#include "scanner/schema_analyzer.h"
#include "scanner/strategy_selector.h"
#include "scanner/table_selector.h"
#include "utils/time_utils.h"
#include <iomanip>
#include <random>
#include <sstream>

namespace {
constexpr const char *NO_TABLES_ERROR = "No accessible tables found";
constexpr std::chrono::seconds SCHEMA_CACHE_TTL{3600};
} // namespace

DatabaseScanner::DatabaseScanner(std::shared_ptr<IScanCache> cache,
                                 std::shared_ptr<IActivityTracker> tracker,
                                 ConnectionOpener opener)
    : cache_(cache ? std::move(cache) : std::make_shared<NoOpScanCache>()),
      tracker_(tracker ? std::move(tracker)
                       : std::make_shared<NoOpActivityTracker>()),
      opener_(opener ? std::move(opener) : ConnectionOpener(EngineFactory::open)),
      detectors_(std::make_shared<DetectorSet>(
          DetectorSet::createDefault())) {
  engine_ = std::make_unique<ParallelScanEngine>(detectors_, opener_);
}

std::string DatabaseScanner::generateScanId() {
  static thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> distribution;

  std::ostringstream id;
  id << "db_scan_" << std::hex << std::setw(8) << std::setfill('0')
     << distribution(generator);
  return id.str();
}

void DatabaseScanner::cacheAnalysis(const ConnectionParameters &params,
                                    const SchemaAnalysis &analysis) {
  std::string key = "schema:" + params.toSafeString();

  auto previous = cache_->get(key);
  if (previous) {
    Logger::debug(LogCategory::SCAN, "cacheAnalysis",
                  "Previous analysis for this database: " +
                      previous->dump(-1, ' ', false,
                                     json::error_handler_t::replace));
  }

  json summary = {{"totalTables", analysis.totalTables},
                  {"estimatedRows", analysis.estimatedRows},
                  {"high", analysis.distribution.high},
                  {"medium", analysis.distribution.medium},
                  {"low", analysis.distribution.low},
                  {"riskScore", analysis.riskScore},
                  {"riskLevel", riskLevelToString(analysis.riskLevel)}};
  cache_->put(key, summary, SCHEMA_CACHE_TTL);
}

// Pipeline for one scan. Introspection uses a single connection that is
// closed before sampling starts; each sampling task opens its own.
//
// Only ConnectionError escapes. A catalog that cannot be listed, or one that
// lists no tables, gives a result with status "failed". Tables that fail or
// time out while sampling are counted as skipped and the scan still
// completes.
ScanResult DatabaseScanner::runScan(const ConnectionParameters &params,
                                    ScanMode mode,
                                    std::optional<int> maxTables,
                                    const ProgressCallback &progress) {
  const std::string scanId = generateScanId();
  auto start = std::chrono::steady_clock::now();
  tracker_->scanStarted(scanId, params, mode);

  std::vector<IntrospectionIssue> issues;
  std::vector<TableDescriptor> tables;
  try {
    auto connection = opener_(params);
    tables = connection->introspect(issues);
  } catch (const ConnectionError &e) {
    tracker_->scanFailed(scanId, e.what());
    throw;
  } catch (const IntrospectionError &e) {
    auto result = ResultAggregator::failed(scanId, params, mode, e.what(),
                                           std::move(issues),
                                           TimeUtils::secondsSince(start));
    tracker_->scanFailed(scanId, result.error);
    return result;
  }

  for (const auto &issue : issues) {
    Logger::warning(LogCategory::SCHEMA, "runScan",
                    "Could not introspect " + issue.table + ": " +
                        issue.message);
  }

  if (tables.empty()) {
    auto result = ResultAggregator::failed(scanId, params, mode,
                                           NO_TABLES_ERROR, std::move(issues),
                                           TimeUtils::secondsSince(start));
    tracker_->scanFailed(scanId, result.error);
    return result;
  }

  PriorityScorer::scoreAll(tables);
  SchemaAnalysis analysis = SchemaAnalyzer::analyze(std::move(tables));
  cacheAnalysis(params, analysis);

  ScanStrategy strategy = StrategySelector::select(analysis, mode, maxTables);

  std::vector<TableDescriptor> selected =
      TableSelector::select(analysis.tables, strategy);

  TableScanBatch batch = engine_->scan(selected, params, strategy, progress);

  // Discovered tables that the strategy left out are neither scanned nor
  // skipped; coverage reflects them.
  ScanResult result =
      ResultAggregator::completed(scanId, params, mode, analysis, strategy,
                                  std::move(batch), std::move(issues));
  result.elapsedSeconds = TimeUtils::secondsSince(start);

  tracker_->scanCompleted(result);
  return result;
}
