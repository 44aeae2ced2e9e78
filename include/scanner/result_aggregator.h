#ifndef RESULT_AGGREGATOR_H
#define RESULT_AGGREGATOR_H

#include "scanner/parallel_scan_engine.h"
#include "scanner/scan_types.h"

class ResultAggregator {
public:
  // tablesScanned / tablesDiscovered * 100, or 0 when nothing was
  // discovered.
  static double coveragePercent(int tablesScanned, int tablesDiscovered);

  static ScanResult completed(const std::string &scanId,
                              const ConnectionParameters &params,
                              ScanMode mode, const SchemaAnalysis &analysis,
                              const ScanStrategy &strategy,
                              TableScanBatch batch,
                              std::vector<IntrospectionIssue> issues);

  static ScanResult failed(const std::string &scanId,
                           const ConnectionParameters &params, ScanMode mode,
                           const std::string &error,
                           std::vector<IntrospectionIssue> issues,
                           double elapsedSeconds);
};

#endif
