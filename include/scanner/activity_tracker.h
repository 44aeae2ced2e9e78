#ifndef ACTIVITY_TRACKER_H
#define ACTIVITY_TRACKER_H

#include "scanner/scan_types.h"
#include <string>

// Receives one notification at the start of a scan and one at the end.
// Implementations must not throw.
class IActivityTracker {
public:
  virtual ~IActivityTracker() = default;

  virtual void scanStarted(const std::string &scanId,
                           const ConnectionParameters &params,
                           ScanMode mode) = 0;
  virtual void scanCompleted(const ScanResult &result) = 0;
  virtual void scanFailed(const std::string &scanId,
                          const std::string &error) = 0;
};

class NoOpActivityTracker : public IActivityTracker {
public:
  void scanStarted(const std::string &, const ConnectionParameters &,
                   ScanMode) override {}
  void scanCompleted(const ScanResult &) override {}
  void scanFailed(const std::string &, const std::string &) override {}
};

class LoggingActivityTracker : public IActivityTracker {
public:
  void scanStarted(const std::string &scanId,
                   const ConnectionParameters &params,
                   ScanMode mode) override;
  void scanCompleted(const ScanResult &result) override;
  void scanFailed(const std::string &scanId,
                  const std::string &error) override;
};

#endif
