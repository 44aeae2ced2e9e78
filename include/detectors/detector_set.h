#ifndef DETECTOR_SET_H
#define DETECTOR_SET_H

#include "detectors/detector.h"
#include <memory>
#include <vector>

// The detectors run against every sampled cell. Immutable after
// construction, so one instance is shared by all scan workers.
class DetectorSet {
  std::vector<std::unique_ptr<IDetector>> detectors_;

public:
  DetectorSet() = default;
  explicit DetectorSet(std::vector<std::unique_ptr<IDetector>> detectors);

  DetectorSet(const DetectorSet &) = delete;
  DetectorSet &operator=(const DetectorSet &) = delete;
  DetectorSet(DetectorSet &&) = default;
  DetectorSet &operator=(DetectorSet &&) = default;

  // BSN, IBAN, KvK, postcode, phone, email and credit card.
  static DetectorSet createDefault();

  // Runs every detector on value. A detector that throws contributes
  // nothing for this value; the others still run.
  std::vector<Finding> scanValue(const std::string &value) const;

  size_t size() const { return detectors_.size(); }
};

#endif
