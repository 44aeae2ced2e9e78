#ifndef NATIONAL_ID_DETECTOR_H
#define NATIONAL_ID_DETECTOR_H

#include "detectors/detector.h"

// Dutch citizen service number (BSN). Nine-digit tokens are reported only
// when they pass the 11-proof; others are dropped silently.
class NationalIdDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "BSN";
  static constexpr const char *REGULATORY_REFERENCE =
      "UAVG; GDPR Article 9 (special category data)";

  NationalIdDetector();

protected:
  bool validate(const std::string &match) const override;
};

#endif
