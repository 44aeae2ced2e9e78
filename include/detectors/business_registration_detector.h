#ifndef BUSINESS_REGISTRATION_DETECTOR_H
#define BUSINESS_REGISTRATION_DETECTOR_H

#include "detectors/detector.h"

// Dutch Chamber of Commerce (KvK) numbers: any standalone 8-digit token.
// There is no checksum, so invoice numbers and compact dates match too;
// findings carry a low confidence to reflect that.
class BusinessRegistrationDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "KvK Number";

  BusinessRegistrationDetector();

protected:
  bool validate(const std::string &match) const override;
};

#endif
