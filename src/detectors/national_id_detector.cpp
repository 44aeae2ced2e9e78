#include "detectors/national_id_detector.h"
#include "detectors/checksums.h"

NationalIdDetector::NationalIdDetector()
    : PatternDetector(TYPE, R"(\b\d{9}\b)", Severity::CRITICAL, 0.95,
                      REGULATORY_REFERENCE) {}

bool NationalIdDetector::validate(const std::string &match) const {
  return Checksums::isValidBsn(match);
}
