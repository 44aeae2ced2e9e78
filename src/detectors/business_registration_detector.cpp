#include "detectors/business_registration_detector.h"
#include "utils/string_utils.h"

BusinessRegistrationDetector::BusinessRegistrationDetector()
    : PatternDetector(TYPE, R"(\b\d{8}\b)", Severity::MEDIUM, 0.5) {}

bool BusinessRegistrationDetector::validate(const std::string &match) const {
  return match.size() == 8 && StringUtils::isAllDigits(match);
}
