#include "detectors/contact_detectors.h"
#include "utils/string_utils.h"

PostalCodeDetector::PostalCodeDetector()
    : PatternDetector(TYPE, R"(\b[1-9][0-9]{3} ?(?!SA|SD|SS)[A-Z]{2}\b)",
                      Severity::LOW, 0.7, "GDPR Article 4(1)") {}

PhoneDetector::PhoneDetector()
    : PatternDetector(TYPE,
                      R"((?:\+31|\b0031|\b0)[ -]?[1-9](?:[ -]?[0-9]){8}\b)",
                      Severity::MEDIUM, 0.8, "GDPR Article 4(1)") {}

// The subscriber part after the country or trunk prefix is always nine
// digits.
bool PhoneDetector::validate(const std::string &match) const {
  std::string digits = StringUtils::digitsOnly(match);
  if (StringUtils::startsWith(match, "+31"))
    return digits.size() == 11;
  if (StringUtils::startsWith(match, "0031"))
    return digits.size() == 13;
  return digits.size() == 10;
}

EmailDetector::EmailDetector()
    : PatternDetector(TYPE,
                      R"(\b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b)",
                      Severity::MEDIUM, 0.9, "GDPR Article 4(1)",
                      std::regex::ECMAScript | std::regex::icase) {}
