#include "detectors/financial_detectors.h"
#include "detectors/checksums.h"
#include "utils/string_utils.h"

IbanDetector::IbanDetector()
    : PatternDetector(
          TYPE,
          R"(\b[A-Z]{2}[0-9]{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)",
          Severity::HIGH, 0.9, "GDPR Article 4(1)") {}

bool IbanDetector::validate(const std::string &match) const {
  return Checksums::isValidIban(match);
}

CreditCardDetector::CreditCardDetector()
    : PatternDetector(TYPE, R"(\b(?:[0-9][ -]?){12,18}[0-9]\b)",
                      Severity::HIGH, 0.85, "PCI DSS") {}

bool CreditCardDetector::validate(const std::string &match) const {
  std::string digits = StringUtils::digitsOnly(match);
  return digits.size() >= 13 && digits.size() <= 19 &&
         Checksums::luhnCheck(digits);
}
