#ifndef FINANCIAL_DETECTORS_H
#define FINANCIAL_DETECTORS_H

#include "detectors/detector.h"

// IBAN bank account numbers, plain or grouped in fours, validated mod-97.
class IbanDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "IBAN";

  IbanDetector();

protected:
  bool validate(const std::string &match) const override;
};

// 13 to 19 digit card numbers, optionally split by spaces or dashes,
// reported only when the Luhn check passes.
class CreditCardDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "Credit Card";

  CreditCardDetector();

protected:
  bool validate(const std::string &match) const override;
};

#endif
