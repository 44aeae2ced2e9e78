#ifndef CONTACT_DETECTORS_H
#define CONTACT_DETECTORS_H

#include "detectors/detector.h"

// Dutch postcode "1234 AB". The letter pairs SA, SD and SS are never issued.
class PostalCodeDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "Postal Code";

  PostalCodeDetector();
};

// Dutch phone numbers in national (06..., 020...) or international
// (+31, 0031) form, with optional single spaces or dashes between digits.
class PhoneDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "Phone Number";

  PhoneDetector();

protected:
  bool validate(const std::string &match) const override;
};

class EmailDetector : public PatternDetector {
public:
  static constexpr const char *TYPE = "Email";

  EmailDetector();
};

#endif
