#include "detectors/detector_set.h"
#include "core/database_defaults.h"
#include "core/logger.h"
#include "detectors/business_registration_detector.h"
#include "detectors/contact_detectors.h"
#include "detectors/financial_detectors.h"
#include "detectors/national_id_detector.h"

DetectorSet::DetectorSet(std::vector<std::unique_ptr<IDetector>> detectors)
    : detectors_(std::move(detectors)) {}

DetectorSet DetectorSet::createDefault() {
  std::vector<std::unique_ptr<IDetector>> detectors;
  detectors.push_back(std::make_unique<NationalIdDetector>());
  detectors.push_back(std::make_unique<IbanDetector>());
  detectors.push_back(std::make_unique<BusinessRegistrationDetector>());
  detectors.push_back(std::make_unique<PostalCodeDetector>());
  detectors.push_back(std::make_unique<PhoneDetector>());
  detectors.push_back(std::make_unique<EmailDetector>());
  detectors.push_back(std::make_unique<CreditCardDetector>());
  return DetectorSet(std::move(detectors));
}

std::vector<Finding> DetectorSet::scanValue(const std::string &value) const {
  std::vector<Finding> findings;
  if (value.empty())
    return findings;

  const std::string &input =
      value.size() > DatabaseDefaults::MAX_CELL_LENGTH
          ? value.substr(0, DatabaseDefaults::MAX_CELL_LENGTH)
          : value;

  for (const auto &detector : detectors_) {
    try {
      auto found = detector->detect(input);
      findings.insert(findings.end(),
                      std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
    } catch (const std::exception &e) {
      Logger::debug(LogCategory::DETECTION, "DetectorSet",
                    detector->name() + " failed on a value: " + e.what());
    }
  }
  return findings;
}
