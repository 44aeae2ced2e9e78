#include "core/logger.h"
#include "detectors/business_registration_detector.h"
#include "detectors/checksums.h"
#include "detectors/contact_detectors.h"
#include "detectors/detector_set.h"
#include "detectors/financial_detectors.h"
#include "detectors/national_id_detector.h"
#include "test_runner.h"
#include <stdexcept>

namespace {
class ThrowingDetector : public IDetector {
  std::string name_ = "Throwing";

public:
  const std::string &name() const override { return name_; }
  std::vector<Finding> detect(const std::string &) const override {
    throw std::runtime_error("detector failure");
  }
};

bool hasType(const std::vector<Finding> &findings, const std::string &type) {
  for (const auto &finding : findings) {
    if (finding.detectorType == type)
      return true;
  }
  return false;
}
} // namespace

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  TestRunner runner;

  runner.runTest("IBAN mod-97", [&]() {
    runner.assertTrue(Checksums::isValidIban("NL91ABNA0417164300"), "NL valid");
    runner.assertTrue(Checksums::isValidIban("GB82 WEST 1234 5698 7654 32"),
                      "GB valid with spaces");
    runner.assertFalse(Checksums::isValidIban("NL92ABNA0417164300"),
                       "wrong check digits");
    runner.assertFalse(Checksums::isValidIban("NL91ABNA"), "too short");
  });

  runner.runTest("IBAN detector accepts plain and grouped forms", [&]() {
    IbanDetector detector;
    runner.assertEquals(1,
                        static_cast<int64_t>(
                            detector.detect("IBAN NL91ABNA0417164300").size()),
                        "plain");
    runner.assertEquals(
        1,
        static_cast<int64_t>(
            detector.detect("pay to NL91 ABNA 0417 1643 00 today").size()),
        "grouped");
    runner.assertTrue(detector.detect("NL92ABNA0417164300").empty(),
                      "invalid checksum dropped");
  });

  runner.runTest("KvK matches standalone eight-digit numbers", [&]() {
    BusinessRegistrationDetector detector;
    auto findings = detector.detect("KvK 69599084");
    runner.assertEquals(1, static_cast<int64_t>(findings.size()), "one match");
    if (!findings.empty()) {
      runner.assertNear(0.5, findings[0].confidence, "low confidence");
      runner.assertTrue(findings[0].severity == Severity::MEDIUM, "severity");
    }
    runner.assertTrue(detector.detect("123456789").empty(), "nine digits");
    runner.assertTrue(detector.detect("1234567").empty(), "seven digits");
  });

  runner.runTest("Postal codes exclude SA, SD and SS", [&]() {
    PostalCodeDetector detector;
    runner.assertEquals(1,
                        static_cast<int64_t>(detector.detect("1012 AB").size()),
                        "with space");
    runner.assertEquals(1,
                        static_cast<int64_t>(detector.detect("3511LX").size()),
                        "without space");
    runner.assertTrue(detector.detect("1012 SS").empty(), "SS excluded");
    runner.assertTrue(detector.detect("1012 SA").empty(), "SA excluded");
    runner.assertTrue(detector.detect("0123 AB").empty(), "leading zero");
  });

  runner.runTest("Dutch phone numbers in national and international form", [&]() {
    PhoneDetector detector;
    runner.assertTrue(!detector.detect("0612345678").empty(), "mobile");
    runner.assertTrue(!detector.detect("call 06-12345678").empty(), "dashed");
    runner.assertTrue(!detector.detect("+31 6 12345678").empty(), "+31");
    runner.assertTrue(!detector.detect("0031612345678").empty(), "0031");
    runner.assertTrue(!detector.detect("020 1234567").empty(), "landline");
    runner.assertTrue(detector.detect("061234567").empty(), "too short");
  });

  runner.runTest("Email addresses", [&]() {
    EmailDetector detector;
    auto findings = detector.detect("contact: Jan.Jansen@Example.NL");
    runner.assertEquals(1, static_cast<int64_t>(findings.size()), "one email");
    runner.assertTrue(detector.detect("not an email @ all").empty(),
                      "no address");
  });

  runner.runTest("Credit cards need a valid Luhn checksum", [&]() {
    CreditCardDetector detector;
    runner.assertTrue(Checksums::luhnCheck("4111111111111111"), "Luhn valid");
    runner.assertFalse(Checksums::luhnCheck("4111111111111112"),
                       "Luhn invalid");
    runner.assertEquals(
        1, static_cast<int64_t>(detector.detect("4111 1111 1111 1111").size()),
        "spaced card");
    runner.assertTrue(detector.detect("4111111111111112").empty(),
                      "invalid card dropped");
  });

  runner.runTest("Masking keeps two characters at each end", [&]() {
    runner.assertEquals("NL**************00", maskValue("NL91ABNA0417164300"),
                        "IBAN mask");
    runner.assertEquals("****", maskValue("abcd"), "short value");
    runner.assertEquals("", maskValue(""), "empty value");
  });

  runner.runTest("Default set runs every detector", [&]() {
    DetectorSet set = DetectorSet::createDefault();
    runner.assertEquals(7, static_cast<int64_t>(set.size()), "seven detectors");
    auto findings = set.scanValue(
        "Jan, BSN 123456782, NL91ABNA0417164300, jan@example.nl, 1012 AB");
    runner.assertTrue(hasType(findings, NationalIdDetector::TYPE), "BSN");
    runner.assertTrue(hasType(findings, IbanDetector::TYPE), "IBAN");
    runner.assertTrue(hasType(findings, EmailDetector::TYPE), "Email");
    runner.assertTrue(hasType(findings, PostalCodeDetector::TYPE), "postcode");
    runner.assertTrue(set.scanValue("").empty(), "empty value");
  });

  runner.runTest("A throwing detector does not affect the others", [&]() {
    std::vector<std::unique_ptr<IDetector>> detectors;
    detectors.push_back(std::make_unique<ThrowingDetector>());
    detectors.push_back(std::make_unique<NationalIdDetector>());
    DetectorSet set(std::move(detectors));
    auto findings = set.scanValue("123456782");
    runner.assertEquals(1, static_cast<int64_t>(findings.size()),
                        "BSN still reported");
  });

  runner.printSummary();
  return 0;
}
