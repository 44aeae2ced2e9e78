#include "core/logger.h"
#include "detectors/checksums.h"
#include "detectors/national_id_detector.h"
#include "test_runner.h"

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  TestRunner runner;
  NationalIdDetector detector;

  runner.runTest("11-proof accepts known valid numbers", [&]() {
    runner.assertTrue(Checksums::isValidBsn("123456782"), "123456782");
    runner.assertTrue(Checksums::isValidBsn("111222333"), "111222333");
    runner.assertTrue(Checksums::isValidBsn("987654329"), "987654329");
  });

  runner.runTest("11-proof rejects wrong check digits", [&]() {
    runner.assertFalse(Checksums::isValidBsn("123456783"), "123456783");
    runner.assertFalse(Checksums::isValidBsn("123456789"), "123456789");
  });

  runner.runTest("11-proof rejects malformed input", [&]() {
    runner.assertFalse(Checksums::isValidBsn("12345678"), "eight digits");
    runner.assertFalse(Checksums::isValidBsn("1234567820"), "ten digits");
    runner.assertFalse(Checksums::isValidBsn("12345678a"), "letter");
    runner.assertFalse(Checksums::isValidBsn(""), "empty");
  });

  runner.runTest("11-proof is deterministic", [&]() {
    for (int i = 0; i < 3; ++i) {
      runner.assertTrue(Checksums::isValidBsn("123456782"), "repeat valid");
      runner.assertFalse(Checksums::isValidBsn("123456783"), "repeat invalid");
    }
  });

  runner.runTest("Detector reports valid BSN as critical", [&]() {
    auto findings = detector.detect("BSN: 123456782");
    runner.assertEquals(1, static_cast<int64_t>(findings.size()),
                        "one finding");
    if (findings.empty())
      return;
    runner.assertEquals(NationalIdDetector::TYPE, findings[0].detectorType,
                        "detector type");
    runner.assertEquals("12*****82", findings[0].maskedValue, "masked value");
    runner.assertTrue(findings[0].severity == Severity::CRITICAL, "severity");
    runner.assertNear(0.95, findings[0].confidence, "confidence");
    runner.assertTrue(findings[0].regulatoryReference.find("GDPR Article 9") !=
                          std::string::npos,
                      "regulatory reference");
  });

  runner.runTest("Detector drops invalid and embedded numbers", [&]() {
    runner.assertTrue(detector.detect("123456783").empty(), "bad checksum");
    runner.assertTrue(detector.detect("0123456782").empty(),
                      "part of a longer number");
    runner.assertTrue(detector.detect("no digits here").empty(), "no digits");
  });

  runner.runTest("Detector finds several numbers in one value", [&]() {
    auto findings = detector.detect("123456782, 111222333 and 123456789");
    runner.assertEquals(2, static_cast<int64_t>(findings.size()),
                        "two valid numbers");
  });

  runner.printSummary();
  return 0;
}
