#include "detectors/detector.h"

std::string maskValue(const std::string &value) {
  if (value.size() <= 4)
    return std::string(value.size(), '*');
  return value.substr(0, 2) + std::string(value.size() - 4, '*') +
         value.substr(value.size() - 2);
}

PatternDetector::PatternDetector(std::string name, const std::string &pattern,
                                 Severity severity, double confidence,
                                 std::string regulatoryReference,
                                 std::regex::flag_type flags)
    : name_(std::move(name)), pattern_(pattern, flags), severity_(severity),
      confidence_(confidence),
      regulatoryReference_(std::move(regulatoryReference)) {}

bool PatternDetector::validate(const std::string &) const { return true; }

std::vector<Finding> PatternDetector::detect(const std::string &value) const {
  std::vector<Finding> out;
  if (value.empty())
    return out;

  for (auto it = std::sregex_iterator(value.begin(), value.end(), pattern_);
       it != std::sregex_iterator(); ++it) {
    std::string match = it->str();
    if (!validate(match))
      continue;

    Finding finding;
    finding.detectorType = name_;
    finding.maskedValue = maskValue(match);
    finding.confidence = confidence_;
    finding.severity = severity_;
    finding.regulatoryReference = regulatoryReference_;
    out.push_back(std::move(finding));
  }
  return out;
}
