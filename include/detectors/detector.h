#ifndef DETECTOR_H
#define DETECTOR_H

#include "scanner/scan_types.h"
#include <regex>
#include <string>
#include <vector>

// A stateless check run against a single sampled cell. detect() must be
// safe to call from several worker threads at once. Findings come back
// without table and column; the scan engine fills those in.
class IDetector {
public:
  virtual ~IDetector() = default;

  virtual const std::string &name() const = 0;
  virtual std::vector<Finding> detect(const std::string &value) const = 0;
};

// Shared plumbing for detectors that are one regex plus an optional
// validation step on each match.
class PatternDetector : public IDetector {
public:
  PatternDetector(std::string name, const std::string &pattern,
                  Severity severity, double confidence,
                  std::string regulatoryReference = "",
                  std::regex::flag_type flags = std::regex::ECMAScript);

  const std::string &name() const override { return name_; }
  std::vector<Finding> detect(const std::string &value) const override;

protected:
  // Return false to drop a match. The default accepts everything.
  virtual bool validate(const std::string &match) const;

private:
  std::string name_;
  std::regex pattern_;
  Severity severity_;
  double confidence_;
  std::string regulatoryReference_;
};

// Keeps the first and last two characters: "123456782" -> "12*****82".
// Values of four characters or fewer are fully masked.
std::string maskValue(const std::string &value);

#endif
