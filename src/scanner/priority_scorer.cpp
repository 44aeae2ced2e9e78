#include "scanner/priority_scorer.h"
#include "utils/string_utils.h"
#include <algorithm>

const KeywordWeights &PriorityScorer::tableKeywords() {
  static const KeywordWeights weights = {
      {"user", 3.0},        {"customer", 3.0},    {"employee", 3.0},
      {"person", 3.0},      {"people", 3.0},      {"patient", 3.0},
      {"medical", 3.0},     {"health", 3.0},      {"profile", 2.8},
      {"account", 2.8},     {"payment", 2.8},     {"billing", 2.8},
      {"financial", 2.8},   {"bank", 2.8},        {"credential", 2.8},
      {"password", 2.8},    {"contact", 2.5},     {"address", 2.5},
      {"phone", 2.5},       {"email", 2.5},       {"transaction", 2.5},
      {"invoice", 2.5},     {"card", 2.5},        {"token", 2.5},
      {"order", 2.2},       {"session", 2.0},     {"audit", 2.0},
      {"config", 2.0},      {"setting", 2.0},     {"log", 1.5},
      {"system", 1.2},      {"backup", 1.0},      {"temp", 0.8},
      {"test", 0.5}};
  return weights;
}

const KeywordWeights &PriorityScorer::columnKeywords() {
  static const KeywordWeights weights = {
      {"ssn", 3.0},          {"bsn", 3.0},       {"social_security", 3.0},
      {"passport", 3.0},     {"medical", 3.0},   {"health", 3.0},
      {"diagnosis", 3.0},    {"password", 2.8},  {"token", 2.8},
      {"secret", 2.8},       {"bank", 2.8},      {"license", 2.8},
      {"birth", 2.8},        {"dob", 2.8},       {"email", 2.5},
      {"phone", 2.5},        {"id_number", 2.5}, {"salary", 2.5},
      {"income", 2.5},       {"credit", 2.5},    {"iban", 2.5},
      {"address", 2.2},      {"age", 2.0},       {"gender", 2.0},
      {"key", 2.0}};
  return weights;
}

double PriorityScorer::maxMatchingWeight(const std::string &lowerText,
                                         const KeywordWeights &weights,
                                         double floor) {
  double best = floor;
  for (const auto &entry : weights) {
    if (lowerText.find(entry.first) != std::string::npos) {
      best = std::max(best, entry.second);
    }
  }
  return best;
}

double PriorityScorer::scoreColumn(const std::string &columnName) {
  return maxMatchingWeight(StringUtils::toLower(columnName), columnKeywords(),
                           0.0);
}

// base is the heaviest table keyword contained in the name (at least
// BASE_SCORE). The boost is COLUMN_BOOST_FACTOR times the heaviest column
// keyword across all columns, so one sensitive column counts as much as
// many. The sum is capped at MAX_SCORE.
double PriorityScorer::scoreTable(const std::string &tableName,
                                  const std::vector<ColumnDescriptor> &columns) {
  double base = maxMatchingWeight(StringUtils::toLower(tableName),
                                  tableKeywords(), BASE_SCORE);

  double maxColWeight = 0.0;
  for (const auto &column : columns) {
    maxColWeight = std::max(maxColWeight, scoreColumn(column.name));
  }

  double columnBoost = maxColWeight * COLUMN_BOOST_FACTOR;
  return std::min(base + columnBoost, MAX_SCORE);
}

void PriorityScorer::scoreAll(std::vector<TableDescriptor> &tables) {
  for (auto &table : tables) {
    table.priorityScore = scoreTable(table.name, table.columns);
  }
}
