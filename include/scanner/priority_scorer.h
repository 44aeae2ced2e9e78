#ifndef PRIORITY_SCORER_H
#define PRIORITY_SCORER_H

#include "engines/database_engine.h"
#include <string>
#include <utility>
#include <vector>

using KeywordWeights = std::vector<std::pair<std::string, double>>;

// Estimates how likely a table is to hold personal data from its name and
// its column names. Scores are in [0.0, MAX_SCORE].
class PriorityScorer {
public:
  static constexpr double BASE_SCORE = 1.0;
  static constexpr double COLUMN_BOOST_FACTOR = 0.3;
  static constexpr double MAX_SCORE = 3.5;

  static double scoreTable(const std::string &tableName,
                           const std::vector<ColumnDescriptor> &columns);

  // Highest column-keyword weight found in columnName, 0.0 when none match.
  static double scoreColumn(const std::string &columnName);

  // Sets priorityScore on every table in place.
  static void scoreAll(std::vector<TableDescriptor> &tables);

  static const KeywordWeights &tableKeywords();
  static const KeywordWeights &columnKeywords();

private:
  static double maxMatchingWeight(const std::string &lowerText,
                                  const KeywordWeights &weights,
                                  double floor);
};

#endif
