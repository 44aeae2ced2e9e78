#include "core/logger.h"
#include "scanner/table_selector.h"
#include "test_runner.h"

namespace {
TableDescriptor table(const std::string &name, double score) {
  TableDescriptor t;
  t.name = name;
  t.priorityScore = score;
  return t;
}

ScanStrategy targeting(int targetTables) {
  ScanStrategy strategy;
  strategy.targetTables = targetTables;
  return strategy;
}
} // namespace

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  TestRunner runner;

  runner.runTest("Highest score first, ties keep discovery order", [&]() {
    std::vector<TableDescriptor> tables = {
        table("a", 1.0), table("b", 3.0), table("c", 2.0), table("d", 3.0),
        table("e", 2.0)};
    auto selected = TableSelector::select(tables, targeting(5));
    runner.assertEquals(5, static_cast<int64_t>(selected.size()), "all kept");
    runner.assertEquals("b", selected[0].name, "first 3.0");
    runner.assertEquals("d", selected[1].name, "second 3.0");
    runner.assertEquals("c", selected[2].name, "first 2.0");
    runner.assertEquals("e", selected[3].name, "second 2.0");
    runner.assertEquals("a", selected[4].name, "lowest last");
  });

  runner.runTest("Truncates to targetTables", [&]() {
    std::vector<TableDescriptor> tables = {table("x", 1.0), table("y", 2.5),
                                           table("z", 1.5)};
    auto selected = TableSelector::select(tables, targeting(2));
    runner.assertEquals(2, static_cast<int64_t>(selected.size()), "two kept");
    runner.assertEquals("y", selected[0].name, "highest");
    runner.assertEquals("z", selected[1].name, "next");
  });

  runner.runTest("Target larger than input keeps everything", [&]() {
    auto selected =
        TableSelector::select({table("only", 1.0)}, targeting(10));
    runner.assertEquals(1, static_cast<int64_t>(selected.size()), "one kept");
  });

  runner.runTest("Zero target selects nothing", [&]() {
    auto selected =
        TableSelector::select({table("a", 1.0), table("b", 2.0)}, targeting(0));
    runner.assertTrue(selected.empty(), "empty selection");
  });

  runner.printSummary();
  return 0;
}
