#include <iostream>
#include <string>
#include <vector>
#include "fertiblend/Compare.h"
#include "fertiblend/ResultWriter.h"

// Compares two scenario outputs on disk: dose tables plus cost summaries.
int main(int argc, char** argv) {
  if (argc < 5) {
    std::cerr << "usage: " << argv[0] << " <doses_A.csv> <summary_A.txt> <doses_B.csv> <summary_B.txt> [field]\n";
    return 2;
  }
  std::vector<fertiblend::DoseRow> a, b;
  long long cost_a = 0, cost_b = 0;
  fertiblend::Error err;
  if (!fertiblend::ReadDoseTable(argv[1], &a, &err) || !fertiblend::ReadCostSummary(argv[2], &cost_a, &err) ||
      !fertiblend::ReadDoseTable(argv[3], &b, &err) || !fertiblend::ReadCostSummary(argv[4], &cost_b, &err)) {
    std::cerr << "error [" << fertiblend::ErrorKindName(err.kind) << "]: " << err.message << "\n";
    return 1;
  }
  auto cmp = fertiblend::CompareScenarios(a, cost_a, b, cost_b);
  std::cout << fertiblend::FormatComparison(cmp);
  std::string field = argc > 5 ? argv[5] : cmp.largest_increase;
  if (!field.empty()) {
    std::cout << fertiblend::FormatFieldMix(field, fertiblend::CompareFieldMix(a, b, field));
  }
  return 0;
}
