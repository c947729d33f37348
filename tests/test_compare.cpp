// test_compare.cpp - scenario comparison deltas and rendering
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "fertiblend/Compare.h"

#include <vector>

using namespace fertiblend;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<DoseRow> doses_a() {
    return {{"Norte", "Urea", 300.0}, {"Norte", "TSP", 100.0}, {"Sur", "Urea", 200.0}};
}

std::vector<DoseRow> doses_b() {
    return {{"Norte", "Urea", 250.0}, {"Norte", "KCl", 80.0}, {"Sur", "Urea", 260.0}, {"Vega", "Urea", 50.0}};
}

} // namespace

TEST_CASE("CompareScenarios: Cost and field deltas", "[compare]") {
    auto cmp = CompareScenarios(doses_a(), 2409642, doses_b(), 2300000);
    REQUIRE(cmp.cost_delta == -109642);
    REQUIRE(cmp.fields.size() == 3);
    REQUIRE(cmp.fields[0].field == "Norte");
    REQUIRE_THAT(cmp.fields[0].delta, WithinAbs(-70.0, 1e-9));
    REQUIRE_THAT(cmp.fields[1].delta, WithinAbs(60.0, 1e-9));
    REQUIRE(cmp.fields[2].field == "Vega");
    REQUIRE(cmp.fields[2].total_a == 0.0);
    REQUIRE(cmp.largest_increase == "Sur");
    REQUIRE(cmp.largest_decrease == "Norte");

    const std::string text = FormatComparison(cmp);
    REQUIRE_THAT(text, ContainsSubstring("$2.409.642"));
    REQUIRE_THAT(text, ContainsSubstring("-$109.642"));
    REQUIRE_THAT(text, ContainsSubstring("B is cheaper"));
    REQUIRE_THAT(text, ContainsSubstring("Vega,0.00,50.00,50.00"));
}

TEST_CASE("CompareScenarios: Tags come from results", "[compare]") {
    ScenarioResult a, b;
    a.tag = "base";
    b.tag = "suelo";
    a.total_cost_rounded = 100;
    b.total_cost_rounded = 100;
    auto cmp = CompareScenarios(a, b);
    REQUIRE(cmp.tag_a == "base");
    REQUIRE(cmp.tag_b == "suelo");
    REQUIRE(cmp.fields.empty());
    REQUIRE(cmp.largest_increase.empty());
    REQUIRE_THAT(FormatComparison(cmp), ContainsSubstring("same cost"));
}

TEST_CASE("CompareFieldMix: Product union on one field", "[compare]") {
    auto mix = CompareFieldMix(doses_a(), doses_b(), "Norte");
    REQUIRE(mix.size() == 3);
    REQUIRE(mix[0].product == "KCl");
    REQUIRE(mix[0].dose_a == 0.0);
    REQUIRE(mix[0].dose_b == 80.0);
    REQUIRE(mix[1].product == "TSP");
    REQUIRE(mix[1].delta == -100.0);
    REQUIRE(mix[2].delta == -50.0);

    const std::string text = FormatFieldMix("Norte", mix);
    REQUIRE_THAT(text, ContainsSubstring("KCl: 0.00 -> 80.00 (+80.00)"));
    REQUIRE_THAT(text, ContainsSubstring("largest increase: KCl, largest decrease: TSP"));

    REQUIRE(CompareFieldMix(doses_a(), doses_b(), "Nada").empty());
    REQUIRE_THAT(FormatFieldMix("Nada", {}), ContainsSubstring("no doses"));
}
