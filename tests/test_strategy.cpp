#include <catch2/catch_all.hpp>

#include "strategy_detector.hpp"

#include <vector>

using namespace tablestitch;

namespace {

Fragment frag(int page, std::vector<Row> data) {
  Fragment f;
  f.page = page;
  f.data = std::move(data);
  return f;
}

} // namespace

TEST_CASE("numeric leading column selects score-domain segmentation", "[strategy]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Name", "Dept"}, {"Ann", "Sci"}}),
    frag(2, {{"Score", "Freq"}, {"1,200", "3"}, {" 7 ", "1"}, {"9", "2"}}),
  };
  REQUIRE(detectStrategy(fragments) == SegmentationStrategy::ScoreDomain);
}

TEST_CASE("seventy percent numeric is enough, below is not", "[strategy]") {
  std::vector<Row> rows = {{"Score"}};
  for (int i = 0; i < 7; ++i) rows.push_back({std::to_string(i)});
  for (int i = 0; i < 3; ++i) rows.push_back({"n/a"});
  REQUIRE(hasNumericLeadColumn(frag(1, rows), 0.70));

  rows.push_back({"n/a"});
  REQUIRE_FALSE(hasNumericLeadColumn(frag(1, rows), 0.70));
  REQUIRE(detectStrategy({frag(1, rows)}) == SegmentationStrategy::HeaderRepetition);

  HeuristicThresholds loose;
  loose.numericRatio = 0.5;
  REQUIRE(detectStrategy({frag(1, rows)}, loose) == SegmentationStrategy::ScoreDomain);
}

TEST_CASE("a fragment with only a header row never counts as numeric", "[strategy]") {
  REQUIRE_FALSE(hasNumericLeadColumn(frag(1, {{"1", "2"}}), 0.70));
  REQUIRE_FALSE(hasNumericLeadColumn(frag(1, {}), 0.70));
}

TEST_CASE("repeated first rows are recognised case- and space-insensitively", "[strategy]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Name", "Position"}, {"Ann", "Teacher"}}),
    frag(2, {{" NAME", "position "}, {"Bo", "Tutor"}}),
  };
  REQUIRE(hasRepeatedFirstRow(fragments));
  REQUIRE(detectStrategy(fragments) == SegmentationStrategy::HeaderRepetition);
}

TEST_CASE("text-only documents default to header repetition", "[strategy]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Name", "Position"}, {"Ann", "Teacher"}}),
    frag(2, {{"Bo", "Tutor"}}),
  };
  REQUIRE_FALSE(hasRepeatedFirstRow(fragments));
  REQUIRE(detectStrategy(fragments) == SegmentationStrategy::HeaderRepetition);
  REQUIRE(detectStrategy({}) == SegmentationStrategy::HeaderRepetition);
}
