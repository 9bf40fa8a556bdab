#include <catch2/catch_all.hpp>

#include "errors.hpp"
#include "segmenter.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace tablestitch;

namespace {

Fragment frag(int page, std::vector<Row> data) {
  Fragment f;
  f.page = page;
  f.data = std::move(data);
  f.source = "pdf";
  return f;
}

} // namespace

TEST_CASE("score-domain segmentation reassembles a range split across pages", "[segment][score]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Score", "Freq"}, {"0", "5"}, {"10", "3"}}),
    frag(2, {{"15", "2"}, {"20", "1"}}),
  };
  std::vector<ScoreDomain> domains = {{"Low", 0, 19, ""}, {"High", 20, 40, ""}};

  auto tables = segmentByScoreDomain(fragments, domains);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].data.size() == 4);
  REQUIRE(tables[0].data[0] == Row{"Score", "Freq"});
  REQUIRE(tables[0].data[3] == Row{"15", "2"});
  REQUIRE(tables[1].data.size() == 2);
  REQUIRE(tables[1].data[1] == Row{"20", "1"});

  for (const auto& t : tables) {
    REQUIRE(t.schema.hasHeader);
    REQUIRE(t.schema.columnCount == 2);
    REQUIRE(t.segmentationStrategy == SegmentationStrategy::ScoreDomain);
    REQUIRE(t.tableType == TableType::Logical);
    REQUIRE(t.sourcePages == std::vector<int>{1, 2});
  }
  REQUIRE(tables[0].scoreDomain->name == "Low");
  REQUIRE(tables[1].scoreDomain->name == "High");
}

TEST_CASE("disjoint covering domains place every row in exactly one table", "[segment][score]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Mark", "N"}, {"1", "a"}, {"7", "b"}, {"12", "c"}}),
    frag(2, {{"18", "d"}, {"25", "e"}}),
    frag(3, {{"31", "f"}, {"9", "g"}}),
  };
  std::vector<ScoreDomain> domains = {{"A", 0, 9.5, ""}, {"B", 10, 24.5, ""}, {"C", 25, 100, ""}};

  auto tables = segmentByScoreDomain(fragments, domains);

  std::vector<Row> collected;
  for (const auto& t : tables) collected.insert(collected.end(), t.data.begin() + 1, t.data.end());

  std::vector<Row> expected = {{"1", "a"}, {"7", "b"}, {"12", "c"}, {"18", "d"}, {"25", "e"}, {"31", "f"}, {"9", "g"}};
  REQUIRE(collected.size() == expected.size());
  for (const auto& row : expected) {
    REQUIRE(std::count(collected.begin(), collected.end(), row) == 1);
  }
}

TEST_CASE("overlapping domains select the same row more than once", "[segment][score]") {
  std::vector<Fragment> fragments = {frag(1, {{"Score", "F"}, {"16", "1"}, {"30", "2"}})};
  std::vector<ScoreDomain> domains = {{"Objective", 0, 19, ""}, {"Essay", 15, 40, ""}};

  auto tables = segmentByScoreDomain(fragments, domains);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].data.size() == 2);
  REQUIRE(tables[1].data.size() == 3);
  REQUIRE(tables[0].data[1] == tables[1].data[1]);
}

TEST_CASE("domains without matching rows are omitted", "[segment][score]") {
  std::vector<Fragment> fragments = {frag(1, {{"Score", "F"}, {"5", "1"}})};
  std::vector<ScoreDomain> domains = {{"Empty", 50, 60, ""}, {"Hit", 0, 10, ""}};

  auto tables = segmentByScoreDomain(fragments, domains);

  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0].scoreDomain->name == "Hit");
}

TEST_CASE("score domains are detected from gaps when none are supplied", "[segment][score]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Score", "F"}, {"1", "a"}, {"3", "b"}, {"1,000", "x"}}),
    frag(2, {{"20", "c"}, {"24", "d"}, {"n/a", "e"}}),
  };

  auto tables = segmentByScoreDomain(fragments);

  REQUIRE(tables.size() == 3);
  REQUIRE(tables[0].scoreDomain->name == "Score Range 1-3");
  REQUIRE(tables[1].scoreDomain->name == "Score Range 20-24");
  REQUIRE(tables[2].scoreDomain->name == "Score Range 1000-1000");
  REQUIRE(tables[2].data[1] == Row{"1,000", "x"});
}

TEST_CASE("empty input produces no score-domain tables", "[segment][score]") {
  REQUIRE(segmentByScoreDomain({}).empty());
  REQUIRE(segmentByScoreDomain({frag(1, {})}).empty());
}

TEST_CASE("header repetition splits at each repeated header and keeps section titles", "[segment][header]") {
  const Row header = {"Name", "Position", "Department"};
  std::vector<Fragment> fragments = {
    frag(1, {header, {"Science", "", ""}, {"Ann", "Teacher", ""}, {"Bo", "Tutor", ""}}),
    frag(2, {header, {"Cy", "Head", ""}}),
  };

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].sectionTitle == std::optional<std::string>("Science"));
  REQUIRE(tables[0].data.size() == 3);
  REQUIRE(tables[0].data[0] == header);
  REQUIRE_FALSE(tables[1].sectionTitle.has_value());
  REQUIRE(tables[1].data.size() == 2);
  REQUIRE(tables[1].data[1] == Row{"Cy", "Head", ""});
  REQUIRE(tables[1].segmentationStrategy == SegmentationStrategy::HeaderRepetition);
  REQUIRE(tables[1].sourcePages == std::vector<int>{1, 2});
}

TEST_CASE("header matching ignores case and surrounding spaces", "[segment][header]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Name", "Role"}, {"Ann", "Clerk"}, {"Bo", "Tutor"}}),
    frag(2, {{" NAME ", "role"}, {"Cy", "Head"}}),
  };

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[1].data[0] == Row{" NAME ", "role"});
}

TEST_CASE("single-cell rows that are not in the first column still become titles", "[segment][header]") {
  const Row header = {"Name", "Position"};
  std::vector<Fragment> fragments = {frag(1, {header, {"", "Admin"}, {"Ann", "Clerk"}, header, {"Bo", "Clerk"}})};

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].sectionTitle == std::optional<std::string>("Admin"));
}

TEST_CASE("rows ahead of the first header are dropped", "[segment][header]") {
  const Row header = {"Name", "Position"};
  std::vector<Fragment> fragments = {
    frag(1, {{"stray", "row"}, {"x", "y"}, header, {"Ann", "Clerk"}, header, {"Bo", "Clerk"}}),
  };

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].data == std::vector<Row>{header, {"Ann", "Clerk"}});
  REQUIRE_FALSE(tables[0].sectionTitle.has_value());
}

TEST_CASE("without a repeated header the merged input is one table", "[segment][header]") {
  std::vector<Fragment> fragments = {
    frag(1, {{"Name", "Position"}, {"Ann", "Teacher"}}),
    frag(2, {{"Bo", "Tutor"}}),
  };

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0].data == std::vector<Row>{{"Name", "Position"}, {"Ann", "Teacher"}, {"Bo", "Tutor"}});
  REQUIRE(tables[0].schema.headers == Row{"Name", "Position"});
  REQUIRE(tables[0].sourcePages == std::vector<int>{1, 2});
}

TEST_CASE("a header that repeats without data falls back to one table", "[segment][header]") {
  const Row header = {"Name", "Position"};
  std::vector<Fragment> fragments = {frag(1, {header, {"Science", ""}, header})};

  auto tables = segmentByHeaderRepetition(fragments);

  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0].data.size() == 3);
}

TEST_CASE("segmentFragments dispatches on the requested strategy", "[segment]") {
  std::vector<Fragment> fragments = {frag(1, {{"Score", "F"}, {"1", "2"}, {"3", "4"}})};

  auto byScore = segmentFragments(fragments, SegmentationStrategy::ScoreDomain);
  REQUIRE(byScore.size() == 1);
  REQUIRE(byScore[0].segmentationStrategy == SegmentationStrategy::ScoreDomain);

  auto detected = segmentFragments(fragments, std::nullopt);
  REQUIRE(detected.size() == 1);
  REQUIRE(detected[0].segmentationStrategy == SegmentationStrategy::ScoreDomain);

  REQUIRE_THROWS_AS(segmentFragments(fragments, static_cast<SegmentationStrategy>(42)), UnknownStrategyError);
}

TEST_CASE("strategy tags parse and unknown tags are rejected", "[segment]") {
  REQUIRE(parseSegmentationStrategy("score_domain") == SegmentationStrategy::ScoreDomain);
  REQUIRE(parseSegmentationStrategy("header_repetition") == SegmentationStrategy::HeaderRepetition);
  REQUIRE(toString(SegmentationStrategy::HeaderRepetition) == "header_repetition");
  REQUIRE_THROWS_AS(parseSegmentationStrategy("auto"), UnknownStrategyError);
}

TEST_CASE("page tables keep one table per page with blank separators", "[segment][page]") {
  std::vector<Fragment> fragments = {
    frag(2, {{"A", "B"}, {"1", "2"}}),
    frag(1, {{"", "x"}, {"3", "4"}}),
    frag(2, {{"C", "D"}}),
  };

  auto tables = buildPageTables(fragments);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].sourcePages == std::vector<int>{1});
  REQUIRE_FALSE(tables[0].schema.hasHeader);
  REQUIRE(tables[0].schema.headers == Row{"Column_1", "Column_2"});
  REQUIRE(tables[1].tableType == TableType::PagePreserved);
  REQUIRE(tables[1].schema.hasHeader);
  REQUIRE(tables[1].data == std::vector<Row>{{"A", "B"}, {"1", "2"}, {"", ""}, {"C", "D"}});
}
