#include <catch2/catch_all.hpp>

#include "cell_utils.hpp"
#include "score_domain.hpp"

using namespace tablestitch;

TEST_CASE("parseNumber strips commas and whitespace", "[cells]") {
  REQUIRE(parseNumber("1,234") == 1234.0);
  REQUIRE(parseNumber("  42 ") == 42.0);
  REQUIRE(parseNumber("-3.5") == -3.5);
  REQUIRE(parseNumber("1e2") == 100.0);
}

TEST_CASE("parseNumber rejects anything that is not a plain number", "[cells]") {
  REQUIRE_FALSE(parseNumber("").has_value());
  REQUIRE_FALSE(parseNumber("   ").has_value());
  REQUIRE_FALSE(parseNumber("12%").has_value());
  REQUIRE_FALSE(parseNumber("abc").has_value());
  REQUIRE_FALSE(parseNumber("12 apples").has_value());
  REQUIRE_FALSE(parseNumber("0x1A").has_value());
  REQUIRE_FALSE(parseNumber("inf").has_value());
  REQUIRE_FALSE(parseNumber("nan").has_value());
}

TEST_CASE("parseMeasure also accepts percent signs", "[cells]") {
  REQUIRE(parseMeasure("12.5%") == 12.5);
  REQUIRE(parseMeasure(" 1,000 % ") == 1000.0);
  REQUIRE_FALSE(parseMeasure("%").has_value());
}

TEST_CASE("row keys and blank counting", "[cells]") {
  REQUIRE(normalizeRowKey({" Name ", "dept"}) == std::vector<std::string>{"NAME", "DEPT"});
  REQUIRE(countNonBlank({"", " ", "x", "\t"}) == 1);
  REQUIRE(isBlank(" \t"));
  REQUIRE_FALSE(isBlank(" a "));
}

TEST_CASE("formatNumber drops the fraction of whole numbers", "[cells]") {
  REQUIRE(formatNumber(19.0) == "19");
  REQUIRE(formatNumber(-4.0) == "-4");
  REQUIRE(formatNumber(19.5) == "19.5");
}

TEST_CASE("score domain registry keeps order and finds by name", "[cells][domain]") {
  ScoreDomainRegistry registry({{"Scaled_Essay", 15, 40, "essay"}, {"Scaled_Objective", 0, 19, ""}});
  REQUIRE(registry.size() == 2);
  REQUIRE(registry.domains()[0].name == "Scaled_Essay");
  REQUIRE(registry.find("Scaled_Objective")->maxScore == 19);
  REQUIRE_FALSE(registry.find("missing").has_value());
  REQUIRE(registry.domains()[0].contains(15));
  REQUIRE(registry.domains()[0].contains(40));
  REQUIRE_FALSE(registry.domains()[0].contains(40.5));
}

TEST_CASE("domain detection splits sorted scores at gaps wider than the threshold", "[cells][domain]") {
  std::vector<std::vector<std::string>> rows = {{"10"}, {"5"}, {"0"}, {"5"}, {"16"}, {"20.5"}, {"x"}, {}};

  auto registry = ScoreDomainRegistry::detect(rows);
  REQUIRE(registry.size() == 2);
  REQUIRE(registry.domains()[0].name == "Score Range 0-10");
  REQUIRE(registry.domains()[1].name == "Score Range 16-20.5");

  auto fine = ScoreDomainRegistry::detect(rows, 4.6);
  REQUIRE(fine.size() == 4);

  REQUIRE(ScoreDomainRegistry::detect({{"a"}}).empty());
}
