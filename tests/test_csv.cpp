#include <catch2/catch_all.hpp>

#include "csv_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace tablestitch;

TEST_CASE("csvEscape quotes only when needed", "[csv]") {
  REQUIRE(csvEscape("plain") == "plain");
  REQUIRE(csvEscape("1,234") == "\"1,234\"");
  REQUIRE(csvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"");
  REQUIRE(csvEscape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("writeTablesAsCsv writes one numbered file per table", "[csv]") {
  const auto dir = std::filesystem::temp_directory_path() / "tablestitch_csv_test" / "nested";
  std::filesystem::remove_all(dir.parent_path());

  LogicalTable first;
  first.data = {{"Name", "Dept"}, {"Doe, Jane", "Sci"}};
  LogicalTable second;
  second.data = {{"Score"}, {"12"}};

  auto files = writeTablesAsCsv({first, second}, dir.string());

  REQUIRE(files.size() == 2);
  REQUIRE(files[0] == dir.string() + "/table_1.csv");
  REQUIRE(files[1] == dir.string() + "/table_2.csv");

  std::ifstream ifs(files[0]);
  std::stringstream content;
  content << ifs.rdbuf();
  // Comma inside a cell must survive
  REQUIRE(content.str() == "Name,Dept\n\"Doe, Jane\",Sci\n");

  std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("writeTablesAsCsv with no tables writes nothing", "[csv]") {
  const auto dir = std::filesystem::temp_directory_path() / "tablestitch_csv_empty";
  REQUIRE(writeTablesAsCsv({}, dir.string()).empty());
  std::filesystem::remove_all(dir);
}
