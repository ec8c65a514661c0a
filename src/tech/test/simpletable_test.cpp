#include "simpletable.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string_view>

#include "mtc_string.hpp"

namespace mtc {

class SimpleTableTest : public ::testing::Test {
 protected:
  void expectPrinted(std::string_view expected) {
    std::ostringstream ss;
    ss << '\n' << table;
    EXPECT_EQ(ss.view(), expected);
  }

  SimpleTable table;
};

TEST_F(SimpleTableTest, Empty) {
  std::ostringstream ss;
  ss << table;
  EXPECT_TRUE(ss.view().empty());
}

TEST_F(SimpleTableTest, HeaderOnly) {
  table.emplace_back("Location", string("Zagreb, Croatia"));

  expectPrinted(R"(
+----------+-----------------+
| Location | Zagreb, Croatia |
+----------+-----------------+)");
}

TEST_F(SimpleTableTest, ColumnsTakeWidthOfLargestCell) {
  table.emplace_back("Model", "Points");
  table.emplace_back("ecmwf_ifs", "384");
  table.emplace_back("gfs_graphcast025", "");

  expectPrinted(R"(
+------------------+--------+
| Model            | Points |
+------------------+--------+
| ecmwf_ifs        | 384    |
| gfs_graphcast025 |        |
+------------------+--------+)");
}

TEST(SimpleTableCellTest, DisplayWidth) {
  EXPECT_EQ(table::CellLine("3°").width(), 2U);
  EXPECT_EQ(table::CellLine("🌞").width(), 2U);
  EXPECT_EQ(table::CellLine("☁ ").width(), 2U);
  EXPECT_EQ(table::CellLine(string("-12°")).width(), 4U);
  EXPECT_EQ(table::Cell("gfs", "Temperature").width(), 11U);
  EXPECT_EQ(table::Cell().width(), 0U);
}

TEST(SimpleTableCellTest, Equality) {
  EXPECT_EQ(table::CellLine("3°"), table::CellLine(string("3°")));
  EXPECT_NE(table::Cell("", "Date"), table::Cell("Date"));
}

TEST_F(SimpleTableTest, MultiLineHeaderWithWideChars) {
  table.emplace_back(table::Cell("", "Date"), table::Cell("", "Hour"), table::Cell("gfs", ""), table::Cell("", "Temp"),
                     table::Cell("", "Precip"));
  table.emplace_back("2025-01-15", "21h", "🌙", "3°", "");
  table.emplace_back("", "22h", "☁ ", "-2°", "0.2mm");

  expectPrinted(R"(
+------------+------+-----+------+--------+
|            |      | gfs |      |        |
| Date       | Hour |     | Temp | Precip |
+------------+------+-----+------+--------+
| 2025-01-15 | 21h  | 🌙  | 3°   |        |
|            | 22h  | ☁   | -2°  | 0.2mm  |
+------------+------+-----+------+--------+)");
}

TEST_F(SimpleTableTest, MultiLineBodyCell) {
  table.emplace_back("Date", "Note");
  table.emplace_back("2025-01-15", table::Cell("Windy", "Heavy rain later"));
  table.emplace_back("2025-01-16", table::Cell());

  expectPrinted(R"(
+------------+------------------+
| Date       | Note             |
+------------+------------------+
| 2025-01-15 | Windy            |
|            | Heavy rain later |
| 2025-01-16 |                  |
+------------+------------------+)");
}

}  // namespace mtc
