#include <gtest/gtest.h>
#include "Board.hpp"
#include "test_helpers.hpp"
#include <utility>
#include <vector>

TEST(BoardBasics, StartsEmpty) {
  Board b;
  EXPECT_EQ(b.count_empty(), 9);
  EXPECT_FALSE(b.is_full());
  EXPECT_FALSE(b.get_winner().has_value());
  for (int r = 0; r < 3; ++r)
    for (int c = 0; c < 3; ++c)
      EXPECT_TRUE(b.is_cell_free(r, c));
}

TEST(BoardBasics, BoundsCheck) {
  EXPECT_TRUE(Board::is_inside(0, 0));
  EXPECT_TRUE(Board::is_inside(2, 2));
  EXPECT_FALSE(Board::is_inside(-1, 0));
  EXPECT_FALSE(Board::is_inside(0, 3));
  EXPECT_FALSE(Board::is_inside(3, 1));
}

TEST(BoardBasics, EmptyCellsAreRowMajor) {
  Board b(cells_from("A.B.A...."));
  std::vector<std::pair<int,int>> expected = {
    {0,1}, {1,0}, {1,2}, {2,0}, {2,1}, {2,2}
  };
  EXPECT_EQ(b.get_empty_cells(), expected);
  EXPECT_EQ(b.count_empty(), 6);
}

TEST(BoardTerminal, DetectsEveryLine) {
  for (const auto& line : Board::lines()) {
    Board b;
    for (const auto& rc : line) b.place(rc.first, rc.second, Cell::B);
    auto w = b.get_winner();
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, Side::B);
  }
}

TEST(BoardTerminal, MixedLineIsNotAWin) {
  Board b(cells_from("ABA......"));
  EXPECT_FALSE(b.get_winner().has_value());
}

TEST(BoardTerminal, FirstLineWinsWhenSeveralComplete) {
  // Só alcançável por load: linha 0 de A e linha 2 de B
  Board b(cells_from("AAA...BBB"));
  auto w = b.get_winner();
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ(*w, Side::A);
  std::vector<Side> both = {Side::A, Side::B};
  EXPECT_EQ(b.completed_lines(), both);

  // Duas linhas do mesmo lado (linha 0 e coluna 0)
  Board b2(cells_from("BBBBAABAA"));
  EXPECT_EQ(b2.completed_lines().size(), 2u);
}

TEST(BoardTerminal, FullBoardWithoutLine) {
  Board b(cells_from("ABAABBBAA"));
  EXPECT_TRUE(b.is_full());
  EXPECT_FALSE(b.get_winner().has_value());
  EXPECT_TRUE(b.completed_lines().empty());
}

TEST(BoardHelpers, FlatGridAndReset) {
  Board b(cells_from("A...B...."));
  std::vector<int> flat = {1,0,0,0,2,0,0,0,0};
  EXPECT_EQ(b.get_flat_grid(), flat);

  b.reset_board();
  EXPECT_EQ(b, Board());
}

TEST(BoardHelpers, TextRendering) {
  Board b(cells_from("A...B...."));
  std::string s = b.to_string();
  EXPECT_NE(s.find("0|A . ."), std::string::npos);
  EXPECT_NE(s.find("1|. B ."), std::string::npos);
  EXPECT_NE(s.find("0 1 2"), std::string::npos);
}
