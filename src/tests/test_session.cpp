#include <gtest/gtest.h>
#include "GameController.hpp"
#include "GameSession.hpp"
#include "LogMsgs.hpp"
#include "SessionStore.hpp"
#include "test_helpers.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

// Redireciona LogMsgs para um buffer durante o teste
struct CaptureLog {
  std::ostringstream buf;
  CaptureLog() { LogMsgs::set_stream(buf); }
  ~CaptureLog() { LogMsgs::set_stream(std::cout); }
};

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

/* ---------------------------------
   GameSession
   --------------------------------- */
TEST(GameSession, HumanMoveGetsAnOpponentReply) {
  GameSession s(GameMode::Deterministic);
  auto report = s.play(1, 1);
  ASSERT_TRUE(report.ok());
  ASSERT_TRUE(report.opponent.has_value());
  ASSERT_TRUE(report.opponent->move.has_value());
  EXPECT_EQ(*report.opponent->move, std::make_pair(0, 0));
  EXPECT_EQ(s.game().cell(1, 1), Cell::A);
  EXPECT_EQ(s.game().cell(0, 0), Cell::B);
  EXPECT_EQ(s.game().mover(), Party::Human);
  EXPECT_EQ(report.result, PartyOutcome::None);
}

TEST(GameSession, RejectedMoveSkipsTheOpponent) {
  GameSession s(GameMode::Deterministic);
  auto report = s.play(3, 0);
  EXPECT_EQ(report.error, MoveError::OutOfBounds);
  EXPECT_FALSE(report.opponent.has_value());
  EXPECT_EQ(s.game().move_count(), 0);
}

TEST(GameSession, OpponentFirstOpensTheBoard) {
  GameSession s(GameMode::Deterministic, Party::Opponent);
  EXPECT_EQ(s.game().cell(0, 0), Cell::B);
  EXPECT_EQ(s.game().mover(), Party::Human);

  s.new_game();
  EXPECT_EQ(s.game().move_count(), 1);
  EXPECT_EQ(s.game().cell(0, 0), Cell::B);
}

TEST(GameSession, ClassicGamePlayedToTheEnd) {
  GameSession s(GameMode::Deterministic);
  while (!s.game().is_over()) {
    auto empty = s.game().empty_cells();
    ASSERT_FALSE(empty.empty());
    auto report = s.play(empty.front().first, empty.front().second);
    ASSERT_TRUE(report.ok());
  }
  auto result = s.party_outcome();
  EXPECT_NE(result, PartyOutcome::Human);
  EXPECT_NE(result, PartyOutcome::None);

  auto late = s.play(0, 0);
  EXPECT_EQ(late.error, MoveError::GameOver);
  EXPECT_EQ(late.result, result);

  if (result == PartyOutcome::Opponent) {
    EXPECT_TRUE(contains(s.status_message(), "Perdeste"));
  } else {
    EXPECT_TRUE(contains(s.status_message(), "Empate"));
  }
}

TEST(GameSession, NewGameClearsTheBoard) {
  GameSession s(GameMode::Deterministic);
  ASSERT_TRUE(s.play(0, 0).ok());
  s.new_game();
  EXPECT_EQ(s.game().move_count(), 0);
  EXPECT_EQ(s.game().outcome(), Outcome::InProgress);
  EXPECT_TRUE(contains(s.status_message(), "A tua vez"));
}

TEST(GameSession, RandomizedSessionUsesRandomPlacement) {
  GameSession s(GameMode::Randomized, Party::Human, 0, 77u);
  EXPECT_TRUE(s.is_randomized());
  EXPECT_TRUE(std::holds_alternative<RandomPlacement>(s.strategy()));
  EXPECT_NE(s.game().sides().human, s.game().sides().opponent);

  auto report = s.play(1, 1);
  ASSERT_TRUE(report.ok());
  if (!s.game().is_over()) {
    ASSERT_TRUE(report.opponent.has_value());
    EXPECT_TRUE(report.opponent->ok());
    EXPECT_EQ(s.game().move_count(), 2);
  }
}

TEST(GameSession, RandomizedStatusRevealsSideAtTheEnd) {
  GameSession s(GameMode::Randomized, Party::Human, 0, 1u);
  const char mine = side_char(s.game().sides().human);
  EXPECT_TRUE(contains(s.status_message(), "Modo aleatório"));

  // Linha do lado do humano
  std::string cells = s.game().sides().human == Side::A ? "AAABB...." : "BBBAA....";
  s.game().load_position(cells_from(cells), Party::Opponent);
  EXPECT_EQ(s.party_outcome(), PartyOutcome::Human);
  EXPECT_TRUE(contains(s.status_message(), std::string("O teu lado era ") + mine));
}

TEST(GameSession, DebugLogsMoves) {
  CaptureLog log;
  GameSession s(GameMode::Deterministic, Party::Human, /*debug_level=*/1);
  ASSERT_TRUE(s.play(2, 2).ok());
  EXPECT_TRUE(contains(log.buf.str(), "[move] human -> (2,2) = A"));
  EXPECT_TRUE(contains(log.buf.str(), "[move] opponent/minimax"));
  EXPECT_TRUE(contains(log.buf.str(), "Best move selected"));

  s.play(2, 2);
  EXPECT_TRUE(contains(log.buf.str(), "rejected at (2,2): cell occupied"));
}

TEST(GameSession, FlatBoardForUi) {
  GameSession s(GameMode::Deterministic);
  ASSERT_TRUE(s.play(1, 1).ok());
  std::vector<int> flat = {2,0,0, 0,1,0, 0,0,0};
  EXPECT_EQ(s.get_flat_board(), flat);
}

/* ---------------------------------
   SessionStore
   --------------------------------- */
TEST(SessionStore, LazyCreationIsClassic) {
  SessionStore store;
  EXPECT_EQ(store.find("alice"), nullptr);
  GameSession& s = store.get_or_create("alice");
  EXPECT_EQ(s.mode(), GameMode::Deterministic);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(&store.get_or_create("alice"), &s);
}

TEST(SessionStore, StartReplacesTheGameWholesale) {
  SessionStore store;
  ASSERT_TRUE(store.get_or_create("bob").play(0, 0).ok());

  GameSession& fresh = store.start("bob", GameMode::Randomized);
  EXPECT_EQ(fresh.mode(), GameMode::Randomized);
  EXPECT_EQ(fresh.game().move_count(), 0);
  EXPECT_EQ(store.size(), 1u);
}

TEST(SessionStore, NewGameKeepsPreviousMode) {
  SessionStore store;
  store.start("carol", GameMode::Randomized);
  ASSERT_TRUE(store.find("carol")->play(2, 2).ok());

  GameSession& again = store.new_game("carol");
  EXPECT_EQ(again.mode(), GameMode::Randomized);
  EXPECT_EQ(again.game().move_count(), 0);

  GameSession& other = store.new_game("dave");
  EXPECT_EQ(other.mode(), GameMode::Deterministic);
}

TEST(SessionStore, SessionsAreIndependent) {
  SessionStore store;
  ASSERT_TRUE(store.get_or_create("x").play(1, 1).ok());
  ASSERT_TRUE(store.get_or_create("y").play(0, 2).ok());

  EXPECT_EQ(store.find("x")->game().cell(1, 1), Cell::A);
  EXPECT_EQ(store.find("x")->game().cell(0, 2), Cell::Empty);
  EXPECT_EQ(store.find("y")->game().cell(0, 2), Cell::A);

  EXPECT_TRUE(store.erase("x"));
  EXPECT_FALSE(store.erase("x"));
  EXPECT_EQ(store.find("x"), nullptr);
  EXPECT_NE(store.find("y"), nullptr);
}

/* ---------------------------------
   GameController (consola)
   --------------------------------- */
TEST(GameController, PlaysFromInputStream) {
  std::istringstream in("1 1\nq\n");
  std::ostringstream out;
  GameController controller(GameMode::Deterministic, Party::Human, 0, in, out);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_TRUE(contains(out.str(), "Modo clássico"));
  EXPECT_TRUE(contains(out.str(), "Oponente jogou (0, 0)"));
  EXPECT_EQ(controller.session().game().cell(1, 1), Cell::A);
}

TEST(GameController, ReportsBadInputAndFinishesGame) {
  std::string script = "isto nao\n";
  for (int r = 0; r < 3; ++r)
    for (int c = 0; c < 3; ++c)
      script += std::to_string(r) + " " + std::to_string(c) + "\n";
  script += "q\n";

  std::istringstream in(script);
  std::ostringstream out;
  GameController controller(GameMode::Deterministic, Party::Human, 0, in, out);
  EXPECT_EQ(controller.run(), 1);
  EXPECT_TRUE(contains(out.str(), "Entrada inválida"));
  EXPECT_TRUE(contains(out.str(), "Jogada inválida"));
  EXPECT_TRUE(contains(out.str(), "Fim de jogo"));
}

/* ---------------------------------
   OpponentStrategy
   --------------------------------- */
TEST(OpponentStrategy, PickedFromTheMode) {
  OpponentStrategy classic = strategy_for_mode(GameMode::Deterministic, 0);
  OpponentStrategy chaos = strategy_for_mode(GameMode::Randomized, 0);
  EXPECT_TRUE(std::holds_alternative<AdversarialSearch>(classic));
  EXPECT_TRUE(std::holds_alternative<RandomPlacement>(chaos));
  EXPECT_STREQ(strategy_name(classic), "minimax");
  EXPECT_STREQ(strategy_name(chaos), "random");

  GameState g(GameMode::Deterministic, Party::Opponent);
  auto reply = choose_opponent_move(classic, g);
  ASSERT_TRUE(reply.move.has_value());
  EXPECT_EQ(*reply.move, std::make_pair(0, 0));
}

TEST(GameSession, RenderShowsMarksAndLabels) {
  GameSession s(GameMode::Deterministic);
  ASSERT_TRUE(s.play(1, 1).ok());
  const std::string text = s.render_board();
  EXPECT_TRUE(contains(text, "0|B . ."));
  EXPECT_TRUE(contains(text, "1|. A ."));
  EXPECT_TRUE(contains(text, "0 1 2"));
}
