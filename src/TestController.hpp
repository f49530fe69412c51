#pragma once
#include "AdversarialSearch.hpp"
#include "GameState.hpp"
#include "RandomPlacement.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Quem controla cada parte num jogo automático
enum class MatchKind {
    SearchVsSearch,   // Deterministic: minimax nas duas partes
    RandomVsSearch,   // Deterministic: aleatório faz de humano contra minimax
    RandomVsRandom    // Randomized: aleatório nas duas partes
};

struct MatchResult {
    PartyOutcome result = PartyOutcome::None;
    Outcome outcome = Outcome::InProgress;
    int moves = 0;
    std::vector<std::pair<int, int>> sequence;
};

struct MatchTally {
    int games = 0;
    int human_wins = 0;
    int opponent_wins = 0;
    int draws = 0;

    void add(PartyOutcome r);
};

MatchKind parse_match_kind(const std::string& s);
const char* match_kind_label(MatchKind k);

class TestController {
public:
    TestController(MatchKind kind, Party first_mover, int debug, std::uint32_t seed);

    // Joga um jogo completo a partir de um tabuleiro vazio.
    MatchResult run();
    // Joga 'games' jogos e acumula os resultados.
    MatchTally run_games(int games);

    const GameState& game() const { return state; }
    MatchKind kind() const { return kind_; }

private:
    MatchKind kind_;
    int debug = 0;
    GameState state;
    AdversarialSearch search_human;
    AdversarialSearch search_opponent;
    RandomPlacement random_human;
    RandomPlacement random_opponent;

    OpponentReply play_turn();
    void print_board() const;
};
