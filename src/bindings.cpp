#include <emscripten/bind.h>
#include "GameSession.hpp"

using namespace emscripten;

// Wrappers: a UI só precisa de inteiros (erro, casas, resultado).
static int session_play(GameSession& s, int row, int col) {
    return static_cast<int>(s.play(row, col).error);
}

static std::vector<int> session_opponent_turn(GameSession& s) {
    auto reply = s.opponent_turn();
    if (!reply || !reply->move) return {};
    return {reply->move->first, reply->move->second};
}

static int session_party_outcome(const GameSession& s) {
    return static_cast<int>(s.party_outcome());
}

static int session_human_side(const GameSession& s) {
    return static_cast<int>(s.game().sides().human);
}

EMSCRIPTEN_BINDINGS(std_types) {
    register_vector<int>("VectorInt");
}

EMSCRIPTEN_BINDINGS(velha_module) {
    enum_<GameMode>("GameMode")
    .value("Deterministic", GameMode::Deterministic)
    .value("Randomized", GameMode::Randomized);

    enum_<Party>("Party")
    .value("Human", Party::Human)
    .value("Opponent", Party::Opponent);

    enum_<PartyOutcome>("PartyOutcome")
    .value("None", PartyOutcome::None)
    .value("Human", PartyOutcome::Human)
    .value("Opponent", PartyOutcome::Opponent)
    .value("Draw", PartyOutcome::Draw);

    class_<GameSession>("GameSession")
        .constructor<GameMode, Party, int>()
        .function("play", &session_play)
        .function("opponentTurn", &session_opponent_turn)
        .function("newGame", &GameSession::new_game)
        .function("getFlatBoard", &GameSession::get_flat_board)
        .function("getPartyOutcome", &session_party_outcome)
        .function("getHumanSide", &session_human_side)
        .function("isRandomized", &GameSession::is_randomized)
        .function("statusMessage", &GameSession::status_message)
        .function("setDebugLevel", &GameSession::set_debug_level)
        ;
}
