#include "TestController.hpp"
#include "LogMsgs.hpp"
#include <stdexcept>

void MatchTally::add(PartyOutcome r) {
    ++games;
    switch (r) {
        case PartyOutcome::Human:    ++human_wins; break;
        case PartyOutcome::Opponent: ++opponent_wins; break;
        case PartyOutcome::Draw:     ++draws; break;
        case PartyOutcome::None:     break;
    }
}

MatchKind parse_match_kind(const std::string& s) {
    if (s == "search" || s == "minimax" || s == "ss") return MatchKind::SearchVsSearch;
    if (s == "random" || s == "rs") return MatchKind::RandomVsSearch;
    if (s == "chaos" || s == "rr") return MatchKind::RandomVsRandom;
    throw std::invalid_argument("Unknown match kind: " + s);
}

const char* match_kind_label(MatchKind k) {
    switch (k) {
        case MatchKind::SearchVsSearch: return "minimax vs minimax";
        case MatchKind::RandomVsSearch: return "random vs minimax";
        case MatchKind::RandomVsRandom: return "random vs random";
    }
    return "?";
}

TestController::TestController(MatchKind kind, Party first_mover, int debug, std::uint32_t seed)
    : kind_(kind),
      debug(debug),
      state(kind == MatchKind::RandomVsRandom ? GameMode::Randomized : GameMode::Deterministic,
            first_mover, seed),
      search_human(debug >= 2 ? debug - 1 : 0),
      search_opponent(debug >= 2 ? debug - 1 : 0),
      random_human(seed + 1),
      random_opponent(seed + 2) {}

OpponentReply TestController::play_turn() {
    const bool human_turn = state.mover() == Party::Human;
    switch (kind_) {
        case MatchKind::SearchVsSearch:
            return human_turn ? search_human.choose_move(state)
                              : search_opponent.choose_move(state);
        case MatchKind::RandomVsSearch:
            return human_turn ? random_human.choose_move(state)
                              : search_opponent.choose_move(state);
        case MatchKind::RandomVsRandom:
            break;
    }
    return human_turn ? random_human.choose_move(state)
                      : random_opponent.choose_move(state);
}

MatchResult TestController::run() {
    MatchResult result;
    state.reset();
    if (state.is_randomized()) {
        MoveError e = state.assign_sides_randomly();
        if (e != MoveError::None) {
            throw std::logic_error(std::string("side assignment failed: ") + move_error_label(e));
        }
    }

    while (!state.is_over()) {
        const char* who = party_label(state.mover());
        OpponentReply reply = play_turn();
        if (!reply.ok() || !reply.move) {
            LogMsgs::out() << "[Warning] " << who << " could not move: "
                           << move_error_label(reply.error) << "\n";
            break;
        }
        result.sequence.push_back(*reply.move);
        if (debug >= 2) print_board();
    }

    result.outcome = state.outcome();
    result.result = state.resolve_outcome_to_party();
    result.moves = static_cast<int>(result.sequence.size());
    return result;
}

MatchTally TestController::run_games(int games) {
    MatchTally tally;
    for (int i = 1; i <= games; ++i) {
        MatchResult r = run();
        tally.add(r.result);
        if (debug >= 1) {
            LogMsgs::Match::log_game(i, party_outcome_label(r.result), r.moves);
        }
    }
    return tally;
}

void TestController::print_board() const {
    LogMsgs::out() << "\nTabuleiro:\n" << state.board().to_string();
}
