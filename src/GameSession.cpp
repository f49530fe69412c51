#include "GameSession.hpp"
#include "LogMsgs.hpp"
#include <sstream>

GameSession::GameSession(GameMode mode, Party first_mover, int debug_level)
    : state(mode, first_mover),
      opponent(strategy_for_mode(mode, debug_level)),
      debug_level(debug_level)
{
    new_game();
}

GameSession::GameSession(GameMode mode, Party first_mover, int debug_level, std::uint32_t seed)
    : state(mode, first_mover, seed),
      opponent(strategy_for_mode(mode, debug_level)),
      debug_level(debug_level)
{
    if (auto* rp = std::get_if<RandomPlacement>(&opponent)) {
        rp->reseed(seed ^ 0x9E3779B9u);
    }
    new_game();
}

void GameSession::new_game() {
    state.reset();
    if (state.is_randomized()) {
        MoveError e = state.assign_sides_randomly();
        if (e != MoveError::None) {
            LogMsgs::out() << "[Warning] sides not reassigned: " << move_error_label(e) << "\n";
        }
    }
    // O humano joga sempre sobre um tabuleiro à espera dele.
    if (state.mover() == Party::Opponent) {
        opponent_turn();
    }
}

TurnReport GameSession::play(int row, int col) {
    TurnReport report;
    report.human = state.apply_move(row, col);
    report.error = report.human.error;

    if (!report.human.ok()) {
        if (debug_level >= 1) {
            LogMsgs::Game::log_rejected("human", row, col, move_error_label(report.error));
        }
        report.result = state.resolve_outcome_to_party();
        return report;
    }
    if (debug_level >= 1) LogMsgs::Game::log_move("human", report.human);

    if (!state.is_over() && state.mover() == Party::Opponent) {
        report.opponent = opponent_turn();
    } else if (debug_level >= 1) {
        log_end();
    }

    report.result = state.resolve_outcome_to_party();
    return report;
}

std::optional<OpponentReply> GameSession::opponent_turn() {
    if (state.is_over()) return std::nullopt;

    OpponentReply reply = choose_opponent_move(opponent, state);
    if (debug_level >= 1) log_reply(reply);
    return reply;
}

void GameSession::log_reply(const OpponentReply& reply) const {
    const std::string who = std::string("opponent/") + strategy_name(opponent);
    if (!reply.ok()) {
        LogMsgs::Game::log_rejected(who, -1, -1, move_error_label(reply.error));
        return;
    }
    if (reply.move) {
        MoveResult res;
        res.row = reply.move->first;
        res.col = reply.move->second;
        res.placed = reply.placed;
        res.outcome = reply.outcome;
        LogMsgs::Game::log_move(who, res);
    }
    if (state.is_over()) log_end();
}

void GameSession::log_end() const {
    LogMsgs::Game::log_outcome(outcome_label(state.outcome()),
                               party_outcome_label(state.resolve_outcome_to_party()));
}

std::string GameSession::status_message() const {
    std::ostringstream oss;
    const PartyOutcome winner = state.resolve_outcome_to_party();

    if (state.is_randomized()) {
        const char mine = side_char(state.sides().human);
        const char theirs = side_char(state.sides().opponent);
        switch (winner) {
            case PartyOutcome::Human:
                oss << "🎉 Ganhaste! O teu lado era " << mine
                    << ". As jogadas aleatórias fizeram três em linha! 🍀";
                break;
            case PartyOutcome::Opponent:
                oss << "😢 Perdeste! O teu lado era " << mine
                    << ", o bot jogava com " << theirs << ". Tenta outra vez! 💪";
                break;
            case PartyOutcome::Draw:
                oss << "🤝 Empate! O teu lado era " << mine << ".";
                break;
            case PartyOutcome::None:
                oss << "🎲 Modo aleatório: cada jogada coloca uma marca sorteada. A tua vez:";
                break;
        }
        return oss.str();
    }

    switch (winner) {
        case PartyOutcome::Human:
            oss << "🎉 Ganhaste! " << side_char(Side::A) << " fez três em linha! 🏆";
            break;
        case PartyOutcome::Opponent:
            oss << "😢 Perdeste! " << side_char(Side::B) << " fez três em linha! Tenta outra vez! 💪";
            break;
        case PartyOutcome::Draw:
            oss << "🤝 Empate!";
            break;
        case PartyOutcome::None:
            oss << "🎮 Jogo em curso. A tua vez (" << side_char(Side::A) << "):";
            break;
    }
    return oss.str();
}
