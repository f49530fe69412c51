#pragma once
#include "GameState.hpp"
#include "OpponentStrategy.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Resultado de uma volta: jogada do humano + resposta do oponente (se houve).
struct TurnReport {
    MoveError error = MoveError::None;
    MoveResult human;
    std::optional<OpponentReply> opponent;
    PartyOutcome result = PartyOutcome::None;

    bool ok() const { return error == MoveError::None; }
};

/**
 * @class GameSession
 * Um jogo de uma sessão: GameState + estratégia do oponente, escolhida a
 * partir do modo no arranque e fixa até um novo jogo noutro modo.
 *
 * Sem sincronização: quem chama serializa o acesso por sessão.
 */
class GameSession {
public:
    explicit GameSession(GameMode mode = GameMode::Deterministic,
                         Party first_mover = Party::Human,
                         int debug_level = 0);
    GameSession(GameMode mode, Party first_mover, int debug_level, std::uint32_t seed);

    // Jogada do humano; se o jogo continuar, o oponente responde logo.
    TurnReport play(int row, int col);
    // Vez do oponente (quando é ele a começar).
    std::optional<OpponentReply> opponent_turn();

    // Novo jogo no mesmo modo; em Randomized os lados são sorteados de novo.
    void new_game();

    std::string status_message() const;
    std::string render_board() const { return state.board().to_string(); }

    // getters para a UI
    const GameState& game() const { return state; }
    GameState& game() { return state; }
    GameMode mode() const { return state.mode(); }
    bool is_randomized() const { return state.is_randomized(); }
    PartyOutcome party_outcome() const { return state.resolve_outcome_to_party(); }
    std::vector<int> get_flat_board() const { return state.board().get_flat_grid(); }
    const OpponentStrategy& strategy() const { return opponent; }

    void set_debug_level(int lvl) { debug_level = lvl; }

private:
    GameState state;
    OpponentStrategy opponent;
    int debug_level = 0;

    void log_reply(const OpponentReply& reply) const;
    void log_end() const;
};
