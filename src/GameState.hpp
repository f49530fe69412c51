// ============================================================================
// GameState.hpp — Estado de um jogo: tabuleiro, turno, modo e resultado
// ----------------------------------------------------------------------------
// - Única via de mutação durante o jogo: apply_move(row, col).
// - Modo Deterministic: a marca é a identidade de quem joga
//   (Humano -> A, Oponente -> B).
// - Modo Randomized: cada jogada coloca uma marca sorteada (A ou B),
//   independente de quem joga; a SideAssignment decide só a quem
//   pertence a vitória.
// - O Outcome é recalculado depois de cada jogada (nunca em lote).
// ============================================================================
#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#pragma once
#include "Board.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <utility>
#include <vector>

enum class GameMode : std::uint8_t { Deterministic, Randomized };
enum class Party : std::uint8_t { Human, Opponent };
enum class Outcome : std::uint8_t { InProgress, WonA, WonB, Draw };
enum class PartyOutcome : std::uint8_t { None, Human, Opponent, Draw };

enum class MoveError : std::uint8_t {
    None,
    GameOver,
    OutOfBounds,
    CellOccupied,
    InvalidModeOperation
};

// Etiquetas curtas para logging/UI
const char* move_error_label(MoveError e);
const char* mode_label(GameMode m);
const char* party_label(Party p);
const char* outcome_label(Outcome o);
const char* party_outcome_label(PartyOutcome o);

inline Party other_party(Party p) {
    return p == Party::Human ? Party::Opponent : Party::Human;
}
std::optional<Side> winning_side(Outcome o);

struct SideAssignment {
    Side human = Side::A;
    Side opponent = Side::B;
};

struct MoveResult {
    MoveError error = MoveError::None;
    Outcome outcome = Outcome::InProgress;
    Side placed = Side::A;  // só válido quando ok()
    int row = -1;
    int col = -1;

    bool ok() const { return error == MoveError::None; }
};

// Resposta de uma estratégia do oponente.
// move == nullopt quando o jogo já terminou ou não há casas livres.
struct OpponentReply {
    MoveError error = MoveError::None;
    std::optional<std::pair<int, int>> move;
    Side placed = Side::A;
    Outcome outcome = Outcome::InProgress;

    bool ok() const { return error == MoveError::None; }
};

/**
 * @class GameState
 * Tabuleiro + quem joga + modo + atribuição de lados + resultado em cache.
 *
 * Um GameState por sessão, acedido por um único escritor. Cada instância
 * tem o seu próprio gerador aleatório; nada é partilhado entre jogos.
 */
class GameState {
public:
    using Move = Board::Move;

    explicit GameState(GameMode mode = GameMode::Deterministic,
                       Party first_mover = Party::Human);
    GameState(GameMode mode, Party first_mover, std::uint32_t seed);

    /**
     * Aplica a jogada de quem tem a vez.
     * Verifica, por esta ordem: jogo terminado (GameOver), limites
     * (OutOfBounds), célula ocupada (CellOccupied). Uma jogada rejeitada
     * não altera nada.
     */
    MoveResult apply_move(int row, int col);

    // Outcome -> parte (Humano/Oponente/Empate); None enquanto decorre.
    PartyOutcome resolve_outcome_to_party() const;

    // Limpa tabuleiro e turno; mantém modo e lados.
    void reset();

    // Só em Randomized e antes da primeira jogada; senão InvalidModeOperation.
    MoveError assign_sides_randomly();
    MoveError set_sides(Side human_side);

    // Reconstrói um estado (puzzles/testes) sem passar pelas regras.
    // O Outcome é recalculado a partir das células recebidas.
    void load_position(const std::array<Cell, Board::kCells>& cells, Party mover);

    void reseed(std::uint32_t seed) { rng.seed(seed); }

    // Getters
    const Board& board() const { return board_; }
    Cell cell(int r, int c) const { return board_.at(r, c); }
    GameMode mode() const { return mode_; }
    bool is_randomized() const { return mode_ == GameMode::Randomized; }
    Party mover() const { return mover_; }
    Party first_mover() const { return first_mover_; }
    Outcome outcome() const { return outcome_; }
    bool is_over() const { return outcome_ != Outcome::InProgress; }
    const SideAssignment& sides() const { return sides_; }
    int move_count() const { return Board::kCells - board_.count_empty(); }
    std::vector<Move> empty_cells() const { return board_.get_empty_cells(); }

    // Lado "dono" de cada parte (fixo em Deterministic).
    Side side_of(Party p) const;

private:
    Board board_;
    GameMode mode_;
    Party first_mover_;
    Party mover_;
    SideAssignment sides_;
    Outcome outcome_ = Outcome::InProgress;
    std::mt19937 rng;

    Side draw_mark();
    void update_outcome();
};

#endif // GAME_STATE_HPP
