// ============================================================================
// GameState.cpp — Regras de jogada, turno e resultado
// ----------------------------------------------------------------------------
// - mover_ alterna Humano/Oponente depois de cada jogada que não termina o
//   jogo, em ambos os modos (em Randomized a marca é sorteada, mas a vez
//   continua a alternar).
// - Suporte a testes (VELHA_TESTS): semente fixa por omissão para que os
//   sorteios sejam reprodutíveis.
// ============================================================================

#include "GameState.hpp"

namespace {
std::uint32_t default_seed() {
#ifdef VELHA_TESTS
    return 123456789u;
#else
    std::random_device rd;
    return rd();
#endif
}
}

const char* move_error_label(MoveError e) {
    switch (e) {
        case MoveError::None:                 return "ok";
        case MoveError::GameOver:             return "game over";
        case MoveError::OutOfBounds:          return "out of bounds";
        case MoveError::CellOccupied:         return "cell occupied";
        case MoveError::InvalidModeOperation: return "invalid operation for this mode";
    }
    return "?";
}

const char* mode_label(GameMode m) {
    return m == GameMode::Deterministic ? "classic" : "random";
}

const char* party_label(Party p) {
    return p == Party::Human ? "human" : "opponent";
}

const char* outcome_label(Outcome o) {
    switch (o) {
        case Outcome::InProgress: return "in progress";
        case Outcome::WonA:       return "A won";
        case Outcome::WonB:       return "B won";
        case Outcome::Draw:       return "draw";
    }
    return "?";
}

const char* party_outcome_label(PartyOutcome o) {
    switch (o) {
        case PartyOutcome::None:     return "none";
        case PartyOutcome::Human:    return "human";
        case PartyOutcome::Opponent: return "opponent";
        case PartyOutcome::Draw:     return "draw";
    }
    return "?";
}

std::optional<Side> winning_side(Outcome o) {
    if (o == Outcome::WonA) return Side::A;
    if (o == Outcome::WonB) return Side::B;
    return std::nullopt;
}

GameState::GameState(GameMode mode, Party first_mover)
    : GameState(mode, first_mover, default_seed()) {}

GameState::GameState(GameMode mode, Party first_mover, std::uint32_t seed)
    : mode_(mode),
      first_mover_(first_mover),
      mover_(first_mover),
      rng(seed) {}

// ============================================================================
// JOGADAS E TRANSIÇÕES DE ESTADO
// ============================================================================

MoveResult GameState::apply_move(int row, int col) {
    MoveResult res;
    res.row = row;
    res.col = col;
    res.outcome = outcome_;

    if (outcome_ != Outcome::InProgress) {
        res.error = MoveError::GameOver;
        return res;
    }
    if (!Board::is_inside(row, col)) {
        res.error = MoveError::OutOfBounds;
        return res;
    }
    if (!board_.is_cell_free(row, col)) {
        res.error = MoveError::CellOccupied;
        return res;
    }

    Side mark = (mode_ == GameMode::Randomized) ? draw_mark() : side_of(mover_);
    board_.place(row, col, cell_of(mark));
    update_outcome();

    if (outcome_ == Outcome::InProgress) {
        mover_ = other_party(mover_);
    }

    res.placed = mark;
    res.outcome = outcome_;
    return res;
}

Side GameState::draw_mark() {
    std::bernoulli_distribution coin(0.5);
    return coin(rng) ? Side::A : Side::B;
}

void GameState::update_outcome() {
    // O jogo termina se:
    // 1) uma das 8 linhas tiver 3 marcas iguais (primeira encontrada), ou
    // 2) não restar nenhuma célula vazia (empate).
    if (auto w = board_.get_winner()) {
        outcome_ = (*w == Side::A) ? Outcome::WonA : Outcome::WonB;
    } else if (board_.is_full()) {
        outcome_ = Outcome::Draw;
    } else {
        outcome_ = Outcome::InProgress;
    }
}

Side GameState::side_of(Party p) const {
    if (mode_ == GameMode::Deterministic) {
        return p == Party::Human ? Side::A : Side::B;
    }
    return p == Party::Human ? sides_.human : sides_.opponent;
}

PartyOutcome GameState::resolve_outcome_to_party() const {
    if (outcome_ == Outcome::InProgress) return PartyOutcome::None;
    if (outcome_ == Outcome::Draw) return PartyOutcome::Draw;

    Side w = (outcome_ == Outcome::WonA) ? Side::A : Side::B;
    return side_of(Party::Human) == w ? PartyOutcome::Human : PartyOutcome::Opponent;
}

void GameState::reset() {
    board_.reset_board();
    mover_ = first_mover_;
    outcome_ = Outcome::InProgress;
}

// ============================================================================
// ATRIBUIÇÃO DE LADOS (modo Randomized)
// ============================================================================

MoveError GameState::assign_sides_randomly() {
    if (mode_ != GameMode::Randomized || move_count() != 0) {
        return MoveError::InvalidModeOperation;
    }
    std::bernoulli_distribution coin(0.5);
    return set_sides(coin(rng) ? Side::A : Side::B);
}

MoveError GameState::set_sides(Side human_side) {
    if (mode_ != GameMode::Randomized || move_count() != 0) {
        return MoveError::InvalidModeOperation;
    }
    sides_.human = human_side;
    sides_.opponent = other_side(human_side);
    return MoveError::None;
}

void GameState::load_position(const std::array<Cell, Board::kCells>& cells, Party mover) {
    board_ = Board(cells);
    mover_ = mover;
    update_outcome();
}
