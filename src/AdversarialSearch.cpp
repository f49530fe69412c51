// ============================================================================
// AdversarialSearch.cpp — Minimax para o jogo da velha
// ----------------------------------------------------------------------------
//
// - Escolha de jogada na raiz: percorre as casas livres em ordem row-major e
//   fica com a primeira que atinge a melhor pontuação (comparação estrita).
// - Minimax com poda alfa–beta (fail-soft). Cada filho da raiz é pesquisado
//   com janela completa, por isso os valores na raiz são exatos e a poda não
//   muda a jogada escolhida.
// - Sem tabela de transposição: o espaço é no máximo 9! estados.
// ============================================================================

#include "AdversarialSearch.hpp"
#include "LogMsgs.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <vector>

OpponentReply AdversarialSearch::choose_move(GameState& state) {
    OpponentReply reply;
    reply.outcome = state.outcome();

    if (state.is_randomized()) {
        reply.error = MoveError::InvalidModeOperation;
        return reply;
    }
    if (state.is_over()) return reply;

    const auto start_time = std::chrono::steady_clock::now();
    const bool is_max = state.mover() == Party::Opponent;

    auto mv = best_move(state.board(), is_max);
    if (!mv) return reply;  // sem jogadas possíveis

    MoveResult res = state.apply_move(mv->first, mv->second);
    reply.error = res.error;
    reply.move = mv;
    reply.placed = res.placed;
    reply.outcome = res.outcome;

    if (debug_level >= 1) {
        auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time
        ).count();
        LogMsgs::Search::log_best_move(is_max ? "MAX" : "MIN", *mv, last_score,
                                       static_cast<long long>(nodes));
        LogMsgs::Search::log_elapsed(elapsed);
        LogMsgs::out() << "\n";
    }
    return reply;
}

std::optional<AdversarialSearch::Move> AdversarialSearch::best_move(const Board& board, bool is_max) {
    nodes = 0;
    last_score = 0;

    if (board.get_winner() || board.is_full()) return std::nullopt;

    Board scratch = board;  // cópia local: mutate-and-restore só aqui
    const auto rootMoves = scratch.get_empty_cells();
    const Cell mark = is_max ? Cell::B : Cell::A;

    if (debug_level >= 2) {
        LogMsgs::Search::log_algo_tag(use_pruning ? "alg:minimax_ab" : "alg:minimax_no_pruning");
        LogMsgs::Search::log_root_moves(rootMoves, is_max);
    }

    int best_score = is_max ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
    Move best = rootMoves.front();

    for (std::size_t i = 0; i < rootMoves.size(); ++i) {
        const auto& mv = rootMoves[i];
        scratch.place(mv.first, mv.second, mark);
        int score = use_pruning
            ? minimax(scratch, !is_max,
                      std::numeric_limits<int>::min(),
                      std::numeric_limits<int>::max())
            : minimax_no_pruning(scratch, !is_max);
        scratch.clear_cell(mv.first, mv.second);

        if (debug_level >= 2) {
            LogMsgs::Search::log_root_score(mv, score, i + 1 == rootMoves.size());
        }

        if ((is_max && score > best_score) || (!is_max && score < best_score)) {
            best_score = score;
            best = mv;
        }
        // Nada supera uma vitória; as casas seguintes não podiam ganhar o empate.
        if ((is_max && best_score == kWinScore) || (!is_max && best_score == -kWinScore)) {
            break;
        }
    }

    last_score = best_score;
    return best;
}

// ----------------------------------------------------------------------------
// minimax(board, is_max, alpha, beta):
// - MAX coloca B, MIN coloca A; a célula é limpa ao regressar.
// - Terminal: evaluate_terminal; tabuleiro cheio sem linha: 0.
// ----------------------------------------------------------------------------
int AdversarialSearch::minimax(Board& board, bool is_max, int alpha, int beta) {
    ++nodes;

    if (board.get_winner() || board.is_full()) {
        return evaluate_terminal(board);
    }

    const Cell mark = is_max ? Cell::B : Cell::A;
    int best = is_max ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();

    for (int r = 0; r < Board::kSize; ++r) {
        for (int c = 0; c < Board::kSize; ++c) {
            if (!board.is_cell_free(r, c)) continue;

            board.place(r, c, mark);
            int score = minimax(board, !is_max, alpha, beta);
            board.clear_cell(r, c);

            if (is_max) {
                best = std::max(best, score);
                alpha = std::max(alpha, best);
            } else {
                best = std::min(best, score);
                beta = std::min(beta, best);
            }
            if (beta <= alpha) {
                return best;  // corte
            }
        }
    }
    return best;
}

int AdversarialSearch::minimax_no_pruning(Board& board, bool is_max) {
    ++nodes;

    if (board.get_winner() || board.is_full()) {
        return evaluate_terminal(board);
    }

    const Cell mark = is_max ? Cell::B : Cell::A;
    int best = is_max ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();

    for (int r = 0; r < Board::kSize; ++r) {
        for (int c = 0; c < Board::kSize; ++c) {
            if (!board.is_cell_free(r, c)) continue;

            board.place(r, c, mark);
            int score = minimax_no_pruning(board, !is_max);
            board.clear_cell(r, c);

            best = is_max ? std::max(best, score) : std::min(best, score);
        }
    }
    return best;
}

int AdversarialSearch::evaluate_terminal(const Board& board) {
    // - Converte estado terminal em valor numérico:
    //   +10 -> linha de B (Oponente)
    //   -10 -> linha de A (Humano)
    //    0  -> empate
    auto w = board.get_winner();
    if (!w) return 0;
    return *w == Side::B ? kWinScore : -kWinScore;
}
