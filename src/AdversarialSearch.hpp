#ifndef ADVERSARIAL_SEARCH_HPP
#define ADVERSARIAL_SEARCH_HPP

#include "Board.hpp"
#include "GameState.hpp"
#include <cstdint>
#include <optional>
#include <utility>

/**
 * @class AdversarialSearch
 * Minimax exaustivo (profundidade total) para o modo Deterministic.
 *
 * - O Oponente (marca B) é MAX, o Humano (marca A) é MIN.
 * - Terminais: vitória do Oponente +10, do Humano -10, empate 0,
 *   sem desconto por profundidade.
 * - Empates de pontuação: fica a primeira casa em ordem row-major.
 * - A pesquisa trabalha sobre uma cópia do tabuleiro; o GameState só é
 *   alterado pela jogada final, via apply_move.
 */
class AdversarialSearch {
public:
    using Move = Board::Move;

    static constexpr int kWinScore = 10;

    AdversarialSearch() = default;
    explicit AdversarialSearch(int debug_level) : debug_level(debug_level) {}

    // Escolhe e aplica a jogada de quem tem a vez.
    OpponentReply choose_move(GameState& state);

    // Só a escolha, sem aplicar. nullopt se o tabuleiro já é terminal.
    // Se is_max, a raiz é o Oponente; caso contrário, o Humano.
    std::optional<Move> best_move(const Board& board, bool is_max);

    void set_debug_level(int lvl) { debug_level = lvl; }
    int get_debug_level() const { return debug_level; }

    // Alfa-beta ligado por omissão; VELHA_MINIMAX_NO_PRUNE desliga-o.
    void set_pruning(bool enabled) { use_pruning = enabled; }
    bool pruning_enabled() const { return use_pruning; }

    // Nós visitados na última pesquisa (diagnóstico/testes)
    std::uint64_t get_nodes() const { return nodes; }
    int get_last_score() const { return last_score; }

private:
    int debug_level = 0;
#if defined(VELHA_MINIMAX_NO_PRUNE)
    bool use_pruning = false;
#else
    bool use_pruning = true;
#endif
    std::uint64_t nodes = 0;
    int last_score = 0;

    int minimax(Board& board, bool is_max, int alpha, int beta);
    int minimax_no_pruning(Board& board, bool is_max);

    static int evaluate_terminal(const Board& board);
};

#endif // ADVERSARIAL_SEARCH_HPP
