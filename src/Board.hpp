// ============================================================================
// Board.hpp — Interface do tabuleiro do jogo da velha
// ----------------------------------------------------------------------------
// - Grelha 3x3 de células: Empty, A ou B.
// - Coordenadas: (r, c) com origem em (0,0) no canto superior esquerdo.
// - 8 linhas vencedoras: 3 linhas, 3 colunas, 2 diagonais.
// - O Board não conhece jogadores nem modos; só marcas. Quem joga e que
//   marca é colocada é decidido pelo GameState.
// ============================================================================
#ifndef BOARD_HPP
#define BOARD_HPP

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class Side : std::uint8_t { A, B };
enum class Cell : std::uint8_t { Empty, A, B };

inline Cell cell_of(Side s) { return s == Side::A ? Cell::A : Cell::B; }
inline Side other_side(Side s) { return s == Side::A ? Side::B : Side::A; }
char side_char(Side s);
char cell_char(Cell c);

/**
 * @class Board
 * Estado da grelha e regras de linha.
 *
 * Responsabilidades:
 * - Guardar as 9 células (linha a linha).
 * - Detetar linhas completas e tabuleiro cheio.
 * - Fornecer vistas para a UI (grelha plana, texto).
 */
class Board {

public:
    static constexpr int kSize = 3;
    static constexpr int kCells = kSize * kSize;

    using Move = std::pair<int, int>;
    using Line = std::array<Move, 3>;

    // Linhas, colunas e diagonais, por esta ordem.
    static const std::array<Line, 8>& lines();

    Board();
    explicit Board(const std::array<Cell, kCells>& cells);

    static bool is_inside(int r, int c) {
        return r >= 0 && r < kSize && c >= 0 && c < kSize;
    }

    Cell at(int r, int c) const { return cells[index(r, c)]; }
    bool is_cell_free(int r, int c) const { return at(r, c) == Cell::Empty; }

    // Sem validação: quem chama garante is_inside e célula livre.
    void place(int r, int c, Cell mark) { cells[index(r, c)] = mark; }
    void clear_cell(int r, int c) { cells[index(r, c)] = Cell::Empty; }

    // Lado da primeira linha completa encontrada (ordem de lines()).
    std::optional<Side> get_winner() const;
    // Lados de todas as linhas completas (usado em testes de invariantes).
    std::vector<Side> completed_lines() const;

    bool is_full() const;
    int count_empty() const;

    // Casas livres em ordem row-major.
    std::vector<Move> get_empty_cells() const;

    void reset_board();

    //getters para WASM/JS
    // 0 -> vazio, 1 -> A, 2 -> B
    std::vector<int> get_flat_grid() const;
    const std::array<Cell, kCells>& get_cells() const { return cells; }

    // Tabuleiro em texto com etiquetas de linha/coluna.
    std::string to_string() const;

    bool operator==(const Board& o) const { return cells == o.cells; }
    bool operator!=(const Board& o) const { return !(*this == o); }

private:
    std::array<Cell, kCells> cells;

    static std::size_t index(int r, int c) {
        return static_cast<std::size_t>(r * kSize + c);
    }
};

#endif // BOARD_HPP
