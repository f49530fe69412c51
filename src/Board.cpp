// ============================================================================
// Board.cpp — Implementação do tabuleiro 3x3
// ----------------------------------------------------------------------------
// - cells[r*3 + c] guarda Empty / A / B.
// - A deteção de vitória percorre as 8 linhas pela ordem fixa de lines():
//   linhas 0..2, colunas 0..2, diagonal principal, antidiagonal.
// ============================================================================

#include "Board.hpp"
#include <algorithm>
#include <sstream>

char side_char(Side s) {
    return s == Side::A ? 'A' : 'B';
}

char cell_char(Cell c) {
    switch (c) {
        case Cell::A:     return 'A';
        case Cell::B:     return 'B';
        case Cell::Empty: return '.';
    }
    return '.';
}

const std::array<Board::Line, 8>& Board::lines() {
    static const std::array<Line, 8> all = {{
        {{ {0, 0}, {0, 1}, {0, 2} }},
        {{ {1, 0}, {1, 1}, {1, 2} }},
        {{ {2, 0}, {2, 1}, {2, 2} }},
        {{ {0, 0}, {1, 0}, {2, 0} }},
        {{ {0, 1}, {1, 1}, {2, 1} }},
        {{ {0, 2}, {1, 2}, {2, 2} }},
        {{ {0, 0}, {1, 1}, {2, 2} }},
        {{ {0, 2}, {1, 1}, {2, 0} }},
    }};
    return all;
}

Board::Board() {
    cells.fill(Cell::Empty);
}

Board::Board(const std::array<Cell, kCells>& cells) : cells(cells) {}

// ============================================================================
// DETEÇÃO DE ESTADOS TERMINAIS
// ============================================================================

std::optional<Side> Board::get_winner() const {
    for (const auto& line : lines()) {
        Cell a = at(line[0].first, line[0].second);
        if (a == Cell::Empty) continue;
        if (a == at(line[1].first, line[1].second) &&
            a == at(line[2].first, line[2].second)) {
            return a == Cell::A ? Side::A : Side::B;
        }
    }
    return std::nullopt;
}

std::vector<Side> Board::completed_lines() const {
    std::vector<Side> out;
    for (const auto& line : lines()) {
        Cell a = at(line[0].first, line[0].second);
        if (a == Cell::Empty) continue;
        if (a == at(line[1].first, line[1].second) &&
            a == at(line[2].first, line[2].second)) {
            out.push_back(a == Cell::A ? Side::A : Side::B);
        }
    }
    return out;
}

bool Board::is_full() const {
    return std::none_of(cells.begin(), cells.end(),
                        [](Cell c) { return c == Cell::Empty; });
}

int Board::count_empty() const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), Cell::Empty));
}

std::vector<Board::Move> Board::get_empty_cells() const {
    std::vector<Move> moves;
    moves.reserve(kCells);
    for (int r = 0; r < kSize; ++r) {
        for (int c = 0; c < kSize; ++c) {
            if (is_cell_free(r, c)) moves.emplace_back(r, c);
        }
    }
    return moves;
}

void Board::reset_board() {
    cells.fill(Cell::Empty);
}

// ============================================================================
// HELPERS (WASM/UI)
// ============================================================================

std::vector<int> Board::get_flat_grid() const {
    std::vector<int> flat;
    flat.reserve(kCells);
    for (Cell c : cells) {
        flat.push_back(static_cast<int>(c));
    }
    return flat;
}

std::string Board::to_string() const {
    std::ostringstream oss;
    for (int r = 0; r < kSize; ++r) {
        oss << r << "|";
        for (int c = 0; c < kSize; ++c) {
            oss << cell_char(at(r, c)) << (c + 1 < kSize ? " " : "");
        }
        oss << "\n";
    }
    oss << "  -----\n";
    oss << "  0 1 2\n";
    return oss.str();
}
