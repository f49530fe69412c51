#include "GameController.hpp"
#include <sstream>

GameController::GameController(GameMode mode, Party first_mover, int debug,
                               std::istream& in, std::ostream& out)
    : session_(mode, first_mover, debug),
      in(in),
      out(out) {}

int GameController::run() {
    int finished = 0;
    print_intro();
    print_board();
    out << session_.status_message() << "\n";

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (line == "q") break;
        if (line == "n") {
            session_.new_game();
            print_intro();
            print_board();
            out << session_.status_message() << "\n";
            continue;
        }

        std::istringstream ss(line);
        int row = -1, col = -1;
        if (!(ss >> row >> col)) {
            out << "Entrada inválida. Usa: linha coluna (ex: 1 1), n ou q\n";
            continue;
        }

        TurnReport report = session_.play(row, col);
        if (!report.ok()) {
            out << "Jogada inválida (" << move_error_label(report.error) << ").\n";
            continue;
        }
        if (report.opponent && report.opponent->move) {
            out << "🤖 Oponente jogou (" << report.opponent->move->first << ", "
                << report.opponent->move->second << ")\n";
        }

        print_board();
        out << session_.status_message() << "\n";
        if (session_.game().is_over()) {
            ++finished;
            handle_terminal_state();
        }
    }
    return finished;
}

void GameController::print_intro() const {
    const GameState& g = session_.game();
    if (g.is_randomized()) {
        out << "\n🎲 Modo aleatório!\n"
            << "O teu lado: " << side_char(g.sides().human)
            << "  | Lado do bot: " << side_char(g.sides().opponent) << "\n"
            << "Cada jogada coloca uma marca SORTEADA (A ou B).\n";
    } else {
        out << "\n🎯 Modo clássico!\n"
            << "Jogas com " << side_char(Side::A) << ", o bot com "
            << side_char(Side::B) << " (minimax).\n";
    }
}

void GameController::print_board() const {
    out << "\nTabuleiro:\n" << session_.render_board();
}

void GameController::handle_terminal_state() const {
    out << "Fim de jogo. 'n' para novo jogo, 'q' para sair.\n";
}
