#pragma once
#include "GameSession.hpp"
#include <iostream>
#include <string>

// Jogo na consola: lê "linha coluna" do input, "n" para novo jogo,
// "q" para sair. O oponente responde dentro do GameSession.
class GameController {
public:
    GameController(GameMode mode, Party first_mover, int debug,
                   std::istream& in = std::cin, std::ostream& out = std::cout);

    // Devolve o número de jogos terminados.
    int run();

    const GameSession& session() const { return session_; }

private:
    GameSession session_;
    std::istream& in;
    std::ostream& out;

    void print_board() const;
    void print_intro() const;
    void handle_terminal_state() const;
};
