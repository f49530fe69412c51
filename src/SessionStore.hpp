#pragma once
#include "GameSession.hpp"
#include <cstddef>
#include <map>
#include <string>

/**
 * @class SessionStore
 * Chave de sessão (ex.: id do utilizador) -> um GameSession.
 *
 * - Um jogo novo substitui o anterior por inteiro; nunca se fundem estados.
 * - Sem locks: se a camada de transporte aceitar chamadas concorrentes para a
 *   mesma chave, é ela que as serializa (um mutex ou ator por chave).
 */
class SessionStore {
public:
    explicit SessionStore(int debug_level = 0) : debug_level(debug_level) {}

    // Novo jogo no modo pedido (Randomized -> lados sorteados).
    GameSession& start(const std::string& key, GameMode mode);
    // Novo jogo no modo anterior desta chave (Deterministic se não houver).
    GameSession& new_game(const std::string& key);
    // Jogo existente ou um Deterministic novo.
    GameSession& get_or_create(const std::string& key);

    GameSession* find(const std::string& key);
    const GameSession* find(const std::string& key) const;
    bool erase(const std::string& key);
    std::size_t size() const { return sessions.size(); }

private:
    std::map<std::string, GameSession> sessions;
    int debug_level = 0;
};
