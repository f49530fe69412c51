#ifndef OPPONENT_STRATEGY_HPP
#define OPPONENT_STRATEGY_HPP

#include "AdversarialSearch.hpp"
#include "GameState.hpp"
#include "RandomPlacement.hpp"
#include <variant>

// Estratégia do oponente, escolhida uma vez quando o modo é escolhido.
using OpponentStrategy = std::variant<AdversarialSearch, RandomPlacement>;

// Deterministic -> AdversarialSearch, Randomized -> RandomPlacement
OpponentStrategy strategy_for_mode(GameMode mode, int debug_level = 0);

// Despacho para a estratégia ativa. AdversarialSearch num jogo Randomized
// devolve InvalidModeOperation sem tocar no estado.
OpponentReply choose_opponent_move(OpponentStrategy& strategy, GameState& state);

const char* strategy_name(const OpponentStrategy& strategy);

#endif // OPPONENT_STRATEGY_HPP
