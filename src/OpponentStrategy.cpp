#include "OpponentStrategy.hpp"

OpponentStrategy strategy_for_mode(GameMode mode, int debug_level) {
    if (mode == GameMode::Randomized) {
        return RandomPlacement();
    }
    return AdversarialSearch(debug_level);
}

OpponentReply choose_opponent_move(OpponentStrategy& strategy, GameState& state) {
    return std::visit([&state](auto& s) { return s.choose_move(state); }, strategy);
}

const char* strategy_name(const OpponentStrategy& strategy) {
    return std::holds_alternative<AdversarialSearch>(strategy) ? "minimax" : "random";
}
