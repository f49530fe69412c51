#include "RandomPlacement.hpp"

RandomPlacement::RandomPlacement()
#ifdef VELHA_TESTS
    : rng(987654321u)
#else
    : rng(std::random_device{}())
#endif
{}

OpponentReply RandomPlacement::choose_move(GameState& state) {
    OpponentReply reply;
    reply.outcome = state.outcome();
    if (state.is_over()) return reply;

    const auto empty = state.empty_cells();
    if (empty.empty()) return reply;

    std::uniform_int_distribution<std::size_t> dis(0, empty.size() - 1);
    const auto mv = empty[dis(rng)];

    MoveResult res = state.apply_move(mv.first, mv.second);
    reply.error = res.error;
    reply.move = mv;
    reply.placed = res.placed;
    reply.outcome = res.outcome;
    return reply;
}
