#ifndef RANDOM_PLACEMENT_HPP
#define RANDOM_PLACEMENT_HPP

#include "GameState.hpp"
#include <cstdint>
#include <random>

// Oponente aleatório: escolhe uma casa livre com probabilidade uniforme e
// joga-a via apply_move. Em Randomized, a marca é um segundo sorteio,
// feito dentro do GameState e independente deste.
class RandomPlacement {
public:
    RandomPlacement();
    explicit RandomPlacement(std::uint32_t seed) : rng(seed) {}

    OpponentReply choose_move(GameState& state);

    void reseed(std::uint32_t seed) { rng.seed(seed); }

private:
    std::mt19937 rng;
};

#endif // RANDOM_PLACEMENT_HPP
