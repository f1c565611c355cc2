#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include <random>

#include "state.hpp"

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create scrambled puzzle states for benchmarks and testing.
 */

/**
 * @brief Generate a random state by performing a random walk from the solved state.
 *
 * The function starts from the canonical solved state and applies
 * `target_depth` uniformly-random legal moves in place, returning the final
 * state. Its move count equals the number of moves applied, which is
 * `target_depth` for every side length above 1 (a 1x1 board has no moves).
 *
 * @param side_size Board side length (e.g. 4 for 15-puzzle).
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @throws InvalidArgument if side_size <= 0 or target_depth < 0.
 * @return A sampled `State`.
 */
State random_state_random_walk(int side_size, int target_depth, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_STATE_HPP___
