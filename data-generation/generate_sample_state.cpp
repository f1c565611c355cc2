#include <random>
#include <string>
#include <vector>

#include "generate_sample_state.hpp"

using namespace std;

State random_state_random_walk(int side_size, int target_depth, mt19937 &rng) {
    if (target_depth < 0) {
        throw InvalidArgument("Random walk depth must be non-negative, got " + to_string(target_depth));
    }
    State state(side_size);
    for (int i = 0; i < target_depth; ++i) {
        vector<Direction> directions = state.get_available_directions();
        if (directions.empty()) break;
        uniform_int_distribution<size_t> dist(0, directions.size() - 1);
        state.move(directions[dist(rng)]);
    }
    return state;
}
