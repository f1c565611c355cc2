#ifndef __DIRECTION_HPP___
#define __DIRECTION_HPP___

#include <array>

/**
 * @file direction.hpp
 * @brief Directions the empty cell can move in.
 */

/**
 * @brief Movement of the empty cell (not of the tile it swaps with).
 *
 * `up` moves the empty cell one row towards row 0.
 */
enum class Direction {
    up,
    down,
    left,
    right
};

/**
 * @brief All directions in the order successors are generated.
 */
inline constexpr std::array<Direction, 4> all_directions = {
    Direction::up, Direction::down, Direction::left, Direction::right
};

/**
 * @brief The direction that undoes a move in `direction`.
 */
constexpr Direction opposite(Direction direction) noexcept {
    switch (direction) {
        case Direction::up: return Direction::down;
        case Direction::down: return Direction::up;
        case Direction::left: return Direction::right;
        case Direction::right: return Direction::left;
    }
    return direction;
}

constexpr int row_offset(Direction direction) noexcept {
    switch (direction) {
        case Direction::up: return -1;
        case Direction::down: return 1;
        default: return 0;
    }
}

constexpr int column_offset(Direction direction) noexcept {
    switch (direction) {
        case Direction::left: return -1;
        case Direction::right: return 1;
        default: return 0;
    }
}

inline const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::up: return "up";
        case Direction::down: return "down";
        case Direction::left: return "left";
        case Direction::right: return "right";
    }
    return "unknown";
}

#endif // __DIRECTION_HPP___
