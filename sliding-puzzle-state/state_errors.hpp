#ifndef __STATE_ERRORS_HPP___
#define __STATE_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @file state_errors.hpp
 * @brief Exception types thrown by the sliding-puzzle `State`.
 *
 * Every error is raised before the offending operation touches the state,
 * so a caught exception always leaves the state as it was.
 */

/**
 * @brief Non-positive side length or another invalid construction argument.
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A row or column outside [0, side_length).
 */
class IndexOutOfRange : public std::out_of_range {
public:
    explicit IndexOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @brief A tile value outside [0, side_length^2).
 */
class ValueOutOfRange : public std::out_of_range {
public:
    explicit ValueOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @brief A line that is not a valid state encoding.
 */
class MalformedEncoding : public std::invalid_argument {
public:
    explicit MalformedEncoding(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A move that would push the empty cell off the board.
 *
 * Search code hits this routinely; prefer `State::can_move` when only
 * filtering directions.
 */
class IllegalMove : public std::logic_error {
public:
    explicit IllegalMove(const std::string& what) : std::logic_error(what) {}
};

#endif // __STATE_ERRORS_HPP___
