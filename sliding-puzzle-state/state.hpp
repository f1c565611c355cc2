/**
 * @file state.hpp
 * @brief N x N sliding-puzzle state (tiles, empty cell and move count).
 *
 * This header declares the State class consumed by solvers and tools.
 */

#ifndef __STATE_HPP___
#define __STATE_HPP___

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "cell_storage.hpp"
#include "direction.hpp"
#include "state_errors.hpp"

/**
 * @brief Represents a board state of an N x N sliding puzzle (e.g. 15-puzzle).
 *
 * The board holds every value of [0, side_length^2) exactly once; 0 is the
 * empty cell. The position of the empty cell is cached, and the number of
 * moves applied since the state's origin is carried along. The move count is
 * history only: equality, ordering and hashing look at the tile layout alone,
 * so the same configuration reached by different paths is one search node.
 *
 * States are plain values. Copying produces an independent state.
 */
class State {

private:
    int side_length;
    CellStorage cells;
    int empty_row;
    int empty_column;
    int move_count;

    State(int side_length, StorageKind storage, const std::vector<int>& values, int move_count);

    int index_of(int row, int column) const { return row * side_length + column; }
    void check_position(int row, int column) const;
    void swap_cells(int row1, int column1, int row2, int column2);

public:
    /**
     * @brief Construct the 1x1 solved state.
     */
    State();

    /**
     * @brief Construct the solved state of the given side length.
     *
     * Cells are filled in reading order with 1..side_length^2-1 and the empty
     * cell is placed in the bottom-right corner. The move count is 0.
     *
     * @param side_length Board side length.
     * @param storage Cell storage layout.
     * @throws InvalidArgument if side_length is not in [1, max_side_length],
     *         or if the storage layout cannot hold a board of that size.
     */
    explicit State(int side_length, StorageKind storage = StorageKind::automatic);

    ~State() = default;

    // Rule of five
    State(const State& other) = default;
    State& operator=(const State& other) = default;
    State(State&& other) = default;
    State& operator=(State&& other) = default;

    /**
     * @brief Parse a state from its line encoding.
     *
     * The line holds the move count followed by the cell values in row-major
     * order, separated by whitespace: `<moves> <v(0,0)> <v(0,1)> ...`.
     *
     * @param line Encoded state.
     * @param storage Cell storage layout for the parsed state.
     * @throws MalformedEncoding if a token is not an integer, the number of
     *         cell values is not a positive perfect square, or a value is out
     *         of range or repeated.
     * @throws InvalidArgument if the storage layout cannot hold the board.
     */
    static State from_line(const std::string& line, StorageKind storage = StorageKind::automatic);

    int get_side_length() const { return side_length; }
    int get_empty_row() const { return empty_row; }
    int get_empty_column() const { return empty_column; }
    int get_move_count() const { return move_count; }
    StorageKind get_storage_kind() const { return cells.kind(); }

    /**
     * @brief Reset the move count, e.g. when a state becomes a new search root.
     */
    void set_move_count(int count) { move_count = count; }

    /**
     * @brief Row-major index of a cell.
     *
     * @throws IndexOutOfRange if the position is off the board.
     */
    int get_absolute_position(int row, int column) const;

    /**
     * @brief Value of the cell at (row, column).
     *
     * @throws IndexOutOfRange if the position is off the board.
     */
    int get_value(int row, int column) const;

    /**
     * @brief Overwrite a single cell.
     *
     * Only the position and the value range are checked. Writing 0 moves the
     * empty cell tracking to (row, column). Keeping every value unique is up to
     * the caller across a sequence of writes; see `is_consistent`.
     *
     * @throws IndexOutOfRange if the position is off the board.
     * @throws ValueOutOfRange if value is not in [0, side_length^2).
     */
    void set_value(int value, int row, int column);

    /**
     * @brief Whether the cells hold every value exactly once and the cached
     *        empty cell position points at the 0.
     */
    bool is_consistent() const;

    /**
     * @brief Whether the empty cell can move in `direction`.
     */
    bool can_move(Direction direction) const;

    /**
     * @brief Move the empty cell in place and increment the move count.
     *
     * @throws IllegalMove if the empty cell would leave the board or the move
     *         count is already INT_MAX. The state is unchanged in that case.
     */
    void move(Direction direction);

    /**
     * @brief Return a copy with the empty cell moved; this state is untouched.
     *
     * @throws IllegalMove under the same conditions as `move`.
     */
    State moved(Direction direction) const;

    void move_up() { move(Direction::up); }
    void move_down() { move(Direction::down); }
    void move_left() { move(Direction::left); }
    void move_right() { move(Direction::right); }

    State moved_up() const { return moved(Direction::up); }
    State moved_down() const { return moved(Direction::down); }
    State moved_left() const { return moved(Direction::left); }
    State moved_right() const { return moved(Direction::right); }

    /**
     * @brief Directions the empty cell can currently move in.
     *
     * Listed in the order up, down, left, right.
     */
    std::vector<Direction> get_available_directions() const;

    /**
     * @brief Generate all legal successor states from this state.
     *
     * Successors are returned in the order up, down, left, right (empty cell
     * movement), skipping directions blocked by the border. A corner yields
     * 2 successors, an edge 3, an interior cell 4, and a 1x1 board none.
     *
     * @return Vector of successor `State` instances, each with move count + 1.
     */
    std::vector<State> get_available_moves() const;

    /**
     * @brief Whether the board is in the solved layout.
     */
    bool is_solution() const;

    /**
     * @brief Compute a stable hash for this state.
     *
     * FNV-1a over the side length and the row-major cell values. The move
     * count and the storage layout do not contribute, and the value does not
     * change between runs.
     * @return A size_t hash value.
     */
    std::size_t hash() const;

    /**
     * @brief Line encoding: move count then every cell value, single-spaced.
     */
    std::string to_line() const;

    /**
     * @brief Multi-line board dump for diagnostics.
     */
    std::string to_string() const;

    /**
     * @brief Equality comparison between two states (same side and tile layout).
     */
    bool operator==(const State &rhs) const;
    bool operator!=(const State &rhs) const { return !(*this == rhs); }

    /**
     * @brief Strict weak ordering used for ordered containers (std::set).
     */
    bool operator<(const State &rhs) const;
};

struct StateHash {
    std::size_t operator()(const State& state) const { return state.hash(); }
};

std::ostream& operator<<(std::ostream& os, const State& state);

namespace std {
template <>
struct hash<State> {
    std::size_t operator()(const State& state) const { return state.hash(); }
};
}

#endif // __STATE_HPP___
