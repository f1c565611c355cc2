#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "state.hpp"

using namespace std;

static int checked_side_length(int side_length) {
    checked_num_cells(side_length);
    return side_length;
}

State::State() : State(1) {
}

State::State(int side_length, StorageKind storage)
    : side_length(checked_side_length(side_length)),
      cells(side_length, storage),
      empty_row(side_length - 1),
      empty_column(side_length - 1),
      move_count(0) {
    int num_cells = side_length * side_length;
    for (int i = 0; i < num_cells - 1; ++i) {
        cells.set(i, i + 1);
    }
    cells.set(num_cells - 1, 0);
}

// values must already be a permutation of [0, side_length^2)
State::State(int side_length, StorageKind storage, const vector<int>& values, int move_count)
    : side_length(side_length),
      cells(side_length, storage),
      empty_row(0),
      empty_column(0),
      move_count(move_count) {
    for (int i = 0; i < static_cast<int>(values.size()); ++i) {
        cells.set(i, values[i]);
        if (values[i] == 0) {
            empty_row = i / side_length;
            empty_column = i % side_length;
        }
    }
}

void State::check_position(int row, int column) const {
    if (row < 0 || row >= side_length || column < 0 || column >= side_length) {
        throw IndexOutOfRange("Position (" + std::to_string(row) + "," + std::to_string(column) +
                              ") is outside a " + std::to_string(side_length) + "x" +
                              std::to_string(side_length) + " board");
    }
}

int State::get_absolute_position(int row, int column) const {
    check_position(row, column);
    return index_of(row, column);
}

int State::get_value(int row, int column) const {
    check_position(row, column);
    return cells.get(index_of(row, column));
}

void State::set_value(int value, int row, int column) {
    check_position(row, column);
    int num_cells = side_length * side_length;
    if (value < 0 || value >= num_cells) {
        throw ValueOutOfRange("Tile values must be in range [0," + std::to_string(num_cells - 1) +
                              "], got " + std::to_string(value));
    }
    cells.set(index_of(row, column), value);
    if (value == 0) {
        empty_row = row;
        empty_column = column;
    }
}

bool State::is_consistent() const {
    int num_cells = side_length * side_length;
    vector<bool> seen(num_cells, false);
    for (int i = 0; i < num_cells; ++i) {
        int value = cells.get(i);
        if (value < 0 || value >= num_cells || seen[value]) return false;
        seen[value] = true;
    }
    return cells.get(index_of(empty_row, empty_column)) == 0;
}

void State::swap_cells(int row1, int column1, int row2, int column2) {
    cells.swap(index_of(row1, column1), index_of(row2, column2));
}

bool State::can_move(Direction direction) const {
    switch (direction) {
        case Direction::up: return empty_row > 0;
        case Direction::down: return empty_row < side_length - 1;
        case Direction::left: return empty_column > 0;
        case Direction::right: return empty_column < side_length - 1;
    }
    return false;
}

void State::move(Direction direction) {
    if (!can_move(direction)) {
        throw IllegalMove(string("Cannot move empty cell ") + ::to_string(direction) + " from (" +
                          std::to_string(empty_row) + "," + std::to_string(empty_column) + ")");
    }
    if (move_count == numeric_limits<int>::max()) {
        throw IllegalMove("Move count " + std::to_string(move_count) + " cannot be incremented");
    }
    int target_row = empty_row + row_offset(direction);
    int target_column = empty_column + column_offset(direction);
    swap_cells(empty_row, empty_column, target_row, target_column);
    empty_row = target_row;
    empty_column = target_column;
    ++move_count;
}

State State::moved(Direction direction) const {
    State next = *this;
    next.move(direction);
    return next;
}

vector<Direction> State::get_available_directions() const {
    vector<Direction> directions;
    for (Direction direction : all_directions) {
        if (can_move(direction)) directions.push_back(direction);
    }
    return directions;
}

vector<State> State::get_available_moves() const {
    vector<State> moves;
    moves.reserve(all_directions.size());
    for (Direction direction : all_directions) {
        if (can_move(direction)) {
            moves.push_back(moved(direction));
        }
    }
    return moves;
}

bool State::is_solution() const {
    int num_cells = side_length * side_length;
    for (int i = 0; i < num_cells - 1; ++i) {
        if (cells.get(i) != i + 1) return false;
    }
    return cells.get(num_cells - 1) == 0;
}

size_t State::hash() const {
    uint64_t h = 1469598103934665603ULL; // FNV offset
    h ^= static_cast<uint64_t>(side_length);
    h *= 1099511628211ULL;
    int num_cells = side_length * side_length;
    for (int i = 0; i < num_cells; ++i) {
        h ^= static_cast<uint64_t>(cells.get(i) + 1);
        h *= 1099511628211ULL; // FNV prime
    }
    return static_cast<size_t>(h);
}

string State::to_string() const {
    ostringstream oss;
    oss << "Level " << move_count << '\n';
    for (int row = 0; row < side_length; ++row) {
        for (int column = 0; column < side_length; ++column) {
            if (column) oss << ' ';
            oss << cells.get(index_of(row, column));
        }
        oss << '\n';
    }
    return oss.str();
}

bool State::operator==(const State &rhs) const {
    if (side_length != rhs.side_length) return false;
    int n = side_length * side_length;
    for (int i = 0; i < n; ++i) {
        if (cells.get(i) != rhs.cells.get(i)) return false;
    }
    return true;
}

bool State::operator<(const State &rhs) const {
    if (side_length != rhs.side_length) return side_length < rhs.side_length;
    int n = side_length * side_length;
    for (int i = 0; i < n; ++i) {
        int lhs_value = cells.get(i);
        int rhs_value = rhs.cells.get(i);
        if (lhs_value != rhs_value) return lhs_value < rhs_value;
    }
    return false;
}

ostream& operator<<(ostream& os, const State& state) {
    return os << state.to_string();
}
