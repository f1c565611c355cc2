// Google Test for State moves and State::get_available_moves
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "state.hpp"

// Builds a 4x4 state with the empty cell swapped into `empty_pos` (row-major).
static State make_state_with_empty_at(int empty_pos) {
    State s(4);
    int row = empty_pos / 4;
    int column = empty_pos % 4;
    int displaced = s.get_value(row, column);
    s.set_value(displaced, 3, 3);
    s.set_value(0, row, column);
    return s;
}

static std::set<std::pair<int, int>> collect_empty_positions(const std::vector<State>& moves) {
    std::set<std::pair<int, int>> result;
    for (const auto &mv : moves) {
        result.insert({mv.get_empty_row(), mv.get_empty_column()});
    }
    return result;
}

TEST(AvailableMoves, SingleEmptyCorner) {
    State s(4);

    auto moves = s.get_available_moves();
    ASSERT_EQ(moves.size(), 2u);
    std::set<std::pair<int, int>> expected = {{2, 3}, {3, 2}};
    EXPECT_EQ(collect_empty_positions(moves), expected);
}

TEST(AvailableMoves, SingleEmptyEdge) {
    State s = make_state_with_empty_at(4);
    ASSERT_TRUE(s.is_consistent());

    // neighbours: up(0,0), down(2,0), right(1,1)
    auto moves = s.get_available_moves();
    ASSERT_EQ(moves.size(), 3u);
    std::set<std::pair<int, int>> expected = {{0, 0}, {2, 0}, {1, 1}};
    EXPECT_EQ(collect_empty_positions(moves), expected);
}

TEST(AvailableMoves, SingleEmptyMiddle) {
    State s = make_state_with_empty_at(5);
    ASSERT_TRUE(s.is_consistent());

    // neighbours: up(0,1), down(2,1), left(1,0), right(1,2)
    auto moves = s.get_available_moves();
    ASSERT_EQ(moves.size(), 4u);
    std::set<std::pair<int, int>> expected = {{0, 1}, {2, 1}, {1, 0}, {1, 2}};
    EXPECT_EQ(collect_empty_positions(moves), expected);
}

TEST(AvailableMoves, OrderIsUpDownLeftRight) {
    State s = make_state_with_empty_at(5);

    auto moves = s.get_available_moves();
    ASSERT_EQ(moves.size(), 4u);
    EXPECT_EQ(moves[0], s.moved_up());
    EXPECT_EQ(moves[1], s.moved_down());
    EXPECT_EQ(moves[2], s.moved_left());
    EXPECT_EQ(moves[3], s.moved_right());

    std::vector<Direction> expected = {Direction::up, Direction::down, Direction::left, Direction::right};
    EXPECT_EQ(s.get_available_directions(), expected);
}

TEST(AvailableMoves, CountMatchesEmptyPosition) {
    for (int side = 1; side <= 5; ++side) {
        for (int row = 0; row < side; ++row) {
            for (int column = 0; column < side; ++column) {
                State s(side);
                int displaced = s.get_value(row, column);
                s.set_value(displaced, side - 1, side - 1);
                s.set_value(0, row, column);

                bool row_border = row == 0 || row == side - 1;
                bool column_border = column == 0 || column == side - 1;
                size_t expected = 3;
                if (side == 1) expected = 0;
                else if (row_border && column_border) expected = 2;
                else if (!row_border && !column_border) expected = 4;

                auto moves = s.get_available_moves();
                EXPECT_EQ(moves.size(), expected) << "side " << side << " at " << row << "," << column;
                for (const auto &mv : moves) {
                    EXPECT_EQ(mv.get_move_count(), s.get_move_count() + 1);
                    EXPECT_TRUE(mv.is_consistent());
                }
            }
        }
    }
}

TEST(AvailableMoves, OneByOneHasNoMoves) {
    State s(1);
    EXPECT_TRUE(s.get_available_moves().empty());
    EXPECT_TRUE(s.get_available_directions().empty());
    EXPECT_THROW(s.move_up(), IllegalMove);
    EXPECT_THROW(s.moved_right(), IllegalMove);
}

TEST(Moves, OppositeMoveRestoresConfiguration) {
    State s = make_state_with_empty_at(5);
    for (Direction direction : all_directions) {
        ASSERT_TRUE(s.can_move(direction));
        State there = s.moved(direction);
        EXPECT_NE(there, s);
        State back = there.moved(opposite(direction));
        EXPECT_EQ(back, s) << to_string(direction);
        EXPECT_EQ(back.get_move_count(), s.get_move_count() + 2);
    }
}

TEST(Moves, OppositeInPlaceMoveRestoresConfiguration) {
    const State start = make_state_with_empty_at(5);
    for (Direction direction : all_directions) {
        State s = start;
        s.move(direction);
        EXPECT_NE(s, start);
        s.move(opposite(direction));
        EXPECT_EQ(s, start) << to_string(direction);
        EXPECT_EQ(s.get_empty_row(), start.get_empty_row());
        EXPECT_EQ(s.get_empty_column(), start.get_empty_column());
        EXPECT_EQ(s.get_move_count(), start.get_move_count() + 2);
    }
}

TEST(Moves, MoveCountAtMaximum) {
    State s = State::from_line("2147483647 1 2 3 0");
    std::string before = s.to_line();

    EXPECT_TRUE(s.can_move(Direction::left));
    EXPECT_THROW(s.move_left(), IllegalMove);
    EXPECT_THROW(s.moved_up(), IllegalMove);
    EXPECT_EQ(s.to_line(), before);
    EXPECT_EQ(s.get_empty_row(), 1);
    EXPECT_EQ(s.get_empty_column(), 1);

    s.set_move_count(2147483646);
    s.move_left();
    EXPECT_EQ(s.to_line(), "2147483647 1 2 0 3");
}

TEST(Moves, InPlaceMoveSwapsWithEmptyCell) {
    State s(3);
    s.move_up();
    EXPECT_EQ(s.get_empty_row(), 1);
    EXPECT_EQ(s.get_empty_column(), 2);
    EXPECT_EQ(s.get_value(2, 2), 6);
    EXPECT_EQ(s.get_value(1, 2), 0);
    EXPECT_EQ(s.get_move_count(), 1);

    s.move_left();
    s.move_down();
    s.move_right();
    EXPECT_EQ(s.to_line(), "4 1 2 3 4 8 5 7 6 0");
    EXPECT_TRUE(s.is_consistent());
}

TEST(Moves, CopyMoveLeavesReceiverUntouched) {
    State s(3);
    State next = s.moved_left();
    EXPECT_TRUE(s.is_solution());
    EXPECT_EQ(s.get_move_count(), 0);
    EXPECT_EQ(s.get_empty_column(), 2);
    EXPECT_EQ(next.get_empty_column(), 1);
    EXPECT_EQ(next.get_move_count(), 1);
}

TEST(Moves, IllegalMoveIsStrictNoOp) {
    State s = State::from_line("7 0 1 2 3 4 5 6 7 8");
    ASSERT_EQ(s.get_empty_row(), 0);
    std::string before = s.to_line();

    EXPECT_THROW(s.move_up(), IllegalMove);
    EXPECT_THROW(s.move_left(), IllegalMove);
    EXPECT_THROW(s.move(Direction::up), std::logic_error);
    EXPECT_EQ(s.to_line(), before);
    EXPECT_EQ(s.get_empty_row(), 0);
    EXPECT_EQ(s.get_empty_column(), 0);
    EXPECT_EQ(s.get_move_count(), 7);
}

TEST(Moves, BorderChecksPerDirection) {
    State bottom_right(3);
    EXPECT_THROW(bottom_right.moved_down(), IllegalMove);
    EXPECT_THROW(bottom_right.moved_right(), IllegalMove);
    EXPECT_NO_THROW(bottom_right.moved_up());
    EXPECT_NO_THROW(bottom_right.moved_left());
}

TEST(Moves, TwoByTwoScenario) {
    State s = State::from_line("0 1 2 3 0");
    EXPECT_EQ(s.get_empty_row(), 1);
    EXPECT_EQ(s.get_empty_column(), 1);
    EXPECT_TRUE(s.is_solution());

    State left = s.moved_left();
    EXPECT_EQ(left.to_line(), "1 1 2 0 3");
    EXPECT_FALSE(left.is_solution());

    State right = left.moved_right();
    EXPECT_EQ(right.to_line(), "2 1 2 3 0");
    EXPECT_EQ(right, s);
    EXPECT_TRUE(right.is_solution());
}
