#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"

using namespace std;

static int parse_int_token(const string& token) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = stoi(token, &consumed);
    } catch (const invalid_argument&) {
        throw MalformedEncoding("Token is not an integer: '" + token + "'");
    } catch (const out_of_range&) {
        throw MalformedEncoding("Integer token out of range: '" + token + "'");
    }
    if (consumed != token.size()) {
        throw MalformedEncoding("Token is not an integer: '" + token + "'");
    }
    return value;
}

// Returns the integer square root of n, or -1 if n is not a perfect square.
static int exact_square_root(int n) {
    int root = static_cast<int>(lround(sqrt(static_cast<double>(n))));
    while (root > 0 && root * root > n) --root;
    while ((root + 1) * (root + 1) <= n) ++root;
    return root * root == n ? root : -1;
}

State State::from_line(const string& line, StorageKind storage) {
    istringstream iss(line);
    vector<string> tokens;
    string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    if (tokens.empty()) {
        throw MalformedEncoding("Line is empty");
    }

    int level = parse_int_token(tokens[0]);
    int num_cells = static_cast<int>(tokens.size()) - 1;
    int side_length = exact_square_root(num_cells);
    if (side_length <= 0) {
        throw MalformedEncoding("Line doesn't match a square puzzle: " + std::to_string(num_cells) +
                                " cell values");
    }

    vector<int> values(num_cells);
    vector<bool> added(num_cells, false);
    for (int i = 1; i <= num_cells; ++i) {
        int value = parse_int_token(tokens[i]);
        if (value < 0 || value >= num_cells) {
            throw MalformedEncoding("Line contains an illegal value: " + std::to_string(value));
        }
        if (added[value]) {
            throw MalformedEncoding("Line contains a duplicate value: " + std::to_string(value));
        }
        added[value] = true;
        values[i - 1] = value;
    }

    return State(side_length, storage, values, level);
}

string State::to_line() const {
    ostringstream oss;
    oss << move_count;
    int num_cells = side_length * side_length;
    for (int i = 0; i < num_cells; ++i) {
        oss << ' ' << cells.get(i);
    }
    return oss.str();
}
