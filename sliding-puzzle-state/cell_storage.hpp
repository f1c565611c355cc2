#ifndef __CELL_STORAGE_HPP___
#define __CELL_STORAGE_HPP___

#include <cstdint>
#include <variant>
#include <vector>

/**
 * @file cell_storage.hpp
 * @brief Board cell storage used by `State`.
 *
 * Cells are addressed by their row-major index. Two layouts exist and one is
 * picked when the board is created; callers never see which one is active
 * except through `StorageKind`.
 */

/**
 * @brief Storage layout policy for a board.
 */
enum class StorageKind {
    automatic, ///< packed when the side length allows it, dense otherwise
    dense,     ///< one int per cell, any side length
    packed     ///< 4 bits per cell in a single 64-bit word, side length <= 4
};

/**
 * @brief Largest side length the packed layout can hold (16 cells of 4 bits).
 */
constexpr int max_packed_side_length = 4;

/**
 * @brief Largest side length whose cell count still fits in an int.
 */
constexpr int max_side_length = 46340;

/**
 * @brief Number of cells of a board, checked before multiplying.
 *
 * @throws InvalidArgument if side_length is not in [1, max_side_length].
 */
int checked_num_cells(int side_length);

/**
 * @brief Resolve `automatic` into the concrete layout for `side_length`.
 *
 * @throws InvalidArgument if `packed` is requested for a side length above
 *         `max_packed_side_length`.
 */
StorageKind resolve_storage_kind(StorageKind kind, int side_length);

class DenseCells {
public:
    explicit DenseCells(int num_cells) : cells(num_cells, 0) {}

    int get(int index) const { return cells[index]; }
    void set(int index, int value) { cells[index] = value; }

private:
    std::vector<int> cells;
};

class PackedCells {
public:
    PackedCells() = default;

    int get(int index) const {
        return static_cast<int>((bits >> (bits_per_cell * index)) & cell_mask);
    }

    void set(int index, int value) {
        const int shift = bits_per_cell * index;
        bits &= ~(cell_mask << shift);
        bits |= (static_cast<std::uint64_t>(value) & cell_mask) << shift;
    }

private:
    static constexpr int bits_per_cell = 4;
    static constexpr std::uint64_t cell_mask = 0xF;
    std::uint64_t bits = 0;
};

/**
 * @brief Fixed-size cell array backed by one of the layouts above.
 *
 * Index and value ranges are not checked here; `State` validates them.
 */
class CellStorage {
public:
    /**
     * @brief Create storage for `side_length * side_length` cells, all zero.
     *
     * @param side_length Board side length (must be positive).
     * @param kind Requested layout; `automatic` is resolved immediately.
     * @throws InvalidArgument if the layout cannot hold the board.
     */
    CellStorage(int side_length, StorageKind kind);

    int get(int index) const;
    void set(int index, int value);
    void swap(int first, int second);

    int size() const { return num_cells; }

    /**
     * @brief The concrete layout in use (never `automatic`).
     */
    StorageKind kind() const;

private:
    int num_cells;
    std::variant<DenseCells, PackedCells> cells;
};

#endif // __CELL_STORAGE_HPP___
