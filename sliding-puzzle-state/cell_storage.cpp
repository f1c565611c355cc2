#include <string>
#include <variant>

#include "cell_storage.hpp"
#include "state_errors.hpp"

using namespace std;

int checked_num_cells(int side_length) {
    if (side_length <= 0 || side_length > max_side_length) {
        throw InvalidArgument("Side length must be in range [1," + to_string(max_side_length) +
                              "], got " + to_string(side_length));
    }
    return side_length * side_length;
}

StorageKind resolve_storage_kind(StorageKind kind, int side_length) {
    switch (kind) {
        case StorageKind::automatic:
            return side_length <= max_packed_side_length ? StorageKind::packed : StorageKind::dense;
        case StorageKind::packed:
            if (side_length > max_packed_side_length) {
                throw InvalidArgument("Packed storage supports side length up to " +
                                      to_string(max_packed_side_length) + ", got " +
                                      to_string(side_length));
            }
            return StorageKind::packed;
        case StorageKind::dense:
            return StorageKind::dense;
    }
    throw InvalidArgument("Unknown storage kind");
}

static variant<DenseCells, PackedCells> make_cells(StorageKind kind, int num_cells) {
    if (kind == StorageKind::packed) {
        return PackedCells();
    }
    return DenseCells(num_cells);
}

CellStorage::CellStorage(int side_length, StorageKind kind)
    : num_cells(checked_num_cells(side_length)),
      cells(make_cells(resolve_storage_kind(kind, side_length), num_cells)) {
}

int CellStorage::get(int index) const {
    return visit([index](const auto& c) { return c.get(index); }, cells);
}

void CellStorage::set(int index, int value) {
    visit([index, value](auto& c) { c.set(index, value); }, cells);
}

void CellStorage::swap(int first, int second) {
    visit([first, second](auto& c) {
        int buf = c.get(first);
        c.set(first, c.get(second));
        c.set(second, buf);
    }, cells);
}

StorageKind CellStorage::kind() const {
    return holds_alternative<PackedCells>(cells) ? StorageKind::packed : StorageKind::dense;
}
