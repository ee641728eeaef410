#ifndef ZKSHA512_PLONK_COLUMN_HPP_
#define ZKSHA512_PLONK_COLUMN_HPP_

#include <cstddef>
#include <string>
#include <tuple>

namespace libzksha512 {

enum column_type {
    ADVICE_COLUMN = 0,
    FIXED_COLUMN = 1,
    INSTANCE_COLUMN = 2
};

/**
 * Handle to one column of the execution trace. Handles are only meaningful
 * for the constraint_system that allocated them.
 */
class column {
public:
    column_type type;
    size_t index;

    column() : type(ADVICE_COLUMN), index(0) {}
    column(column_type type, size_t index) : type(type), index(index) {}

    bool operator==(const column& other) const {
        return type == other.type && index == other.index;
    }
    bool operator!=(const column& other) const { return !(*this == other); }
    bool operator<(const column& other) const {
        return std::tie(type, index) < std::tie(other.type, other.index);
    }

    std::string to_string() const;
};

/** A boolean fixed column that switches a gate or lookup on at a row. */
class selector {
public:
    size_t index;

    selector() : index(0) {}
    explicit selector(size_t index) : index(index) {}

    bool operator==(const selector& other) const { return index == other.index; }
    bool operator<(const selector& other) const { return index < other.index; }
};

/** An absolute (column, row) position in the trace. */
class cell {
public:
    column col;
    size_t row;

    cell() : row(0) {}
    cell(const column& col, size_t row) : col(col), row(row) {}

    bool operator==(const cell& other) const {
        return col == other.col && row == other.row;
    }
    bool operator!=(const cell& other) const { return !(*this == other); }
    bool operator<(const cell& other) const {
        return std::tie(col, row) < std::tie(other.col, other.row);
    }

    std::string to_string() const;
};

} // libzksha512

#endif // ZKSHA512_PLONK_COLUMN_HPP_
