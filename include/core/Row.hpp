#pragma once

#include "Index.hpp"

#include <array>

namespace pillfall::core {

// A single row of a field, indexed by column
template <typename T>
class Row {
public:
    T& operator[](ColumnIndex col) { return cells_[static_cast<std::size_t>(col.value())]; }
    const T& operator[](ColumnIndex col) const { return cells_[static_cast<std::size_t>(col.value())]; }

private:
    std::array<T, FieldWidth> cells_{};
};

} // namespace pillfall::core
