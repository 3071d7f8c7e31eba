#pragma once

#include "Types.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

namespace pillfall::core {

// Index bounded to [0, Count). Tag keeps row and column indices apart.
template <typename Tag, std::uint8_t Count>
class BoundedIndex {
public:
    constexpr BoundedIndex() noexcept = default;

    // Throws std::out_of_range carrying the rejected value
    explicit BoundedIndex(int value)
        : value_{checked(value)}
    {
    }

    // Returns std::nullopt if `value` is not a valid index
    static std::optional<BoundedIndex> tryFrom(int value) noexcept {
        if (value < 0 || value >= Count) {
            return std::nullopt;
        }
        BoundedIndex index;
        index.value_ = static_cast<std::uint8_t>(value);
        return index;
    }

    static constexpr BoundedIndex first() noexcept { return BoundedIndex{}; }
    static BoundedIndex last() noexcept { return BoundedIndex{Count - 1}; }

    int value() const noexcept { return value_; }

    // `count`th successor / predecessor, std::nullopt outside the field
    std::optional<BoundedIndex> forward(int count = 1) const noexcept {
        return tryFrom(value() + count);
    }
    std::optional<BoundedIndex> backward(int count = 1) const noexcept {
        return tryFrom(value() - count);
    }

    friend bool operator==(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ == b.value_; }
    friend bool operator!=(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ != b.value_; }
    friend bool operator<(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ < b.value_; }
    friend bool operator>(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ > b.value_; }
    friend bool operator<=(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ <= b.value_; }
    friend bool operator>=(BoundedIndex a, BoundedIndex b) noexcept { return a.value_ >= b.value_; }

private:
    std::uint8_t value_{0};

    static std::uint8_t checked(int value) {
        if (value < 0 || value >= Count) {
            throw std::out_of_range("index out of range: " + std::to_string(value));
        }
        return static_cast<std::uint8_t>(value);
    }
};

struct RowTag {};
struct ColumnTag {};

// 0 is the top row, FieldHeight - 1 the bottom row
using RowIndex = BoundedIndex<RowTag, FieldHeight>;
// 0 is the leftmost column, FieldWidth - 1 the rightmost one
using ColumnIndex = BoundedIndex<ColumnTag, FieldWidth>;

// Position structure representing a tile in a field
struct Position {
    RowIndex row{};
    ColumnIndex col{};
};

inline bool operator==(const Position& a, const Position& b) noexcept {
    return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const Position& a, const Position& b) noexcept {
    return !(a == b);
}
// Row-major order
inline bool operator<(const Position& a, const Position& b) noexcept {
    return std::make_tuple(a.row, a.col) < std::make_tuple(b.row, b.col);
}

// Neighbouring position, std::nullopt at the edge of the field
std::optional<Position> operator+(const Position& pos, Direction dir) noexcept;

// Inclusive range of indices. Empty if last < first.
template <typename Index>
class IndexRange {
public:
    class iterator {
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = Index;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = Index;

        iterator() = default;
        explicit iterator(int value) : value_{value} {}

        Index operator*() const { return Index{value_}; }

        iterator& operator++() { ++value_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++value_; return tmp; }
        iterator& operator--() { --value_; return *this; }
        iterator operator--(int) { iterator tmp = *this; --value_; return tmp; }

        friend bool operator==(iterator a, iterator b) { return a.value_ == b.value_; }
        friend bool operator!=(iterator a, iterator b) { return a.value_ != b.value_; }

    private:
        int value_{0};
    };

    using reverse_iterator = std::reverse_iterator<iterator>;

    IndexRange(Index first, Index last) noexcept
        : first_{first.value()}
        , end_{last.value() < first.value() ? first.value() : last.value() + 1}
    {
    }

    iterator begin() const { return iterator{first_}; }
    iterator end() const { return iterator{end_}; }
    reverse_iterator rbegin() const { return reverse_iterator{end()}; }
    reverse_iterator rend() const { return reverse_iterator{begin()}; }

    std::size_t size() const noexcept { return static_cast<std::size_t>(end_ - first_); }
    bool empty() const noexcept { return end_ == first_; }

    // Range adaptor iterating from last to first
    struct Reversed {
        reverse_iterator first;
        reverse_iterator last;
        reverse_iterator begin() const { return first; }
        reverse_iterator end() const { return last; }
    };
    Reversed reversed() const { return Reversed{rbegin(), rend()}; }

    friend bool operator==(const IndexRange& a, const IndexRange& b) noexcept {
        return a.first_ == b.first_ && a.end_ == b.end_;
    }
    friend bool operator<(const IndexRange& a, const IndexRange& b) noexcept {
        return std::make_tuple(a.first_, a.end_) < std::make_tuple(b.first_, b.end_);
    }

private:
    int first_;
    int end_; // one past the last index
};

using RowRange    = IndexRange<RowIndex>;
using ColumnRange = IndexRange<ColumnIndex>;

// All rows, top to bottom
RowRange allRows() noexcept;
// All columns, left to right
ColumnRange allColumns() noexcept;

// Positions of one row, left to right
std::array<Position, FieldWidth> completeRow(RowIndex row) noexcept;

} // namespace pillfall::core

namespace std {

template <typename Tag, std::uint8_t Count>
struct hash<pillfall::core::BoundedIndex<Tag, Count>> {
    std::size_t operator()(pillfall::core::BoundedIndex<Tag, Count> index) const noexcept {
        return std::hash<int>{}(index.value());
    }
};

template <>
struct hash<pillfall::core::Position> {
    std::size_t operator()(const pillfall::core::Position& pos) const noexcept {
        return std::hash<int>{}(pos.row.value() * pillfall::core::FieldWidth + pos.col.value());
    }
};

} // namespace std
