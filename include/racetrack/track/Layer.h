#pragma once

#include "racetrack/track/Cell.h"
#include "racetrack/track/Errors.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace racetrack::track {

// Row-major grid of per-cell values. Boolean layers use std::uint8_t so that
// at() can hand out references.
template <typename T>
class Layer {
public:
    Layer() = default;

    Layer(int rows, int cols, T value = T{})
        : rows_{rows},
          cols_{cols} {
        if (rows < 0 || cols < 0) {
            throw std::invalid_argument("Layer dimensions must be non-negative");
        }
        data_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), value);
    }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    Shape shape() const { return Shape{rows_, cols_}; }

    bool contains(int row, int col) const {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    T& at(int row, int col) { return data_[index(row, col)]; }
    const T& at(int row, int col) const { return data_[index(row, col)]; }
    T& at(Cell cell) { return at(cell.row, cell.col); }
    const T& at(Cell cell) const { return at(cell.row, cell.col); }

    void fill(T value) { std::fill(data_.begin(), data_.end(), value); }

    const std::vector<T>& data() const { return data_; }

    bool operator==(const Layer&) const = default;

private:
    std::size_t index(int row, int col) const {
        if (!contains(row, col)) {
            throw BoundsError("Layer::at coordinates out of range");
        }
        return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col);
    }

    int rows_{0};
    int cols_{0};
    std::vector<T> data_{};
};

} // namespace racetrack::track
