#pragma once
#include <vector>
#include <cstddef>
#include <stdexcept>

namespace eventseq {

// Dense event x frame score table. Row i is event i, column j is frame j of
// the frame list the matrix was computed for.
class SimilarityMatrix {
public:
    SimilarityMatrix() = default;
    SimilarityMatrix(size_t rows, size_t cols, double fill = 0.0)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return data_.empty(); }

    double at(size_t row, size_t col) const {
        check(row, col);
        return data_[row * cols_ + col];
    }

    void set(size_t row, size_t col, double value) {
        check(row, col);
        data_[row * cols_ + col] = value;
    }

private:
    void check(size_t row, size_t col) const {
        if (row >= rows_ || col >= cols_)
            throw std::out_of_range("SimilarityMatrix index out of range");
    }

    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

} // namespace eventseq
