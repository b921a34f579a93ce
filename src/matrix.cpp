#include "../include/matrix.hpp"
#include <omp.h>
#include <sstream>

Matrix::Matrix() : rows_(0), cols_(0) {}

Matrix::Matrix(size_t rows, size_t cols, float init_val)
    : data_(rows * cols, init_val), rows_(rows), cols_(cols) {}

float& Matrix::at(size_t row, size_t col) {
    if (row >= rows_ || col >= cols_) {
        std::ostringstream oss;
        oss << "Matrix index (" << row << ", " << col << ") out of range for shape " << shape();
        throw std::out_of_range(oss.str());
    }
    return data_[row * cols_ + col];
}

const float& Matrix::at(size_t row, size_t col) const {
    if (row >= rows_ || col >= cols_) {
        std::ostringstream oss;
        oss << "Matrix index (" << row << ", " << col << ") out of range for shape " << shape();
        throw std::out_of_range(oss.str());
    }
    return data_[row * cols_ + col];
}

Matrix& Matrix::operator+=(const Matrix& other) {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw std::runtime_error("Matrix dimensions must match for addition");
    }
#pragma omp parallel for
    for (long i = 0; i < static_cast<long>(data_.size()); ++i) {
        data_[i] += other.data_[i];
    }
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& other) {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw std::runtime_error("Matrix dimensions must match for subtraction");
    }
#pragma omp parallel for
    for (long i = 0; i < static_cast<long>(data_.size()); ++i) {
        data_[i] -= other.data_[i];
    }
    return *this;
}

Matrix& Matrix::operator*=(float scalar) {
    for (auto& v : data_) {
        v *= scalar;
    }
    return *this;
}

Matrix& Matrix::operator/=(float scalar) {
    for (auto& v : data_) {
        v /= scalar;
    }
    return *this;
}

Matrix& Matrix::divide_elementwise(const Matrix& other) {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw std::runtime_error("Matrix dimensions must match for element-wise division");
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] /= other.data_[i];
    }
    return *this;
}

void Matrix::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

double Matrix::squared_norm() const {
    // Fixed blocks summed in index order, so the result does not depend on
    // the thread count or on which thread finishes first
    constexpr size_t block_size = 4096;
    const size_t num_blocks = (data_.size() + block_size - 1) / block_size;
    std::vector<double> partial(num_blocks, 0.0);

#pragma omp parallel for schedule(static)
    for (long b = 0; b < static_cast<long>(num_blocks); ++b) {
        const size_t begin = static_cast<size_t>(b) * block_size;
        const size_t end = std::min(begin + block_size, data_.size());
        double block_sum = 0.0;
        for (size_t i = begin; i < end; ++i) {
            double v = static_cast<double>(data_[i]);
            block_sum += v * v;
        }
        partial[b] = block_sum;
    }

    double sum = 0.0;
    for (double block_sum : partial) {
        sum += block_sum;
    }
    return sum;
}

bool Matrix::has_inf_or_nan() const {
    for (float v : data_) {
        if (!std::isfinite(v)) {
            return true;
        }
    }
    return false;
}

bool Matrix::has_nan() const {
    return std::any_of(data_.begin(), data_.end(), [](float v) { return std::isnan(v); });
}

Matrix operator+(const Matrix& a, const Matrix& b) {
    Matrix result = a;
    result += b;
    return result;
}

Matrix operator-(const Matrix& a, const Matrix& b) {
    Matrix result = a;
    result -= b;
    return result;
}

Matrix operator*(const Matrix& m, float scalar) {
    Matrix result = m;
    result *= scalar;
    return result;
}

Matrix operator*(float scalar, const Matrix& m) {
    return m * scalar;
}

Matrix operator/(const Matrix& m, float scalar) {
    Matrix result = m;
    result /= scalar;
    return result;
}
