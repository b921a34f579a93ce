#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <vector>
#include <cereal/types/vector.hpp>

/**
 * @brief A dense 2D float matrix used for parameters and their gradients.
 *
 * The Matrix class is the storage type shared by the optimizers, the
 * backward engine and the gradient statistics. Features include:
 * - Row-major contiguous storage
 * - Element-wise arithmetic used by optimizer updates
 * - Squared L2 norm and finiteness checks used by the gradient statistics
 * - Binary serialization through cereal
 */
class Matrix {
  private:
    std::vector<float> data_;        ///< Matrix data storage
    size_t rows_;                    ///< Number of rows
    size_t cols_;                    ///< Number of columns

  public:
    /**
     * @brief Default constructor, creates an empty 0x0 matrix.
     */
    Matrix();

    /**
     * @brief Constructs a matrix with specified dimensions.
     * @param rows Number of rows
     * @param cols Number of columns
     * @param init_val Initial value for all elements (default: 0.0f)
     */
    Matrix(size_t rows, size_t cols, float init_val = 0.0f);

    size_t rows() const {
        return rows_;
    }

    size_t cols() const {
        return cols_;
    }

    /**
     * @brief Gets the total number of elements.
     * @return Number of elements
     */
    size_t size() const {
        return data_.size();
    }

    /**
     * @brief Gets the matrix shape.
     * @return Tuple of (rows, cols)
     */
    std::tuple<size_t, size_t> shape() const {
        return std::make_tuple(rows_, cols_);
    }

    bool empty() const {
        return data_.empty();
    }

    const float* data() const {
        return data_.data();
    }
    float* data() {
        return data_.data();
    }

    /**
     * @brief Element access operator.
     * @param row Row index
     * @param col Column index
     * @return Reference to the element
     */
    float& operator()(size_t row, size_t col) {
        return data_[row * cols_ + col];
    }
    const float& operator()(size_t row, size_t col) const {
        return data_[row * cols_ + col];
    }

    /**
     * @brief Safe element access with bounds checking.
     * @throws std::out_of_range if indices are invalid
     */
    float& at(size_t row, size_t col);
    const float& at(size_t row, size_t col) const;

    Matrix& operator+=(const Matrix& other);
    Matrix& operator-=(const Matrix& other);
    Matrix& operator*=(float scalar);
    Matrix& operator/=(float scalar);

    /**
     * @brief Element-wise division by another matrix of the same shape.
     * @throws std::runtime_error if the shapes differ
     */
    Matrix& divide_elementwise(const Matrix& other);

    void fill(float value);

    /**
     * @brief Sum of squared elements, accumulated in double precision.
     *
     * @return Squared L2 norm of the matrix
     */
    double squared_norm() const;

    /**
     * @brief Checks whether any element is NaN or infinite.
     * @return true if at least one element is not finite
     */
    bool has_inf_or_nan() const;

    /**
     * @brief Checks whether any element is NaN.
     */
    bool has_nan() const;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(rows_, cols_, data_);
    }
};

// Non-member operators
Matrix operator+(const Matrix& a, const Matrix& b);
Matrix operator-(const Matrix& a, const Matrix& b);
Matrix operator*(const Matrix& m, float scalar);
Matrix operator*(float scalar, const Matrix& m);
Matrix operator/(const Matrix& m, float scalar);

inline std::ostream& operator<<(std::ostream& os, const std::tuple<size_t, size_t>& shape) {
    os << std::get<0>(shape) << "x" << std::get<1>(shape);
    return os;
}
