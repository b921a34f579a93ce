#pragma once
#include "matrix.hpp"
#include <string>
#include <utility>

/**
 * @brief A trainable tensor together with its accumulated gradient.
 *
 * `grad` is only meaningful while `has_grad` is set; the backward engine
 * sets it the first time a backward pass produces a gradient for the
 * parameter and the optimizer clears it in zero_grad().
 */
struct Parameter {
    std::string name;
    Matrix value;
    Matrix grad;
    bool has_grad = false;

    Parameter() = default;
    Parameter(std::string name_, size_t rows, size_t cols, float init_val = 0.0f)
        : name(std::move(name_)), value(rows, cols, init_val), grad(rows, cols, 0.0f) {}

    void zero_grad() {
        grad.fill(0.0f);
        has_grad = false;
    }
};
