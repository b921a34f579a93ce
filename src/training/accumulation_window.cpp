#include "../../include/training/accumulation_window.hpp"
#include <stdexcept>
#include <utility>
#include <string>

void AccumulationWindow::record_gradient(size_t group, double sq_norm, size_t num_groups) {
    if (!local_grad_sqr_) {
        local_grad_sqr_ = std::vector<double>(num_groups, 0.0);
    }
    if (group >= local_grad_sqr_->size()) {
        throw std::out_of_range("Parameter group " + std::to_string(group) +
                                " is outside the accumulation window");
    }
    (*local_grad_sqr_)[group] += sq_norm;
}

std::optional<std::vector<double>> AccumulationWindow::try_finalize(size_t grads_to_accumulate) {
    if (!local_grad_sqr_) {
        throw std::logic_error("Backward pass finished without any recorded gradient");
    }
    if (grads_to_accumulate == 0) {
        throw std::logic_error("Number of gradients to accumulate must be positive");
    }

    num_backward_calls_++;
    const size_t pending = num_backward_calls_ - last_final_backward_call_;
    if (pending > grads_to_accumulate) {
        throw std::logic_error(std::to_string(num_backward_calls_) + " - " +
                               std::to_string(last_final_backward_call_) +
                               " backward calls exceed the accumulation of " +
                               std::to_string(grads_to_accumulate));
    }
    if (pending % grads_to_accumulate != 0) {
        return std::nullopt;
    }

    std::optional<std::vector<double>> result = std::move(local_grad_sqr_);
    local_grad_sqr_.reset();
    num_backward_calls_ = 0;
    last_final_backward_call_ = 0;
    return result;
}

void AccumulationWindow::reset() {
    local_grad_sqr_.reset();
    num_backward_calls_ = 0;
    last_final_backward_call_ = 0;
}

const std::vector<double>& AccumulationWindow::local_grad_sqr() const {
    if (!local_grad_sqr_) {
        throw std::logic_error("Accumulation window is closed");
    }
    return *local_grad_sqr_;
}
