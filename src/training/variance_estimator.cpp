#include "../../include/training/variance_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
bool all_finite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}
} // namespace

bool VarianceEstimator::check_outlier(const std::vector<double>& local_grad_sqr,
                                      size_t real_iterations) {
    if (local_grad_sqr.empty()) {
        return false;
    }
    if (previous_local_grad_sqr_.empty()) {
        previous_local_grad_sqr_ = local_grad_sqr;
    }

    bool outlier = false;
    const double previous = previous_local_grad_sqr_[0];
    if (real_iterations > MIN_STEPS && previous > 0.0 &&
        local_grad_sqr[0] / previous > SAFE_UPDATE_RATIO) {
        outlier = true;
    }
    previous_local_grad_sqr_ = local_grad_sqr;
    return outlier;
}

VarianceEstimate VarianceEstimator::estimate(const std::vector<double>& local_grad_sqr,
                                             const std::vector<double>& total_grad_sqr,
                                             size_t scale, size_t num_grad_samples, bool outlier,
                                             double fallback_var, double fallback_sqr) {
    if (scale < 1) {
        throw std::logic_error("Scale must be at least 1");
    }
    if (num_grad_samples <= 1) {
        throw std::logic_error("Variance estimation needs more than one gradient sample");
    }
    if (local_grad_sqr.size() != total_grad_sqr.size()) {
        throw std::logic_error("Local and total squared norms cover different parameter groups");
    }

    const size_t num_groups = local_grad_sqr.size();
    VarianceEstimate result;

    if (!all_finite(local_grad_sqr) || !all_finite(total_grad_sqr)) {
        result.grad_var.assign(num_groups, fallback_var);
        result.grad_sqr.assign(num_groups, fallback_sqr);
        result.valid = false;
        return result;
    }

    const double S = static_cast<double>(scale);
    const double cN = static_cast<double>(num_grad_samples);
    result.grad_var.resize(num_groups);
    result.grad_sqr.resize(num_groups);
    for (size_t i = 0; i < num_groups; ++i) {
        double var;
        double sqr;
        if (scale > 1) {
            var = local_grad_sqr[i] * (S / cN) / (cN - 1.0) - total_grad_sqr[i] * S / (cN - 1.0);
            sqr = total_grad_sqr[i] - var / S;
        } else {
            var = local_grad_sqr[i] / (cN - 1.0) - total_grad_sqr[i] * cN / (cN - 1.0);
            sqr = total_grad_sqr[i] - var / cN;
        }
        // NaN survives the clamp and is caught below
        result.grad_var[i] = var;
        result.grad_sqr[i] = std::max(sqr, 0.0);
    }

    bool valid = !outlier && all_finite(result.grad_var) && all_finite(result.grad_sqr);
    for (size_t i = 0; valid && i < num_groups; ++i) {
        if (result.grad_var[i] <= 0.0 || result.grad_sqr[i] < 0.0) {
            valid = false;
        }
    }

    if (!valid) {
        result.grad_var.assign(num_groups, fallback_var);
        result.grad_sqr.assign(num_groups, fallback_sqr);
    }
    result.valid = valid;
    return result;
}
