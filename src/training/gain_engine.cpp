#include "../../include/training/gain_engine.hpp"
#include "../../include/training/variance_estimator.hpp"
#include <algorithm>
#include <cmath>

double GainEngine::gain(const RunState& state, bool invalid, std::optional<size_t> group,
                        double alpha) const {
    if (invalid) {
        return 1.0;
    }
    const double var = state.grad_var_avg(group);
    const double sqr = state.grad_sqr_avg(group);
    double max_scale = static_cast<double>(settings_.scale);
    if (settings_.is_adaptive) {
        max_scale = std::pow(max_scale, alpha);
    }
    return (var + sqr) / (var / max_scale + sqr);
}

double GainEngine::scale_invariant_steps(const RunState& state, bool invalid) const {
    if (invalid) {
        return 1.0;
    }
    const double var = state.grad_var_avg();
    const double sqr = state.grad_sqr_avg();
    const double S = static_cast<double>(settings_.scale);
    double steps_gain = (var + sqr) / (var / S + sqr);
    if (settings_.aggressive_schedule) {
        steps_gain = std::cbrt(S * S * steps_gain);
    }
    return steps_gain;
}

long GainEngine::scale_invariant_step_increment(RunState& state, bool invalid) const {
    if (invalid) {
        return 1;
    }
    const double prev_steps = std::floor(state.scale_invariant_steps);
    state.scale_invariant_steps += scale_invariant_steps(state, false);
    state.scale = settings_.scale;
    return static_cast<long>(std::floor(state.scale_invariant_steps - prev_steps));
}

double GainEngine::gns(RunState& state, bool invalid, size_t real_iterations,
                       std::optional<size_t> group, double* raw_gns) const {
    const double scale_one_batch_size = static_cast<double>(settings_.scale_one_batch_size);
    if (real_iterations < VarianceEstimator::MIN_STEPS) {
        // Let the averages settle before predicting
        state.averages.update(RunState::GNS_AVG, {scale_one_batch_size}, GNS_SMOOTHING);
        if (raw_gns) {
            *raw_gns = scale_one_batch_size;
        }
        return scale_one_batch_size;
    }
    if (invalid) {
        const double averaged = std::floor(state.gns_avg());
        if (raw_gns) {
            *raw_gns = averaged;
        }
        return averaged;
    }

    const double var = state.grad_var_avg(group);
    const double sqr = state.grad_sqr_avg(group);
    const double prediction = std::min(scale_one_batch_size * var / sqr,
                                       static_cast<double>(settings_.batch_size_upper_limit));
    if (raw_gns) {
        *raw_gns = prediction;
    }
    state.averages.update(RunState::GNS_AVG, {prediction}, GNS_SMOOTHING);
    return std::floor(state.gns_avg());
}

double GainEngine::predicted_scale(double averaged_gns) const {
    return std::ceil(averaged_gns / static_cast<double>(settings_.scale_one_batch_size)) - 1.0;
}

float GainEngine::adjust_momentum(Optimizer& optimizer, float scale_one_beta1, double scale) {
    const float adjusted = 1.0f - (1.0f - scale_one_beta1) / static_cast<float>(scale);
    for (size_t i = 0; i < optimizer.num_param_groups(); ++i) {
        Hyperparameters hyper = optimizer.hyperparameters(i);
        hyper.momentum = adjusted;
        optimizer.set_hyperparameters(i, hyper);
    }
    return adjusted;
}
