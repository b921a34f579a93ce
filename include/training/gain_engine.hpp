#pragma once
#include "../optimizer/optimizer.hpp"
#include "run_state.hpp"
#include <cstddef>
#include <optional>

/**
 * @brief Settings the gain computations depend on.
 */
struct GainSettings {
    size_t scale = 1;
    bool is_adaptive = false;
    bool aggressive_schedule = false;
    size_t scale_one_batch_size = 1;
    size_t batch_size_upper_limit = 1;
};

/**
 * @brief Turns the smoothed statistics into gain, GNS and step increments.
 *
 * All results fall back to neutral values while the latest sample is
 * invalid: the gain becomes 1, the scheduler moves by one step without
 * touching the counter and the GNS stays at its smoothed value.
 */
class GainEngine {
  public:
    /// Smoothing factor of the GNS moving average
    static constexpr double GNS_SMOOTHING = 0.9;

    explicit GainEngine(const GainSettings& settings) : settings_(settings) {}

    /**
     * @brief AdaScale gain ratio r = (var + sqr) / (var / S + sqr).
     *
     * In adaptive mode S is replaced by S^alpha.
     *
     * @param state Smoothed statistics
     * @param invalid Whether the latest sample was rejected
     * @param group Parameter group, or all groups summed
     * @param alpha Exponent applied to the scale in adaptive mode
     */
    double gain(const RunState& state, bool invalid, std::optional<size_t> group = std::nullopt,
                double alpha = 0.5) const;

    /**
     * @brief Scheduler progress of one update, in scale-one steps.
     *
     * With an aggressive schedule the gain g is replaced by (S^2 g)^(1/3).
     */
    double scale_invariant_steps(const RunState& state, bool invalid) const;

    /**
     * @brief Advances the scale-invariant counter by one update.
     *
     * Also stamps the state with the current scale. An invalid sample leaves
     * the state untouched and reports a single step.
     *
     * @return Number of whole scale-invariant steps crossed
     */
    long scale_invariant_step_increment(RunState& state, bool invalid) const;

    /**
     * @brief Gradient noise scale prediction B_simple = B_1 * var / sqr.
     *
     * During the first VarianceEstimator::MIN_STEPS real iterations the
     * scale-one batch size is fed into the GNS average and returned. With an
     * invalid sample the truncated smoothed value is returned. Otherwise the
     * prediction is clamped to the batch size upper limit, folded into the
     * average and the truncated average is returned.
     *
     * @param raw_gns Receives the unsmoothed prediction, if not null
     */
    double gns(RunState& state, bool invalid, size_t real_iterations,
               std::optional<size_t> group = std::nullopt, double* raw_gns = nullptr) const;

    /**
     * @brief Number of scale-one batches the averaged GNS asks for, minus one.
     */
    double predicted_scale(double averaged_gns) const;

    /**
     * @brief Rewrites the first-moment coefficient of every group for a scale.
     *
     * beta1 = 1 - (1 - beta1_scale_one) / scale
     *
     * @return The coefficient written
     */
    static float adjust_momentum(Optimizer& optimizer, float scale_one_beta1, double scale);

    const GainSettings& settings() const {
        return settings_;
    }

  private:
    GainSettings settings_;
};
