#pragma once
#include <cstddef>
#include <vector>

/**
 * @brief Result of one variance/squared-norm estimation.
 *
 * When `valid` is false the vectors hold the previous smoothed group-0
 * values broadcast to every group, for telemetry only.
 */
struct VarianceEstimate {
    std::vector<double> grad_var;
    std::vector<double> grad_sqr;
    bool valid = false;
};

/**
 * @brief Unbiased estimates of the gradient covariance trace and the squared
 * norm of the true gradient.
 *
 * With cN gradient samples per update and scale S, given the sum of the
 * per-sample squared norms (local) and the squared norm of their mean
 * (total):
 *
 *   S > 1:  var = local * (S / cN) / (cN - 1) - total * S / (cN - 1)
 *           sqr = total - var / S
 *   S == 1: var = local / (cN - 1) - total * cN / (cN - 1)
 *           sqr = total - var / cN
 *
 * sqr is clamped at zero, var is not. The estimate is invalid when the
 * sample is an outlier, any var is not positive, or any input or output is
 * NaN or infinite.
 */
class VarianceEstimator {
  public:
    /// Real iterations before the outlier check becomes active
    static constexpr size_t MIN_STEPS = 50;
    /// Largest accepted growth of the group-0 local sample between updates
    static constexpr double SAFE_UPDATE_RATIO = 10.0;

    /**
     * @brief Compares the group-0 local sample with the previous one.
     *
     * The sample becomes the new reference whether or not it is an outlier.
     *
     * @param local_grad_sqr Globally reduced local squared norms
     * @param real_iterations Updates completed so far
     * @return true if the sample grew by more than SAFE_UPDATE_RATIO
     */
    bool check_outlier(const std::vector<double>& local_grad_sqr, size_t real_iterations);

    /**
     * @brief Forgets the previous sample.
     */
    void reset() {
        previous_local_grad_sqr_.clear();
    }

    const std::vector<double>& previous_sample() const {
        return previous_local_grad_sqr_;
    }

    /**
     * @brief Computes the estimates of one update.
     *
     * @param local_grad_sqr Sum over all samples of the per-sample squared norms, per group
     * @param total_grad_sqr Squared norm of the synchronized gradient, per group
     * @param scale Scale S, at least 1
     * @param num_grad_samples Number of samples cN, greater than 1
     * @param outlier Result of check_outlier for this sample
     * @param fallback_var Smoothed group-0 variance used when the estimate is invalid
     * @param fallback_sqr Smoothed group-0 squared norm used when the estimate is invalid
     * @throws std::logic_error for a scale below 1, cN <= 1 or mismatched vector sizes
     */
    static VarianceEstimate estimate(const std::vector<double>& local_grad_sqr,
                                     const std::vector<double>& total_grad_sqr, size_t scale,
                                     size_t num_grad_samples, bool outlier, double fallback_var,
                                     double fallback_sqr);

  private:
    std::vector<double> previous_local_grad_sqr_;
};
