#pragma once
#include "moving_average.hpp"
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Checkpointed state of the AdaScale controller.
 *
 * Holds the scale-invariant step counter, the scale the statistics were
 * collected at and the moving averages of the per-group squared norm
 * (seed 1), the per-group variance (seed 0) and the GNS.
 */
struct RunState {
    static constexpr const char* GRAD_SQR_AVG = "grad_sqr_avg";
    static constexpr const char* GRAD_VAR_AVG = "grad_var_avg";
    static constexpr const char* GNS_AVG = "gns_avg";

    double scale_invariant_steps = 0.0;
    size_t scale = 1;
    MovingAverageTracker averages;

    /**
     * @brief Fresh state for a number of parameter groups.
     */
    static RunState initial(size_t num_groups, size_t scale);

    /**
     * @brief Smoothed squared norm of one group, or the sum over all groups.
     */
    double grad_sqr_avg(std::optional<size_t> group = std::nullopt) const;

    /**
     * @brief Smoothed variance of one group, or the sum over all groups.
     */
    double grad_var_avg(std::optional<size_t> group = std::nullopt) const;

    double gns_avg() const;

    size_t num_groups() const {
        return averages.value(GRAD_SQR_AVG).size();
    }

    /**
     * @brief Adds a parameter group with neutral statistics.
     */
    void add_group();

    /**
     * @brief Serializes the state into an opaque blob (cereal binary).
     */
    std::string to_blob() const;

    /**
     * @brief Restores a state from a blob produced by to_blob().
     * @throws std::runtime_error if the blob cannot be decoded
     */
    static RunState from_blob(const std::string& blob);

    template <class Archive>
    void serialize(Archive& archive) {
        archive(scale_invariant_steps, scale, averages);
    }
};
