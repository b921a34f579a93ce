#pragma once
#include "../backward_engine.hpp"
#include "../config.hpp"
#include "../distributed/reducer.hpp"
#include "../optimizer/optimizer.hpp"
#include "accumulation_window.hpp"
#include "dynamic_loss_scaler.hpp"
#include "gain_engine.hpp"
#include "run_state.hpp"
#include "summary_writer.hpp"
#include "variance_estimator.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief AdaScale wrapper around an optimizer for large-batch and distributed training.
 *
 * AdaScale estimates the squared norm of the true gradient and the trace of
 * its covariance from the gradients of every backward pass, and scales the
 * learning rate of each parameter group by the resulting gain ratio so that
 * one large-batch step makes the progress of several scale-one steps. It
 * also predicts the gradient noise scale and keeps a scale-invariant step
 * counter for schedulers and logs.
 *
 * Every update goes through the following cycle:
 * - gradient hooks record per-group squared norms of the local gradients
 *   (the accumulation window opens with the first one)
 * - once per backward pass a finalize callback is queued on the backward
 *   engine behind everything already queued, including the gradient
 *   synchronization of a data-parallel wrapper
 * - the last pass of an accumulation window sums the local norms over all
 *   workers, estimates variance and squared norm, and updates the moving
 *   averages unless the sample is invalid
 * - step() applies the gain around the wrapped optimizer's step
 *
 * The controller state is checkpointed inside the optimizer state
 * dictionary under the "adascale" namespace.
 *
 * Reference: https://proceedings.icml.cc/static/paper_files/icml/2020/4682-Supplemental.pdf
 */
class AdaScale {
  public:
    static constexpr const char* STATE_NAMESPACE = "adascale";

    /**
     * @brief Wraps an optimizer and registers the gradient hooks.
     *
     * @param optimizer Wrapped optimizer, its parameter groups are tracked
     * @param engine Backward engine delivering gradients and running callbacks
     * @param config Run configuration
     * @param process_group Workers to reduce over, nullptr for a single worker
     * @param scaler Mixed precision loss scaler, optional
     * @param summary_writer Telemetry sink, optional
     * @throws std::invalid_argument for an invalid configuration
     * @throws std::logic_error for an update interval above 1
     */
    AdaScale(Optimizer& optimizer, BackwardEngine& engine, const AutoScalerConfig& config,
             ProcessGroup* process_group = nullptr, LossScaler* scaler = nullptr,
             SummaryWriter* summary_writer = nullptr);
    ~AdaScale();

    AdaScale(const AdaScale&) = delete;
    AdaScale& operator=(const AdaScale&) = delete;

    /**
     * @brief Registers a gradient hook on every parameter of every group.
     * @throws std::logic_error if hooks are already registered
     */
    void hook();

    /**
     * @brief Removes all gradient hooks.
     */
    void unhook();

    /**
     * @brief Runs one optimizer step with gain-scaled learning rates.
     *
     * Gradients are clipped first when a max grad norm is configured (after
     * unscaling them through the loss scaler, if any). The original learning
     * rates are restored afterwards, also when the step throws.
     *
     * @return Whether the optimizer step was applied (the loss scaler may skip it)
     * @throws std::logic_error while an accumulation window is open
     */
    bool step();

    /**
     * @brief Clears the gradients of the wrapped optimizer.
     * @throws std::logic_error while an accumulation window is open
     */
    void zero_grad();

    /**
     * @brief Adds a parameter group to the optimizer and to the statistics.
     *
     * The new group starts with a squared-norm average of 1 and a variance
     * average of 0; existing entries are kept.
     *
     * @throws std::logic_error while an accumulation window is open
     */
    void add_param_group(const ParamGroup& group);

    /**
     * @brief Optimizer state with the AdaScale state in its reserved namespace.
     * @throws std::logic_error while an accumulation window is open
     */
    OptimizerStateDict state_dict() const;

    /**
     * @brief Restores a state produced by state_dict().
     *
     * When the saved scale differs from the current one the variance average
     * is multiplied by saved/current. With reset_optimizer_state_on_restart
     * and a changed scale, the saved averages and the optimizer buffers are
     * discarded while the step counter is kept.
     *
     * @throws std::logic_error while an accumulation window is open
     * @throws std::invalid_argument if the state has no AdaScale namespace or
     *         a different number of parameter groups
     */
    void load_state_dict(const OptimizerStateDict& dict);

    /**
     * @brief Current gain ratio, 1 while the latest sample is invalid.
     *
     * @param group Parameter group, or all groups summed
     * @param alpha Exponent of the scale in adaptive mode
     */
    double gain(std::optional<size_t> group = std::nullopt, double alpha = 0.5);

    /**
     * @brief Predicted gradient noise scale, updates the GNS average.
     *
     * With adjust_momentum in adaptive mode the first-moment coefficient of
     * every group is rewritten for the predicted scale.
     */
    double gns(std::optional<size_t> group = std::nullopt);

    /**
     * @brief Advances the scale-invariant counter by one update.
     *
     * Only valid updates count: with an invalid sample the counter, the
     * recorded scale and the real iteration count stay as they are and the
     * schedulers move by one step.
     *
     * @return Number of whole scale-invariant steps to advance schedulers by
     * @throws std::logic_error while an accumulation window is open
     */
    long get_step_increment();

    /**
     * @brief Changing the scale of a running controller is not supported.
     * @throws std::logic_error always
     */
    void set_scale(double scale);

    void set_current_batch_size(size_t batch_size) {
        current_batch_size_ = batch_size;
    }
    size_t current_batch_size() const {
        return current_batch_size_;
    }

    /**
     * @brief Learning rate to batch size ratio relative to the first step.
     */
    double temperature() const {
        return temperature_;
    }

    /**
     * @brief Writes the AdaScale series to the summary writer.
     *
     * Series are keyed by the scale-invariant step, the debug series by
     * `real_iteration`. Does nothing without a summary writer.
     *
     * @param phase Appended to the "Train" prefix when not negative
     */
    void log_summary(size_t real_iteration, int phase = -1);

    /**
     * @brief Appends the cluster state and the averaged GNS to a history file.
     *
     * Each line reads
     * batch_size,world_size,accum_supported,scale_one_batch_size,accum,averaged_gns,timestamp
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void record_cluster_state(const std::string& path);

    /**
     * @brief Appends to <log_dir>/<training_label>/GNS/gns_history.txt.
     */
    void record_cluster_state();

    const std::vector<ParamGroup>& param_groups() const {
        return optimizer_.param_groups();
    }
    size_t scale() const {
        return scale_;
    }
    double smoothing() const {
        return smoothing_;
    }
    size_t world_size() const {
        return world_size_;
    }
    size_t rank() const {
        return reducer_.rank();
    }
    size_t num_gradients_to_accumulate() const {
        return num_grads_to_accum_;
    }
    size_t num_grad_samples() const {
        return num_grad_samples_;
    }
    size_t real_iterations() const {
        return real_iterations_;
    }
    bool gain_invalid() const {
        return gain_invalid_;
    }
    bool is_window_open() const {
        return window_.is_open();
    }
    size_t num_hooks() const {
        return hook_handles_.size();
    }

    const RunState& run_state() const {
        return run_state_;
    }
    double scale_invariant_steps() const {
        return run_state_.scale_invariant_steps;
    }
    double grad_sqr_avg(std::optional<size_t> group = std::nullopt) const {
        return run_state_.grad_sqr_avg(group);
    }
    double grad_var_avg(std::optional<size_t> group = std::nullopt) const {
        return run_state_.grad_var_avg(group);
    }

    /// Unsmoothed estimates of the last completed window
    const VarianceEstimate& last_estimate() const {
        return last_estimate_;
    }
    /// Squared norms of the synchronized gradient of the last completed window
    const std::vector<double>& last_total_grad_sqr() const {
        return last_total_grad_sqr_;
    }

    double averaged_gns() const {
        return averaged_gns_;
    }
    float effective_lr() const {
        return effective_lr_;
    }
    float clip_norm() const {
        return clip_norm_;
    }
    float adjusted_beta1() const {
        return adjusted_beta1_;
    }

  private:
    Optimizer& optimizer_;
    BackwardEngine& engine_;
    LossScaler* scaler_;
    SummaryWriter* summary_writer_;
    DistributedReducer reducer_;
    AutoScalerConfig config_;

    size_t world_size_;
    size_t num_grads_to_accum_;
    size_t num_grad_samples_;
    size_t scale_;
    double smoothing_;
    size_t current_batch_size_;

    GainEngine gain_engine_;
    VarianceEstimator estimator_;
    AccumulationWindow window_;
    RunState run_state_;

    std::vector<BackwardEngine::HookHandle> hook_handles_;
    bool final_callback_queued_ = false;
    double loss_scale_squared_ = 1.0;

    bool gain_invalid_ = true;
    size_t real_iterations_ = 0;
    VarianceEstimate last_estimate_;
    std::vector<double> last_total_grad_sqr_;

    // Telemetry
    double last_gain_ = 1.0;
    double last_var_ = 0.0;
    double last_sqr_ = 0.0;
    double last_gns_ = 0.0;
    double averaged_gns_ = 0.0;
    float effective_lr_ = 0.0f;
    float clip_norm_ = 0.0f;
    float scale_one_beta1_ = 0.0f;
    float adjusted_beta1_ = 0.0f;
    std::optional<double> temperature_ratio_;
    double temperature_ = 1.0;

    void backward_hook(size_t group, const Parameter* param, const Matrix& grad);
    void final_callback();
    double norm_squared(size_t group, const Parameter* param, const Matrix& grad) const;
    std::vector<double> total_grad_sqr() const;
    std::vector<Parameter*> all_params() const;
    void require_idle(const std::string& action) const;
};
