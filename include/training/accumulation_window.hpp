#pragma once
#include <cstddef>
#include <optional>
#include <vector>

/**
 * @brief Per-group local squared gradient norms of one optimizer update.
 *
 * The window opens with the first recorded gradient and spans as many
 * backward passes as gradients are accumulated. It is open exactly while a
 * local squared-norm vector exists.
 */
class AccumulationWindow {
  public:
    /**
     * @brief Adds a squared norm to a group, opening the window if needed.
     *
     * @param group Parameter group index
     * @param sq_norm Squared L2 norm of one gradient
     * @param num_groups Number of parameter groups, sizes a freshly opened window
     * @throws std::out_of_range if the group index is outside the window
     */
    void record_gradient(size_t group, double sq_norm, size_t num_groups);

    bool is_open() const {
        return local_grad_sqr_.has_value();
    }

    /**
     * @brief Marks the end of a backward pass.
     *
     * @param grads_to_accumulate Number of backward passes per update
     * @return The accumulated vector when this pass completes the window (the
     *         window is then closed), std::nullopt otherwise
     * @throws std::logic_error if the window is closed or more passes were
     *         seen than can be accumulated
     */
    std::optional<std::vector<double>> try_finalize(size_t grads_to_accumulate);

    /**
     * @brief Drops any partial window and clears the counters.
     */
    void reset();

    size_t backward_calls() const {
        return num_backward_calls_;
    }

    /**
     * @brief The vector accumulated so far.
     * @throws std::logic_error if the window is closed
     */
    const std::vector<double>& local_grad_sqr() const;

  private:
    std::optional<std::vector<double>> local_grad_sqr_;
    size_t num_backward_calls_ = 0;
    size_t last_final_backward_call_ = 0;
};
