#pragma once

#include "../optimizer/optimizer.hpp"

/**
 * @brief Mixed precision loss scaler consumed by the AdaScale controller.
 */
class LossScaler {
  public:
    virtual ~LossScaler() = default;

    /**
     * @brief Factor the loss, and therefore every gradient, is multiplied by.
     */
    virtual float get_scale() const = 0;

    /**
     * @brief Divides the gradients of the optimizer's parameters by the scale.
     */
    virtual void unscale(Optimizer& optimizer) = 0;

    /**
     * @brief Unscales if needed and steps the optimizer unless a gradient is not finite.
     * @return Whether the optimizer step was applied
     */
    virtual bool step(Optimizer& optimizer) = 0;

    /**
     * @brief Adjusts the scale after a step.
     */
    virtual void update() = 0;
};

/**
 * @brief Handles dynamic loss scaling for mixed precision training.
 *
 * This class implements dynamic loss scaling to prevent gradient underflow
 * in FP16 training while maintaining stability. It automatically adjusts
 * the scaling factor based on the presence of inf/nan values.
 */
class DynamicLossScaler : public LossScaler {
  public:
    DynamicLossScaler(float initial_scale = 65536.0f, float scale_factor = 2.0f,
                      size_t scale_window = 2000, float min_scale = 1.0f,
                      float max_scale = 65536.0f)
        : current_scale_(initial_scale), scale_factor_(scale_factor), scale_window_(scale_window),
          min_scale_(min_scale), max_scale_(max_scale), stable_steps_(0) {}

    /**
     * @brief Get the current loss scale.
     */
    float get_scale() const override {
        return current_scale_;
    }

    /**
     * @brief Unscales gradients once per step and records inf/nan values.
     */
    void unscale(Optimizer& optimizer) override;

    bool step(Optimizer& optimizer) override;

    /**
     * @brief Applies update_scale() with the inf/nan state of the last step.
     */
    void update() override;

    /**
     * @brief Update the loss scale based on gradient behavior.
     *
     * @param has_inf_or_nan Whether the current step had inf/nan values
     * @return bool Whether the current step should be kept
     */
    bool update_scale(bool has_inf_or_nan);

    bool found_inf() const {
        return found_inf_;
    }

  private:
    float current_scale_;
    float scale_factor_;
    size_t scale_window_;
    float min_scale_;
    float max_scale_;
    size_t stable_steps_;
    bool unscaled_ = false;
    bool found_inf_ = false;
};
