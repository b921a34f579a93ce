#pragma once
#include "optimizer.hpp"

/**
 * @brief Implements the Adam optimizer with decoupled weight decay.
 *
 * The update combines the benefits of:
 * - Momentum for handling sparse gradients
 * - RMSprop for handling non-stationary objectives
 * - Bias correction for improved early iterations
 *
 * m_t = β₁m_{t-1} + (1-β₁)g_t
 * v_t = β₂v_{t-1} + (1-β₂)g_t²
 * θ_t = θ_{t-1} - α·(m̂_t/(√v̂_t + ε) + λθ_{t-1})
 *
 * Reference: https://arxiv.org/abs/1412.6980
 */
class Adam : public Optimizer {
  public:
    /**
     * @brief Constructs an Adam optimizer with specified hyperparameters.
     *
     * @param lr Learning rate (default: 0.001)
     * @param b1 Beta1 coefficient for momentum (default: 0.9)
     * @param b2 Beta2 coefficient for RMSprop (default: 0.999)
     * @param eps Epsilon for numerical stability (default: 1e-8)
     * @param weight_decay Decoupled weight decay (default: 0)
     */
    Adam(float lr = 0.001f, float b1 = 0.9f, float b2 = 0.999f, float eps = 1e-8f,
         float weight_decay = 0.0f);

    void step() override;

    /**
     * @brief Adam denominator √(v/(1-β₂ᵗ)) + ε for one parameter.
     *
     * Returns an empty matrix when the parameter has not been updated yet.
     *
     * @param group Index of the parameter group owning the parameter
     * @param param The parameter
     */
    Matrix preconditioner(size_t group, const Parameter* param) const override;
};
