#pragma once
#include "optimizer.hpp"

/**
 * @brief Stochastic gradient descent with optional heavy-ball momentum.
 *
 * v_t = μ·v_{t-1} + g_t + λ·θ
 * θ_t = θ_{t-1} - α·v_t
 */
class SGD : public Optimizer {
  public:
    SGD(float lr = 0.001f, float momentum = 0.9f, float weight_decay = 0.0f)
        : Optimizer(make_defaults(lr, momentum, weight_decay)) {}

    void step() override;

  private:
    static Hyperparameters make_defaults(float lr, float momentum, float weight_decay) {
        Hyperparameters hyper;
        hyper.learning_rate = lr;
        hyper.momentum = momentum;
        hyper.weight_decay = weight_decay;
        return hyper;
    }
};
