#pragma once
#include "../parameter.hpp"
#include <vector>

class GradientManager {
  public:
    /**
     * @brief Scales all gradients so that their global L2 norm is at most max_norm.
     *
     * Parameters without a gradient are ignored. The gradients are left
     * untouched when the norm is already within bounds.
     *
     * @return The global L2 norm before clipping
     */
    static float clip_grad_norm(const std::vector<Parameter*>& params, float max_norm);

    /**
     * @brief Global L2 norm of the gradients of a set of parameters.
     */
    static double total_norm(const std::vector<Parameter*>& params);

    static constexpr float CLIP_EPSILON = 1e-6f;
};
