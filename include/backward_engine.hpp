#ifndef BACKWARD_ENGINE_HPP
#define BACKWARD_ENGINE_HPP

#include "parameter.hpp"
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <utility>
#include <vector>

/**
 * @brief Delivers the gradients of a backward pass to their parameters.
 *
 * For every parameter that produced a gradient in a pass, the registered
 * hooks of that parameter run (in registration order) with the fresh,
 * not yet accumulated gradient; the gradient is then accumulated into
 * Parameter::grad. After all gradients are delivered, the completion queue
 * is drained in FIFO order. A callback may queue further callbacks; they
 * run after everything that was already queued, within the same pass.
 */
class BackwardEngine {
  public:
    using GradHook = std::function<void(const Matrix& grad)>;
    using Callback = std::function<void()>;
    using HookHandle = size_t;

    /**
     * @brief Registers a hook fired once per pass with the parameter's gradient.
     * @return Handle used to remove the hook
     */
    HookHandle register_hook(Parameter* param, GradHook hook);

    /**
     * @brief Removes a hook; unknown handles are ignored.
     */
    void remove_hook(HookHandle handle);

    size_t num_hooks() const {
        return hooks_.size();
    }

    /**
     * @brief Queues a callback to run at the end of the current pass.
     * @throws std::logic_error when called outside a backward pass
     */
    void queue_callback(Callback callback);

    bool in_backward() const {
        return in_backward_;
    }

    /**
     * @brief Runs one backward pass.
     *
     * @param gradients Pairs of (parameter, gradient of this pass). Parameters
     *        that produced no gradient are simply absent.
     * @throws std::invalid_argument if a gradient's shape does not match its parameter
     */
    void backward(const std::vector<std::pair<Parameter*, Matrix>>& gradients);

  private:
    struct HookEntry {
        Parameter* param;
        GradHook hook;
    };

    std::map<HookHandle, HookEntry> hooks_;
    std::deque<Callback> callbacks_;
    HookHandle next_handle_ = 0;
    bool in_backward_ = false;

    void drain_callbacks();
};

#endif // BACKWARD_ENGINE_HPP
