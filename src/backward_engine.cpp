#include "../include/backward_engine.hpp"
#include <stdexcept>

BackwardEngine::HookHandle BackwardEngine::register_hook(Parameter* param, GradHook hook) {
    if (param == nullptr) {
        throw std::invalid_argument("Cannot register a gradient hook on a null parameter");
    }
    HookHandle handle = next_handle_++;
    hooks_.emplace(handle, HookEntry{param, std::move(hook)});
    return handle;
}

void BackwardEngine::remove_hook(HookHandle handle) {
    hooks_.erase(handle);
}

void BackwardEngine::queue_callback(Callback callback) {
    if (!in_backward_) {
        throw std::logic_error("Callbacks can only be queued during a backward pass");
    }
    callbacks_.push_back(std::move(callback));
}

void BackwardEngine::backward(const std::vector<std::pair<Parameter*, Matrix>>& gradients) {
    for (const auto& entry : gradients) {
        if (entry.first->value.shape() != entry.second.shape()) {
            throw std::invalid_argument("Gradient shape does not match parameter " +
                                        entry.first->name);
        }
    }

    in_backward_ = true;
    try {
        for (const auto& entry : gradients) {
            Parameter* param = entry.first;
            const Matrix& grad = entry.second;

            // Hooks may register or remove hooks, iterate over a snapshot
            std::vector<GradHook> param_hooks;
            for (const auto& hook : hooks_) {
                if (hook.second.param == param) {
                    param_hooks.push_back(hook.second.hook);
                }
            }
            for (const auto& hook : param_hooks) {
                hook(grad);
            }

            if (param->has_grad) {
                param->grad += grad;
            } else {
                param->grad = grad;
                param->has_grad = true;
            }
        }
        drain_callbacks();
    } catch (...) {
        callbacks_.clear();
        in_backward_ = false;
        throw;
    }
    in_backward_ = false;
}

void BackwardEngine::drain_callbacks() {
    while (!callbacks_.empty()) {
        Callback callback = std::move(callbacks_.front());
        callbacks_.pop_front();
        callback();
    }
}
