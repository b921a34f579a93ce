#include "../../include/optimizer/optimizer.hpp"
#include <initializer_list>
#include <stdexcept>
#include <string>

void Optimizer::add_param_group(const std::vector<Parameter*>& params) {
    add_param_group(ParamGroup{params, defaults_});
}

void Optimizer::add_param_group(const ParamGroup& group) {
    for (const auto* param : group.params) {
        if (param == nullptr) {
            throw std::invalid_argument("Parameter group contains a null parameter");
        }
        for (const auto& existing : groups_) {
            for (const auto* other : existing.params) {
                if (other == param) {
                    throw std::invalid_argument("Parameter " + param->name +
                                                " appears in more than one parameter group");
                }
            }
        }
    }
    groups_.push_back(group);
}

const Hyperparameters& Optimizer::hyperparameters(size_t group) const {
    if (group >= groups_.size()) {
        throw std::out_of_range("Parameter group index " + std::to_string(group) + " out of range");
    }
    return groups_[group].hyper;
}

void Optimizer::set_hyperparameters(size_t group, const Hyperparameters& hyper) {
    if (group >= groups_.size()) {
        throw std::out_of_range("Parameter group index " + std::to_string(group) + " out of range");
    }
    groups_[group].hyper = hyper;
}

void Optimizer::zero_grad() {
    for (auto& group : groups_) {
        for (auto* param : group.params) {
            param->zero_grad();
        }
    }
}

const ParamState* Optimizer::state_for(const Parameter* param) const {
    auto it = state_.find(param);
    return it == state_.end() ? nullptr : &it->second;
}

std::vector<const Parameter*> Optimizer::flat_params() const {
    std::vector<const Parameter*> params;
    for (const auto& group : groups_) {
        params.insert(params.end(), group.params.begin(), group.params.end());
    }
    return params;
}

OptimizerStateDict Optimizer::state_dict() const {
    OptimizerStateDict dict;
    for (const auto& group : groups_) {
        dict.groups.push_back(group.hyper);
    }
    auto params = flat_params();
    for (size_t i = 0; i < params.size(); ++i) {
        auto it = state_.find(params[i]);
        if (it != state_.end()) {
            dict.state.emplace(i, it->second);
        }
    }
    dict.namespaces = namespaces_;
    return dict;
}

void Optimizer::load_state_dict(const OptimizerStateDict& dict) {
    if (dict.groups.size() != groups_.size()) {
        throw std::invalid_argument("Loaded state dict has " + std::to_string(dict.groups.size()) +
                                    " parameter groups, optimizer has " +
                                    std::to_string(groups_.size()));
    }
    auto params = flat_params();
    for (const auto& entry : dict.state) {
        if (entry.first >= params.size()) {
            throw std::invalid_argument("Loaded state refers to parameter index " +
                                        std::to_string(entry.first) + " which does not exist");
        }
        const Parameter* param = params[entry.first];
        for (const Matrix* buffer : {&entry.second.exp_avg, &entry.second.exp_avg_sq}) {
            if (!buffer->empty() && buffer->shape() != param->value.shape()) {
                throw std::invalid_argument("Loaded state for parameter " + param->name +
                                            " does not match its shape");
            }
        }
    }

    for (size_t i = 0; i < groups_.size(); ++i) {
        groups_[i].hyper = dict.groups[i];
    }
    state_.clear();
    for (const auto& entry : dict.state) {
        state_[params[entry.first]] = entry.second;
    }
    namespaces_ = dict.namespaces;
}
