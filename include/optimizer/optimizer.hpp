#pragma once
#include "../parameter.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

/**
 * @brief Mutable hyperparameters of one parameter group.
 *
 * This is the only place per-group optimizer settings live. Wrappers that
 * rescale the learning rate or rewrite the momentum coefficient go through
 * Optimizer::hyperparameters() / Optimizer::set_hyperparameters().
 */
struct Hyperparameters {
    float learning_rate = 1e-3f;
    float momentum = 0.0f;        ///< First-moment coefficient (SGD momentum, Adam beta1)
    float beta2 = 0.999f;         ///< Second-moment coefficient (Adam only)
    float epsilon = 1e-8f;
    float weight_decay = 0.0f;
    size_t step = 0;              ///< Number of updates applied to this group

    template <class Archive>
    void serialize(Archive& archive) {
        archive(learning_rate, momentum, beta2, epsilon, weight_decay, step);
    }
};

/**
 * @brief A set of parameters sharing one set of hyperparameters.
 */
struct ParamGroup {
    std::vector<Parameter*> params;
    Hyperparameters hyper;
};

/**
 * @brief Per-parameter optimizer buffers.
 */
struct ParamState {
    Matrix exp_avg;       ///< Momentum buffer (SGD) or first moment (Adam)
    Matrix exp_avg_sq;    ///< Second moment (Adam), empty for SGD

    template <class Archive>
    void serialize(Archive& archive) {
        archive(exp_avg, exp_avg_sq);
    }
};

/**
 * @brief Serializable snapshot of an optimizer.
 *
 * Per-parameter state is keyed by the flat index of the parameter in group
 * order. `namespaces` holds opaque blobs owned by optimizer wrappers, kept
 * apart from the per-parameter state.
 */
struct OptimizerStateDict {
    std::vector<Hyperparameters> groups;
    std::map<size_t, ParamState> state;
    std::map<std::string, std::string> namespaces;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(groups, state, namespaces);
    }
};

/**
 * @brief Base class for first-order optimizers over parameter groups.
 */
class Optimizer {
  public:
    explicit Optimizer(const Hyperparameters& defaults) : defaults_(defaults) {}
    virtual ~Optimizer() = default;

    /**
     * @brief Adds a parameter group using the optimizer defaults.
     */
    void add_param_group(const std::vector<Parameter*>& params);

    /**
     * @brief Adds a parameter group with its own hyperparameters.
     * @throws std::invalid_argument if a parameter already belongs to a group
     */
    void add_param_group(const ParamGroup& group);

    size_t num_param_groups() const {
        return groups_.size();
    }
    const std::vector<ParamGroup>& param_groups() const {
        return groups_;
    }

    /**
     * @brief Hyperparameters of a group.
     * @throws std::out_of_range for an unknown group index
     */
    const Hyperparameters& hyperparameters(size_t group) const;

    /**
     * @brief Replaces the hyperparameters of a group.
     * @throws std::out_of_range for an unknown group index
     */
    void set_hyperparameters(size_t group, const Hyperparameters& hyper);

    /**
     * @brief Applies one update to every parameter that has a gradient.
     */
    virtual void step() = 0;

    void zero_grad();

    /**
     * @brief Optimizer buffers of a parameter, nullptr before its first update.
     */
    const ParamState* state_for(const Parameter* param) const;

    /**
     * @brief Element-wise gradient preconditioner of a parameter.
     *
     * Empty for optimizers without second-moment estimates and for
     * parameters that have not been updated yet.
     */
    virtual Matrix preconditioner(size_t group, const Parameter* param) const {
        (void)group;
        (void)param;
        return Matrix();
    }

    /**
     * @brief Stores an opaque blob under a reserved namespace.
     */
    void set_namespace_state(const std::string& name, std::string blob) {
        namespaces_[name] = std::move(blob);
    }
    const std::map<std::string, std::string>& namespace_states() const {
        return namespaces_;
    }

    OptimizerStateDict state_dict() const;

    /**
     * @brief Restores hyperparameters, buffers and namespaces.
     * @throws std::invalid_argument if the group layout does not match
     */
    void load_state_dict(const OptimizerStateDict& dict);

  protected:
    ParamState& state(const Parameter* param) {
        return state_[param];
    }

    std::vector<ParamGroup> groups_;

  private:
    Hyperparameters defaults_;
    std::unordered_map<const Parameter*, ParamState> state_;
    std::map<std::string, std::string> namespaces_;

    std::vector<const Parameter*> flat_params() const;
};
