#include "../../include/training/run_state.hpp"
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <cereal/archives/binary.hpp>

namespace {
double pick(const std::vector<double>& values, std::optional<size_t> group) {
    if (group) {
        return values.at(*group);
    }
    return std::accumulate(values.begin(), values.end(), 0.0);
}
} // namespace

RunState RunState::initial(size_t num_groups, size_t scale) {
    RunState state;
    state.scale = scale;
    state.averages.seed(GRAD_SQR_AVG, std::vector<double>(num_groups, 1.0));
    state.averages.seed(GRAD_VAR_AVG, std::vector<double>(num_groups, 0.0));
    state.averages.seed(GNS_AVG, std::vector<double>(1, 0.0));
    return state;
}

double RunState::grad_sqr_avg(std::optional<size_t> group) const {
    return pick(averages.value(GRAD_SQR_AVG), group);
}

double RunState::grad_var_avg(std::optional<size_t> group) const {
    return pick(averages.value(GRAD_VAR_AVG), group);
}

double RunState::gns_avg() const {
    return averages.value(GNS_AVG).at(0);
}

void RunState::add_group() {
    averages.extend(GRAD_SQR_AVG, 1.0);
    averages.extend(GRAD_VAR_AVG, 0.0);
}

std::string RunState::to_blob() const {
    std::ostringstream os(std::ios::binary);
    {
        cereal::BinaryOutputArchive archive(os);
        archive(*this);
    }
    return os.str();
}

RunState RunState::from_blob(const std::string& blob) {
    RunState state;
    try {
        std::istringstream is(blob, std::ios::binary);
        cereal::BinaryInputArchive archive(is);
        archive(state);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to decode AdaScale state: " + std::string(e.what()));
    }
    return state;
}
