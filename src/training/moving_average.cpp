#include "../../include/training/moving_average.hpp"
#include <stdexcept>
#include <utility>

void MovingAverageTracker::seed(const std::string& name, const std::vector<double>& initial) {
    Series series;
    series.biased.assign(initial.size(), 0.0);
    series.unbias.assign(initial.size(), 0.0);
    series.average = initial;
    series_[name] = std::move(series);
}

void MovingAverageTracker::update(const std::string& name, const std::vector<double>& values,
                                  double factor) {
    auto it = series_.find(name);
    if (it == series_.end()) {
        seed(name, std::vector<double>(values.size(), 0.0));
        it = series_.find(name);
    }
    Series& series = it->second;
    if (series.biased.size() != values.size()) {
        throw std::invalid_argument("Sample for moving average '" + name + "' has " +
                                    std::to_string(values.size()) + " entries, expected " +
                                    std::to_string(series.biased.size()));
    }

    for (size_t i = 0; i < values.size(); ++i) {
        series.biased[i] = factor * series.biased[i] + (1.0 - factor) * values[i];
        series.unbias[i] = factor * series.unbias[i] + (1.0 - factor);
        series.average[i] = series.biased[i] / series.unbias[i];
    }
}

const std::vector<double>& MovingAverageTracker::value(const std::string& name) const {
    return get(name).average;
}

const MovingAverageTracker::Series& MovingAverageTracker::get(const std::string& name) const {
    auto it = series_.find(name);
    if (it == series_.end()) {
        throw std::out_of_range("Unknown moving average: " + name);
    }
    return it->second;
}

MovingAverageTracker::Series& MovingAverageTracker::find(const std::string& name) {
    auto it = series_.find(name);
    if (it == series_.end()) {
        throw std::out_of_range("Unknown moving average: " + name);
    }
    return it->second;
}

void MovingAverageTracker::extend(const std::string& name, double seed_value) {
    Series& series = find(name);
    series.biased.push_back(0.0);
    series.unbias.push_back(0.0);
    series.average.push_back(seed_value);
}

void MovingAverageTracker::rescale(const std::string& name, double factor) {
    Series& series = find(name);
    for (auto& v : series.biased) {
        v *= factor;
    }
    for (auto& v : series.average) {
        v *= factor;
    }
}
