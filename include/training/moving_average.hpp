#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

/**
 * @brief Bias-corrected exponential moving averages of named scalar vectors.
 *
 * Each named series keeps three vectors of equal length:
 *   biased  = f * biased + (1 - f) * value
 *   unbias  = f * unbias + (1 - f)
 *   average = biased / unbias
 *
 * The unbias accumulator removes the start-up transient towards zero, so
 * feeding a constant vector yields that vector as the average from the first
 * update on. A series may carry a seed average before its first update.
 */
class MovingAverageTracker {
  public:
    struct Series {
        std::vector<double> biased;
        std::vector<double> unbias;
        std::vector<double> average;

        template <class Archive>
        void serialize(Archive& archive) {
            archive(biased, unbias, average);
        }
    };

    /**
     * @brief Creates or overwrites a series with an initial average.
     *
     * The biased and unbias accumulators start at zero, so the seed only
     * stands until the first update.
     */
    void seed(const std::string& name, const std::vector<double>& initial);

    /**
     * @brief Folds one sample into a series.
     *
     * Creates the series on first use.
     *
     * @param name Series name
     * @param values Sample, one entry per element of the series
     * @param factor Smoothing factor f in [0, 1)
     * @throws std::invalid_argument if the sample length does not match the series
     */
    void update(const std::string& name, const std::vector<double>& values, double factor);

    /**
     * @brief Current bias-corrected average of a series.
     * @throws std::out_of_range for an unknown series
     */
    const std::vector<double>& value(const std::string& name) const;

    bool contains(const std::string& name) const {
        return series_.find(name) != series_.end();
    }

    /**
     * @brief Appends one element to a series.
     *
     * The accumulators grow by a zero entry and the average by `seed_value`;
     * existing entries are left untouched.
     */
    void extend(const std::string& name, double seed_value);

    /**
     * @brief Multiplies the biased accumulator and the average of a series.
     */
    void rescale(const std::string& name, double factor);

    const std::map<std::string, Series>& series() const {
        return series_;
    }
    const Series& get(const std::string& name) const;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(series_);
    }

  private:
    std::map<std::string, Series> series_;

    Series& find(const std::string& name);
};
