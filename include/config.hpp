#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief AdaScale gain settings.
 */
struct AdaScaleSettings {
    bool aggressive_schedule = false;
    float max_grad_norm = 0.0f;     ///< Global L2 clipping threshold, 0 disables clipping
};

/**
 * @brief Gradient noise scale prediction settings.
 */
struct GradientNoiseScaleSettings {
    size_t scale_one_batch_size = 0;    ///< Total batch size that defines scale 1 (required)
    size_t batch_size_upper_limit = 0;  ///< Upper clamp for GNS predictions (required)
};

/**
 * @brief Configuration of one autoscaler run.
 *
 * The configuration is immutable for a run. It is divided into three
 * groups that mirror the JSON file layout:
 * - "autoscaler": world size, accumulation and statistics options
 * - "adascale": gain and clipping options
 * - "gradient_noise_scale": reference batch size and prediction limits
 *
 * Derived quantities (number of gradient samples, scale, smoothing) are
 * computed by the AdaScale controller once the world size is known.
 */
struct AutoScalerConfig {
    // Cluster layout
    size_t world_size = 0;                      ///< 0 means: ask the process group
    size_t num_gradients_to_accumulate = 1;
    bool gradient_accumulation_supported = true;
    bool adjust_gradients_for_accumulation = true;
    size_t scale_one_world_size = 0;            ///< Samples (workers x accumulation) at scale 1 (required)

    // Statistics
    size_t update_interval = 1;
    bool precondition_gradients = false;
    std::optional<float> smoothing;             ///< Derived from the sample count when unset

    // Experimental behaviour on scale changes
    bool is_adaptive = false;
    bool adjust_momentum = false;
    bool reset_optimizer_state_on_restart = false;

    // Diagnostics
    bool enable_debug = false;
    bool collect_tensorboard = false;
    std::string log_dir = "logs";
    std::string training_label = "autoscaler";

    AdaScaleSettings adascale;
    GradientNoiseScaleSettings gradient_noise_scale;

    /**
     * @brief Loads configuration from a JSON file.
     *
     * Keys that are absent keep their defaults, except for the required
     * `autoscaler.scale_one_world_size`,
     * `gradient_noise_scale.scale_one_batch_size` and
     * `gradient_noise_scale.batch_size_upper_limit`.
     *
     * @param config_path Path to the JSON file
     * @throws std::runtime_error if the file cannot be read or a required key is missing
     */
    void load_from_json(const std::string& config_path);

    /**
     * @brief Checks the values that do not depend on the process group.
     * @throws std::invalid_argument on the first invalid value
     */
    void validate() const;

    /**
     * @brief Directory the GNS history and summaries are written to.
     */
    std::string logs_basedir() const {
        return log_dir + "/" + training_label;
    }
};

// JSON serialization declarations
void to_json(nlohmann::json& j, const AdaScaleSettings& s);
void from_json(const nlohmann::json& j, AdaScaleSettings& s);

void to_json(nlohmann::json& j, const GradientNoiseScaleSettings& s);
void from_json(const nlohmann::json& j, GradientNoiseScaleSettings& s);

void to_json(nlohmann::json& j, const AutoScalerConfig& c);
void from_json(const nlohmann::json& j, AutoScalerConfig& c);

#endif // CONFIG_HPP
