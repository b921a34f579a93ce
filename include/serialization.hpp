#pragma once
#include "optimizer/optimizer.hpp"
#include <string>
#include <nlohmann/json.hpp>

/**
 * @file serialization.hpp
 * @brief Checkpoint files for optimizer state and the AdaScale statistics.
 *
 * A checkpoint file starts with one line of JSON metadata followed by the
 * optimizer state dictionary in cereal's binary format. The metadata holds:
 * - Format version
 * - Number of parameter groups and of per-parameter state entries
 * - Names of the reserved namespaces (e.g. "adascale")
 * - Any caller-provided fields
 */

/// Version written into the metadata line
constexpr int CHECKPOINT_FORMAT_VERSION = 1;

/**
 * @brief Writes an optimizer state dictionary to a checkpoint file.
 *
 * @param path File to (over)write, its directory is created if needed
 * @param state State dictionary, typically AdaScale::state_dict()
 * @param extra Additional metadata fields stored next to the generated ones
 * @throws std::runtime_error if file operations fail
 */
void save_checkpoint(const std::string& path, const OptimizerStateDict& state,
                     const nlohmann::json& extra = nlohmann::json::object());

/**
 * @brief Reads the metadata line of a checkpoint file.
 * @throws std::runtime_error if the file cannot be read or is not a checkpoint
 */
nlohmann::json read_checkpoint_metadata(const std::string& path);

/**
 * @brief Loads an optimizer state dictionary from a checkpoint file.
 * @throws std::runtime_error if file operations fail or the version is unsupported
 */
OptimizerStateDict load_checkpoint(const std::string& path);
