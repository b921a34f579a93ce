#include "../include/serialization.hpp"
#include "../include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <cereal/archives/binary.hpp>

namespace {
nlohmann::json read_metadata_line(std::istream& is, const std::string& path) {
    std::string line;
    if (!std::getline(is, line)) {
        throw std::runtime_error("Checkpoint file is empty: " + path);
    }
    nlohmann::json metadata;
    try {
        metadata = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid checkpoint metadata in " + path + ": " + e.what());
    }
    if (!metadata.contains("format_version")) {
        throw std::runtime_error("Checkpoint metadata in " + path + " has no format version");
    }
    return metadata;
}
} // namespace

void save_checkpoint(const std::string& path, const OptimizerStateDict& state,
                     const nlohmann::json& extra) {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) {
        throw std::runtime_error("Failed to open checkpoint file for writing: " + path);
    }

    nlohmann::json metadata = extra;
    metadata["format_version"] = CHECKPOINT_FORMAT_VERSION;
    metadata["num_param_groups"] = state.groups.size();
    metadata["num_param_states"] = state.state.size();
    nlohmann::json namespaces = nlohmann::json::array();
    for (const auto& entry : state.namespaces) {
        namespaces.push_back(entry.first);
    }
    metadata["namespaces"] = namespaces;
    os << metadata.dump() << '\n';

    {
        cereal::BinaryOutputArchive archive(os);
        archive(state);
    }
    if (!os) {
        throw std::runtime_error("Failed to write checkpoint file: " + path);
    }
    Logger::getInstance().log("Saved checkpoint to: " + path);
}

nlohmann::json read_checkpoint_metadata(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        throw std::runtime_error("Failed to open checkpoint file: " + path);
    }
    return read_metadata_line(is, path);
}

OptimizerStateDict load_checkpoint(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        throw std::runtime_error("Failed to open checkpoint file: " + path);
    }

    nlohmann::json metadata = read_metadata_line(is, path);
    const int version = metadata["format_version"].get<int>();
    if (version != CHECKPOINT_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported checkpoint format version " +
                                 std::to_string(version) + " in " + path);
    }

    OptimizerStateDict state;
    try {
        cereal::BinaryInputArchive archive(is);
        archive(state);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to read checkpoint " + path + ": " + e.what());
    }
    Logger::getInstance().log("Loaded checkpoint from: " + path);
    return state;
}
