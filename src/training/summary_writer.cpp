#include "../../include/training/summary_writer.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

JsonlSummaryWriter::JsonlSummaryWriter(const std::string& path) : path_(path) {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open summary file: " + path);
    }
}

void JsonlSummaryWriter::add_scalar(const std::string& tag, double value, double step) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    nlohmann::json record{
        {"tag", tag},
        {"value", value},
        {"step", step},
        {"wall_time", std::chrono::duration<double>(now).count()}};

    std::lock_guard<std::mutex> lock(mutex_);
    file_ << record.dump() << '\n';
    if (!file_) {
        throw std::runtime_error("Failed to write summary file: " + path_);
    }
}

void JsonlSummaryWriter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}
