#include "../include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>

std::unique_ptr<Logger> Logger::instance = nullptr;

Logger::Logger() : logging_enabled(false), debug_enabled(false), echo_to_console(false) {}

Logger::~Logger() {
    if (logging_enabled) {
        stopLogging();
    }
}

Logger& Logger::getInstance() {
    static std::once_flag once;
    std::call_once(once, [] { instance = std::unique_ptr<Logger>(new Logger()); });
    return *instance;
}

void Logger::startLogging(const std::string& file_path) {
    if (logging_enabled) {
        stopLogging();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_path = file_path;

    // Create directories if they don't exist
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    log_file.open(file_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }

    logging_enabled = true;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    log_file << "=== Logging started at " << std::ctime(&time) << "===" << std::endl;
}

void Logger::stopLogging() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logging_enabled) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    log_file << "\n=== Logging stopped at " << std::ctime(&time) << "===" << std::endl;

    if (log_file.is_open()) {
        log_file.close();
    }

    logging_enabled = false;
}

void Logger::log(const std::string& message, bool is_error) {
    write(is_error ? "ERROR: " : "INFO: ", message, is_error);
}

void Logger::debug(const std::string& message) {
    if (!debug_enabled) {
        return;
    }
    write("DEBUG: ", message, false);
}

void Logger::write(const char* level, const std::string& message, bool is_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (echo_to_console) {
        (is_error ? std::cerr : std::cout) << level << message << std::endl;
    }
    if (!logging_enabled) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::string timestamp(std::ctime(&time));
    timestamp = timestamp.substr(0, timestamp.length() - 1); // Remove trailing newline

    log_file << "[" << timestamp << "] " << level << message << std::endl;
}
