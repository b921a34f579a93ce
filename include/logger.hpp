#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Thread-safe logging system for the autoscaler.
 *
 * The Logger class implements a singleton pattern to provide centralized
 * logging functionality throughout the library. Features include:
 * - File output with timestamps
 * - Error level distinction
 * - Debug messages that can be switched on per run
 * - Safe use from several in-process ranks at once
 */
class Logger {
  private:
    std::ofstream log_file;      ///< Output file stream for logging
    std::atomic<bool> logging_enabled;   ///< Whether logging is currently active
    std::atomic<bool> debug_enabled;     ///< Whether debug messages are written
    std::atomic<bool> echo_to_console;   ///< Mirror messages to std::cout/std::cerr
    std::string log_file_path;   ///< Path to the current log file
    std::mutex mutex_;

    /// Singleton instance
    static std::unique_ptr<Logger> instance;

    /**
     * @brief Private constructor for singleton pattern.
     *
     * Initializes logging system in disabled state with
     * no file output.
     */
    Logger();

    void write(const char* level, const std::string& message, bool is_error);

  public:
    /**
     * @brief Gets the singleton logger instance.
     * @return Reference to the global logger
     */
    static Logger& getInstance();

    /**
     * @brief Starts logging to a file.
     *
     * Opens the specified file for logging. Creates directories if needed.
     *
     * @param file_path Path to log file (default: "autoscaler.log")
     * @throws std::runtime_error if file cannot be opened
     */
    void startLogging(const std::string& file_path = "autoscaler.log");

    /**
     * @brief Stops logging and closes the log file.
     */
    void stopLogging();

    /**
     * @brief Logs a message with optional error level.
     *
     * @param message Text to log
     * @param is_error Whether to mark as error (default: false)
     */
    void log(const std::string& message, bool is_error = false);

    /**
     * @brief Logs a message only when debug output is enabled.
     */
    void debug(const std::string& message);

    bool isLoggingEnabled() const {
        return logging_enabled;
    }

    void setDebug(bool enabled) {
        debug_enabled = enabled;
    }
    bool isDebugEnabled() const {
        return debug_enabled;
    }

    /**
     * @brief Mirrors messages to the console, also when no file is open.
     */
    void setConsoleEcho(bool enabled) {
        echo_to_console = enabled;
    }

    // Prevent copying and assignment for singleton
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();
};

#endif // LOGGER_HPP
