#pragma once
#include <fstream>
#include <mutex>
#include <string>

/**
 * @brief Sink for named scalar series.
 */
class SummaryWriter {
  public:
    virtual ~SummaryWriter() = default;

    /**
     * @brief Records one value of a series.
     *
     * @param tag Series name, e.g. "Train/gain"
     * @param value Scalar value
     * @param step Position on the x axis, the scale-invariant step for AdaScale series
     */
    virtual void add_scalar(const std::string& tag, double value, double step) = 0;

    virtual void flush() {}
};

/**
 * @brief Writes one JSON object per scalar to a file.
 *
 * Each line reads {"tag": ..., "value": ..., "step": ..., "wall_time": ...}.
 */
class JsonlSummaryWriter : public SummaryWriter {
  public:
    /**
     * @brief Opens (appends to) a summary file, creating its directory.
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit JsonlSummaryWriter(const std::string& path);

    void add_scalar(const std::string& tag, double value, double step) override;
    void flush() override;

    const std::string& path() const {
        return path_;
    }

  private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
};
